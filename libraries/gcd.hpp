#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#ifdef _WIN32
#ifdef GCD_SHARED_EXPORT
#    define GCD_API __declspec(dllexport)
#elif defined(GCD_IMPORT)
#    define GCD_API __declspec(dllimport)
#else
#define GCD_API
#endif
#else
#define GCD_API
#endif

namespace gcd {
    using number = std::uint64_t;

    constexpr number gcd(number a, number b) noexcept
    {
        while (b != 0)
        {
            number const r = a % b;
            a = b;
            b = r;
        }
        return a;
    }

    // 0 for an empty sequence
    GCD_API number reduce_gcd(std::vector<number> const &values) noexcept;

    GCD_API std::string_view version() noexcept;
}// namespace gcd
