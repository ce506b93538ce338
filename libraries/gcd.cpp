#include <gcd-config.hpp>
#include <gcd.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <string>
#include <string_view>

namespace gcd
{
    namespace
    {
        constexpr std::string_view platform_name() noexcept
        {
            if constexpr (IS_LINUX)
            {
                return "linux";
            }
            else if constexpr (IS_WIN32)
            {
                return "win32";
            }
            else
            {
                return "unknown";
            }
        }

        constexpr std::string_view compiler_suffix() noexcept
        {
            if constexpr (IS_CLANG)
            {
                return ", clang";
            }
            else if constexpr (IS_GCC)
            {
                return ", gcc";
            }
            else
            {
                return "";
            }
        }
    } // namespace

    number reduce_gcd(std::vector<number> const &values) noexcept
    {
        if (values.empty())
        {
            return 0;
        }
        auto result = values.front();
        for (auto it = values.begin() + 1; it != values.end(); ++it)
        {
            auto const next = gcd(result, *it);
            spdlog::debug("gcd({}, {}) = {}", result, *it, next);
            result = next;
        }
        return result;
    }

    std::string_view version() noexcept
    {
        static std::string const text = fmt::format("{} ({}{})", GCD_VERSION, platform_name(), compiler_suffix());
        return text;
    }
} // namespace gcd
