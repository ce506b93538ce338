#pragma once

#include <gcd.hpp>

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace gcd {
    class GCD_API usage_error : public std::invalid_argument
    {
    public:
        using std::invalid_argument::invalid_argument;
    };

    enum class command
    {
        compute,
        help,
        version,
    };

    struct invocation
    {
        command what = command::compute;
        std::vector<number> numbers;
    };

    inline constexpr std::string_view usage = "Usage: gcd NUMBER ...";

    /// Decimal digits only, must fit in 64 bits.
    GCD_API number parse_number(std::string_view text);

    GCD_API invocation parse_arguments(std::vector<std::string_view> const &args);
}// namespace gcd
