#include <arguments.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <charconv>
#include <system_error>

namespace gcd
{
    namespace
    {
        bool is_one_of(std::string_view arg, std::string_view short_name, std::string_view long_name) noexcept
        {
            return arg == short_name || arg == long_name;
        }
    } // namespace

    number parse_number(std::string_view text)
    {
        // digits only: no sign, no whitespace
        if (text.empty() || !std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '9'; }))
        {
            throw usage_error{fmt::format("invalid number '{}'", text)};
        }
        number value = 0;
        auto const [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec == std::errc::result_out_of_range)
        {
            throw usage_error{fmt::format("number '{}' is too large", text)};
        }
        if (ec != std::errc{} || ptr != text.data() + text.size())
        {
            throw usage_error{fmt::format("invalid number '{}'", text)};
        }
        return value;
    }

    invocation parse_arguments(std::vector<std::string_view> const &args)
    {
        auto const has = [&args](std::string_view short_name, std::string_view long_name) {
            return std::any_of(args.begin(), args.end(), [&](std::string_view arg) {
                return is_one_of(arg, short_name, long_name);
            });
        };
        if (has("-h", "--help"))
        {
            return {command::help, {}};
        }
        if (has("-V", "--version"))
        {
            return {command::version, {}};
        }
        if (args.empty())
        {
            throw usage_error{"no numbers given"};
        }
        invocation result;
        result.numbers.reserve(args.size());
        for (auto const arg: args)
        {
            result.numbers.push_back(parse_number(arg));
        }
        return result;
    }
} // namespace gcd
