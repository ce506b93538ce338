#include <arguments.hpp>
#include <gcd.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <exception>
#include <string_view>
#include <vector>

namespace
{
    void setup_logging()
    {
        auto logger = spdlog::stderr_color_mt("gcd");
        spdlog::set_default_logger(logger);
        spdlog::set_level(spdlog::level::warn);
        spdlog::cfg::load_env_levels();
    }

    int run(gcd::invocation const &inv)
    {
        switch (inv.what)
        {
        case gcd::command::help:
            fmt::print("{}\n", gcd::usage);
            return 0;
        case gcd::command::version:
            fmt::print("gcd {}\n", gcd::version());
            return 0;
        case gcd::command::compute:
            break;
        }
        spdlog::debug("numbers: [{}]", fmt::join(inv.numbers, ", "));
        auto const result = gcd::reduce_gcd(inv.numbers);
        fmt::print("The greatest common divisor of [{}] is {}\n", fmt::join(inv.numbers, ", "), result);
        return 0;
    }
} // namespace

int main(int argc, char **argv)
{
    std::vector<std::string_view> args{argv + 1, argv + argc};
    try
    {
        setup_logging();
        return run(gcd::parse_arguments(args));
    }
    catch (gcd::usage_error const &err)
    {
        if (!args.empty())
        {
            fmt::print(stderr, "error: {}\n", err.what());
        }
        fmt::print(stderr, "{}\n", gcd::usage);
        return 1;
    }
    catch (std::exception const &err)
    {
        spdlog::critical("{}", err.what());
        return 2;
    }
}
