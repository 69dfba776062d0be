#include "cli.hpp"
#include "logger.hpp"

#include <boost/json.hpp>
#include <iostream>
#include <iterator>
#include <print>
#include <span>
#include <string>

namespace json = boost::json;

namespace
{

void emit(const json::object& env)
{
    std::println("{}", json::serialize(env));
}

} // namespace

int main(int argc, char** argv)
{
    if (auto result = Logger::init("warn", "", 100, true); !result)
    {
        std::println(stderr, "Failed to initialize logger: {}", result.error());
    }

    auto action = cli::parse_action(std::span<const char* const>(argv, static_cast<size_t>(argc)));
    if (!action)
    {
        emit(action.error());
        return 0;
    }

    std::string input{std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>()};
    if (std::cin.bad())
    {
        LOG_ERROR("Failed to read standard input");
        return 1;
    }

    Bridge bridge;
    emit(cli::run(bridge, *action, input));
    Logger::shutdown();
    return 0;
}
