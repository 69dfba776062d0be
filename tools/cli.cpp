#include "cli.hpp"
#include "fundamentals/json_utils.hpp"

#include <format>

namespace json = boost::json;

namespace cli
{

std::expected<Action, json::object> parse_action(std::span<const char* const> args)
{
    if (args.size() < 2)
    {
        return std::unexpected(json_utils::error_msg(usage));
    }

    std::string_view action = args[1];
    if (action == "encode")
    {
        return Action::Encode;
    }
    if (action == "decode")
    {
        return Action::Decode;
    }
    return std::unexpected(json_utils::error_msg(std::format("Unknown action: {}", action)));
}

std::string_view trim(std::string_view s)
{
    constexpr std::string_view ws = " \t\r\n\f\v";
    auto first = s.find_first_not_of(ws);
    if (first == std::string_view::npos)
    {
        return {};
    }
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

json::object decode(const Bridge& bridge, std::string_view input)
{
    return bridge.decode_envelope(trim(input), "result");
}

json::object encode(const Bridge& bridge, std::string_view input)
{
    auto value = bridge.parse(input);
    if (!value)
    {
        return json_utils::error_msg(Bridge::describe(value.error(), Bridge::Direction::Encode));
    }
    return bridge.encode_envelope(*value, "result");
}

json::object run(const Bridge& bridge, Action action, std::string_view input)
{
    return action == Action::Decode ? decode(bridge, input) : encode(bridge, input);
}

} // namespace cli
