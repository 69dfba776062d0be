#pragma once
#include "bridge/bridge.hpp"

#include <boost/json.hpp>
#include <expected>
#include <span>
#include <string_view>

namespace cli
{

enum class Action { Encode, Decode };

constexpr std::string_view usage = "Usage: cbor_bridge_cli <encode|decode>";

// Action named by args[1]; otherwise the failure envelope to print
std::expected<Action, boost::json::object> parse_action(std::span<const char* const> args);

std::string_view trim(std::string_view s);

boost::json::object decode(const Bridge& bridge, std::string_view input);
boost::json::object encode(const Bridge& bridge, std::string_view input);

boost::json::object run(const Bridge& bridge, Action action, std::string_view input);

} // namespace cli
