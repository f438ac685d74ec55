#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/hook_errors.hpp"
#include "protocol/hook_response.hpp"

namespace hookguard::protocol {

nlohmann::ordered_json to_json(const HookResponse& response);

// {"error": <message>}, destined for standard error.
nlohmann::ordered_json error_report(const core::errors::HookError& error);

// Renders a value on a single line with ", " between members and ": "
// after keys. Non-ASCII text is written as \u escapes. No trailing newline.
std::string dump_line(const nlohmann::ordered_json& value);

}  // namespace hookguard::protocol
