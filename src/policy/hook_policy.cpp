#include "policy/hook_policy.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace hookguard::policy {

using core::errors::ErrorCategory;
using core::errors::HookError;
using nlohmann::ordered_json;

HookPolicy::HookPolicy(core::config::HookRules rules)
    : rules_(std::move(rules)) {}

bool HookPolicy::contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

core::errors::Result<std::string> HookPolicy::extract_command(
    const ordered_json& args) {
    if (!args.is_object()) {
        return HookError{ErrorCategory::Processing,
                         std::string("Tool arguments must be a JSON object, got ") +
                             args.type_name(),
                         "args_not_object"};
    }

    const auto command = args.find("command");
    if (command == args.end()) {
        return std::string();
    }
    if (!command->is_string()) {
        return HookError{ErrorCategory::Processing,
                         std::string("Argument 'command' must be a string, got ") +
                             command->type_name(),
                         "command_not_string"};
    }
    return command->get<std::string>();
}

core::errors::Result<protocol::HookResponse> HookPolicy::evaluate(
    const protocol::InvocationRequest& request) const {
    if (!request.tool.has_value() || request.tool.value() != rules_.target_tool) {
        LOG_DEBUG("Tool is not " + rules_.target_tool + ", passing through.");
        return protocol::pass_through();
    }

    auto extracted = extract_command(request.args);
    if (core::errors::is_error(extracted)) {
        return core::errors::get_error(extracted);
    }
    const std::string& command = core::errors::get_value(extracted);

    if (contains(command, rules_.blocked_substring)) {
        LOG_DEBUG("Blocked command: " + command);
        return protocol::block(rules_.block_reason);
    }

    if (contains(command, rules_.mutation_trigger)) {
        ordered_json mutated = request.args;
        mutated["command"] = command + rules_.mutation_suffix;
        LOG_DEBUG("Rewrote command: " + command);
        return protocol::mutate(std::move(mutated));
    }

    return protocol::pass_through();
}

}  // namespace hookguard::policy
