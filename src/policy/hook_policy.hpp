#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/config/hook_rules.hpp"
#include "core/errors/hook_errors.hpp"
#include "protocol/hook_response.hpp"
#include "protocol/invocation_request.hpp"

namespace hookguard::policy {

class HookPolicy {
public:
    explicit HookPolicy(core::config::HookRules rules = {});

    // Block rule first, then mutation rule, otherwise pass-through.
    // Invocations of any tool other than the target pass through untouched.
    core::errors::Result<protocol::HookResponse> evaluate(
        const protocol::InvocationRequest& request) const;

    const core::config::HookRules& rules() const { return rules_; }

private:
    static core::errors::Result<std::string> extract_command(
        const nlohmann::ordered_json& args);
    static bool contains(const std::string& text, const std::string& needle);

    core::config::HookRules rules_;
};

}  // namespace hookguard::policy
