#pragma once
#include <iosfwd>
#include <string>
#include "core/errors/hook_errors.hpp"
#include "policy/hook_policy.hpp"
#include "protocol/hook_response.hpp"

namespace hookguard::app {

    constexpr int kExitSuccess = 0;
    constexpr int kExitFailure = 1;

    // Parse and evaluate one non-empty payload. Writes nothing.
    core::errors::Result<protocol::HookResponse> decide(
        const std::string& payload, const policy::HookPolicy& hook_policy);

    // Reads `in` to completion, then writes either one response line to `out`
    // or one error report line to `err`. Returns the process exit status.
    int run_hook(std::istream& in, std::ostream& out, std::ostream& err,
                 const policy::HookPolicy& hook_policy = policy::HookPolicy{});

} // namespace hookguard::app
