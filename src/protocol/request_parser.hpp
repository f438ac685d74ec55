#pragma once
#include <cstddef>
#include <string>
#include "core/config/hook_rules.hpp"
#include "core/errors/hook_errors.hpp"
#include "protocol/invocation_request.hpp"

namespace hookguard::protocol {
    // Parses the raw standard input text of one hook invocation. Objects and
    // arrays nested deeper than max_depth are rejected as "nesting_too_deep".
    core::errors::Result<InvocationRequest> parse_request(
        const std::string& payload,
        std::size_t max_depth = core::config::kMaxNestingDepth);
}
