#pragma once
#include <cstddef>
#include <string>

namespace hookguard::core::config {

    // The fixed interception rules. Only invocations of target_tool are
    // inspected; the block rule is evaluated before the mutation rule.
    struct HookRules {
        std::string target_tool = "my_bash_tool";
        std::string blocked_substring = "rm -rf";
        std::string block_reason =
            "Execution of rm -rf is strictly prohibited by security python hook.";
        std::string mutation_trigger = "echo";
        std::string mutation_suffix = " (intercepted by Python hook!)";
    };

    // Deepest container nesting accepted in a hook payload. Deeper input is
    // rejected at parse time, before anything copies or renders it.
    constexpr std::size_t kMaxNestingDepth = 512;

} // namespace hookguard::core::config
