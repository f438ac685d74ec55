#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace hookguard::protocol {

    // A parsed tool invocation. Defaults are applied once by the parser:
    // a missing or non-text "tool" stays empty, a missing "args" becomes {}.
    struct InvocationRequest {
        std::optional<std::string> tool;
        nlohmann::ordered_json args = nlohmann::ordered_json::object();
    };

} // namespace hookguard::protocol
