#pragma once

#include <string>
#include <utility>
#include <nlohmann/json.hpp>

namespace hookguard::protocol {

enum class ResponseKind {
    PassThrough,
    Block,
    Mutate
};

// The decision returned to the invoking caller. `reason` is only set for
// Block and `args` only for Mutate, where it is the full replacement.
struct HookResponse {
    ResponseKind kind = ResponseKind::PassThrough;
    std::string reason;
    nlohmann::ordered_json args;
};

inline HookResponse pass_through() {
    return HookResponse{};
}

inline HookResponse block(std::string reason) {
    HookResponse response;
    response.kind = ResponseKind::Block;
    response.reason = std::move(reason);
    return response;
}

inline HookResponse mutate(nlohmann::ordered_json args) {
    HookResponse response;
    response.kind = ResponseKind::Mutate;
    response.args = std::move(args);
    return response;
}

inline std::string to_string(const ResponseKind kind) {
    switch (kind) {
        case ResponseKind::PassThrough:
            return "pass_through";
        case ResponseKind::Block:
            return "block";
        case ResponseKind::Mutate:
            return "mutate";
        default:
            return "unknown";
    }
}

}  // namespace hookguard::protocol
