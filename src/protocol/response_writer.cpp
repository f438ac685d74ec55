#include "protocol/response_writer.hpp"

namespace hookguard::protocol {

using nlohmann::ordered_json;

namespace {

std::string dump_scalar(const ordered_json& value) {
    return value.dump(-1, ' ', true, ordered_json::error_handler_t::replace);
}

void append_value(const ordered_json& value, std::string& out) {
    if (value.is_object()) {
        out += '{';
        bool first = true;
        for (auto it = value.begin(); it != value.end(); ++it) {
            if (!first) {
                out += ", ";
            }
            first = false;
            out += dump_scalar(ordered_json(it.key()));
            out += ": ";
            append_value(it.value(), out);
        }
        out += '}';
        return;
    }

    if (value.is_array()) {
        out += '[';
        bool first = true;
        for (const auto& element : value) {
            if (!first) {
                out += ", ";
            }
            first = false;
            append_value(element, out);
        }
        out += ']';
        return;
    }

    out += dump_scalar(value);
}

}  // namespace

ordered_json to_json(const HookResponse& response) {
    ordered_json payload = ordered_json::object();
    switch (response.kind) {
        case ResponseKind::Block:
            payload["block"] = true;
            payload["reason"] = response.reason;
            break;
        case ResponseKind::Mutate:
            payload["args"] = response.args;
            break;
        case ResponseKind::PassThrough:
            break;
    }
    return payload;
}

ordered_json error_report(const core::errors::HookError& error) {
    ordered_json payload = ordered_json::object();
    payload["error"] = error.message;
    return payload;
}

std::string dump_line(const ordered_json& value) {
    std::string out;
    append_value(value, out);
    return out;
}

}  // namespace hookguard::protocol
