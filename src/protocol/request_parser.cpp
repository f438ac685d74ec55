#include "protocol/request_parser.hpp"

#include "core/logging/logger.hpp"

namespace hookguard::protocol {

    using namespace hookguard::core::errors;
    using nlohmann::ordered_json;

    Result<InvocationRequest> parse_request(const std::string& payload, std::size_t max_depth) {
        // 1. Syntax: the whole payload must be exactly one JSON value.
        // Containers past max_depth are dropped while parsing so the document
        // never holds them; the flag turns that into an error afterwards.
        bool too_deep = false;
        const ordered_json::parser_callback_t depth_guard =
            [&too_deep, max_depth](int depth, ordered_json::parse_event_t event, ordered_json&) {
                const bool opens = event == ordered_json::parse_event_t::object_start ||
                                   event == ordered_json::parse_event_t::array_start;
                if (opens && static_cast<std::size_t>(depth) >= max_depth) {
                    too_deep = true;
                    return false;
                }
                return true;
            };

        ordered_json document;
        try {
            document = ordered_json::parse(payload, depth_guard);
        } catch (const ordered_json::parse_error& e) {
            return HookError{ErrorCategory::Parse, e.what(), "malformed_json", "Hook input must be a single JSON object."};
        }

        if (too_deep) {
            return HookError{ErrorCategory::Parse,
                             "JSON nesting exceeds the maximum depth of " + std::to_string(max_depth),
                             "nesting_too_deep"};
        }

        // 2. Shape: only objects carry "tool" and "args"
        if (!document.is_object()) {
            return HookError{ErrorCategory::Input,
                             std::string("Hook payload must be a JSON object, got ") + document.type_name(),
                             "payload_not_object"};
        }

        // 3. Defaults are applied here and nowhere else
        InvocationRequest request;

        const auto tool = document.find("tool");
        if (tool != document.end()) {
            if (tool->is_string()) {
                request.tool = tool->get<std::string>();
            } else {
                LOG_DEBUG(std::string("Ignoring non-text tool field of type ") + tool->type_name());
            }
        }

        auto args = document.find("args");
        if (args != document.end()) {
            request.args = std::move(*args);
        }

        return request;
    }

} // namespace hookguard::protocol
