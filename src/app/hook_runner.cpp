#include "app/hook_runner.hpp"

#include <exception>
#include <istream>
#include <iterator>
#include <ostream>
#include "core/logging/logger.hpp"
#include "protocol/request_parser.hpp"
#include "protocol/response_writer.hpp"

namespace hookguard::app {

    using namespace hookguard::core::errors;

    namespace {

    Result<std::string> read_all(std::istream& in) {
        std::string text{std::istreambuf_iterator<char>(in),
                         std::istreambuf_iterator<char>()};
        if (in.bad()) {
            return HookError{ErrorCategory::Internal, "Failed to read hook input.", "input_read_failed"};
        }
        return text;
    }

    int report_failure(const HookError& error, std::ostream& err) {
        LOG_DEBUG("Hook failed [" + error.code + "] (" + to_string(error.category) + "): " + error.message);
        err << protocol::dump_line(protocol::error_report(error)) << '\n';
        err.flush();
        return kExitFailure;
    }

    } // namespace

    Result<protocol::HookResponse> decide(const std::string& payload,
                                          const policy::HookPolicy& hook_policy) {
        auto parsed = protocol::parse_request(payload);
        if (is_error(parsed)) {
            return get_error(parsed);
        }
        return hook_policy.evaluate(get_value(parsed));
    }

    int run_hook(std::istream& in, std::ostream& out, std::ostream& err,
                 const policy::HookPolicy& hook_policy) {
        try {
            // 1. The whole input is read before anything is decided
            auto input = read_all(in);
            if (is_error(input)) {
                return report_failure(get_error(input), err);
            }

            const auto& payload = get_value(input);
            if (payload.empty()) {
                LOG_DEBUG("Empty hook input, nothing to process.");
                return kExitSuccess;
            }

            // 2. Decide
            auto decision = decide(payload, hook_policy);
            if (is_error(decision)) {
                return report_failure(get_error(decision), err);
            }

            const auto& response = get_value(decision);
            LOG_DEBUG("Hook decision: " + protocol::to_string(response.kind));

            // 3. Render fully before touching stdout so a failure never leaves partial output
            const std::string line = protocol::dump_line(protocol::to_json(response));
            out << line << '\n';
            out.flush();
            if (!out) {
                return report_failure(HookError{ErrorCategory::Internal, "Failed to write hook response.", "output_write_failed"}, err);
            }
            return kExitSuccess;
        } catch (const std::exception& e) {
            return report_failure(HookError{ErrorCategory::Internal, e.what(), "unexpected_exception"}, err);
        }
    }

} // namespace hookguard::app
