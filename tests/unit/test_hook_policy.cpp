#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/hook_rules.hpp"
#include "core/errors/hook_errors.hpp"
#include "policy/hook_policy.hpp"
#include "protocol/hook_response.hpp"
#include "protocol/invocation_request.hpp"

namespace {

using hookguard::core::config::HookRules;
using hookguard::core::errors::ErrorCategory;
using hookguard::core::errors::get_error;
using hookguard::core::errors::get_value;
using hookguard::core::errors::is_error;
using hookguard::policy::HookPolicy;
using hookguard::protocol::InvocationRequest;
using hookguard::protocol::ResponseKind;
using nlohmann::ordered_json;

const char* const kBlockReason =
    "Execution of rm -rf is strictly prohibited by security python hook.";

InvocationRequest bash_request(const std::string& command) {
    InvocationRequest request;
    request.tool = "my_bash_tool";
    request.args["command"] = command;
    return request;
}

TEST(HookPolicyTest, BlocksRecursiveRemoval) {
    HookPolicy policy;
    auto result = policy.evaluate(bash_request("rm -rf /tmp/x"));
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).kind, ResponseKind::Block);
    EXPECT_EQ(get_value(result).reason, kBlockReason);
}

TEST(HookPolicyTest, BlocksSubstringAnywhereInCommand) {
    HookPolicy policy;
    auto result = policy.evaluate(bash_request("cd /; sudo rm -rf --no-preserve-root ."));
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).kind, ResponseKind::Block);
}

TEST(HookPolicyTest, MutatesEchoCommand) {
    HookPolicy policy;
    auto result = policy.evaluate(bash_request("echo hi"));
    ASSERT_FALSE(is_error(result));

    const auto& response = get_value(result);
    EXPECT_EQ(response.kind, ResponseKind::Mutate);
    EXPECT_EQ(response.args["command"], "echo hi (intercepted by Python hook!)");
}

TEST(HookPolicyTest, BlockRuleWinsOverMutation) {
    HookPolicy policy;
    auto result = policy.evaluate(bash_request("echo rm -rf /"));
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).kind, ResponseKind::Block);
}

TEST(HookPolicyTest, MatchingIsCaseSensitive) {
    HookPolicy policy;
    auto upper_rm = policy.evaluate(bash_request("RM -RF /"));
    ASSERT_FALSE(is_error(upper_rm));
    EXPECT_EQ(get_value(upper_rm).kind, ResponseKind::PassThrough);

    auto upper_echo = policy.evaluate(bash_request("ECHO hi"));
    ASSERT_FALSE(is_error(upper_echo));
    EXPECT_EQ(get_value(upper_echo).kind, ResponseKind::PassThrough);
}

TEST(HookPolicyTest, PassesThroughOtherCommands) {
    HookPolicy policy;
    auto result = policy.evaluate(bash_request("ls -la"));
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).kind, ResponseKind::PassThrough);
}

TEST(HookPolicyTest, PassesThroughOtherTools) {
    HookPolicy policy;
    InvocationRequest request = bash_request("rm -rf /");
    request.tool = "other_tool";
    auto result = policy.evaluate(request);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).kind, ResponseKind::PassThrough);
}

TEST(HookPolicyTest, PassesThroughWhenToolMissing) {
    HookPolicy policy;
    InvocationRequest request = bash_request("rm -rf /");
    request.tool.reset();
    auto result = policy.evaluate(request);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).kind, ResponseKind::PassThrough);
}

TEST(HookPolicyTest, IgnoresMalformedArgsOfOtherTools) {
    HookPolicy policy;
    InvocationRequest request;
    request.tool = "other_tool";
    request.args = ordered_json::array();
    auto result = policy.evaluate(request);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).kind, ResponseKind::PassThrough);
}

TEST(HookPolicyTest, TreatsMissingCommandAsEmpty) {
    HookPolicy policy;
    InvocationRequest request;
    request.tool = "my_bash_tool";
    request.args["cwd"] = "/tmp";
    auto result = policy.evaluate(request);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).kind, ResponseKind::PassThrough);
}

TEST(HookPolicyTest, PreservesOtherArgumentsWhenMutating) {
    HookPolicy policy;
    InvocationRequest request;
    request.tool = "my_bash_tool";
    request.args["cwd"] = "/tmp";
    request.args["command"] = "echo hi";
    request.args["env"] = {{"A", 1}};
    auto result = policy.evaluate(request);
    ASSERT_FALSE(is_error(result));

    const auto& args = get_value(result).args;
    ASSERT_EQ(args.size(), 3u);
    auto it = args.begin();
    EXPECT_EQ(it.key(), "cwd");
    ++it;
    EXPECT_EQ(it.key(), "command");
    ++it;
    EXPECT_EQ(it.key(), "env");
    EXPECT_EQ(args["env"]["A"], 1);

    // The request itself is left untouched.
    EXPECT_EQ(request.args["command"], "echo hi");
}

TEST(HookPolicyTest, RejectsNonObjectArgs) {
    HookPolicy policy;
    InvocationRequest request;
    request.tool = "my_bash_tool";
    request.args = nullptr;
    auto result = policy.evaluate(request);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Processing);
    EXPECT_EQ(get_error(result).code, "args_not_object");
}

TEST(HookPolicyTest, RejectsNonTextCommand) {
    HookPolicy policy;
    InvocationRequest request;
    request.tool = "my_bash_tool";
    request.args["command"] = 7;
    auto result = policy.evaluate(request);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "command_not_string");
    EXPECT_EQ(get_error(result).message, "Argument 'command' must be a string, got number");
}

TEST(HookPolicyTest, HonorsCustomRules) {
    HookRules rules;
    rules.target_tool = "shell";
    rules.blocked_substring = "shutdown";
    rules.block_reason = "no shutdowns";
    rules.mutation_trigger = "ls";
    rules.mutation_suffix = " -1";
    HookPolicy policy(rules);

    InvocationRequest request;
    request.tool = "shell";
    request.args["command"] = "ls";
    auto mutated = policy.evaluate(request);
    ASSERT_FALSE(is_error(mutated));
    EXPECT_EQ(get_value(mutated).args["command"], "ls -1");

    request.args["command"] = "ls && shutdown now";
    auto blocked = policy.evaluate(request);
    ASSERT_FALSE(is_error(blocked));
    EXPECT_EQ(get_value(blocked).kind, ResponseKind::Block);
    EXPECT_EQ(get_value(blocked).reason, "no shutdowns");

    request.tool = "my_bash_tool";
    auto ignored = policy.evaluate(request);
    ASSERT_FALSE(is_error(ignored));
    EXPECT_EQ(get_value(ignored).kind, ResponseKind::PassThrough);
}

}  // namespace
