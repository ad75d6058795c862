/**
 * @file command_dispatcher_tests.cpp
 * @brief Submit / poll / retrieve / clean up pipeline
 *
 * @date 2025
 */

#include "fake_services.hpp"

#include "stratus/core/command_dispatcher.hpp"
#include "stratus/core/errors.hpp"

#include <gtest/gtest.h>

using namespace stratus;
using namespace stratus::core;
using services::CommandState;
using services::InvocationStatus;

class CommandDispatcherTest : public ::testing::Test {
protected:
    std::shared_ptr<KeyGenerator> MakeKeys() {
        return std::make_shared<KeyGenerator>("sandbox/", 1234u, [] {
            return std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));
        });
    }

    CommandDispatcher MakeDispatcher() {
        return CommandDispatcher("i-0123456789abcdef0", "test-bucket", world.Clients(),
                                 MakeKeys(), fakes::RecordingSleeper(pauses));
    }

    std::string StdoutKey(std::size_t index = 0) const {
        const auto& request = world.relay->sent.at(index);
        return world.relay->OutputKey(request.output_key_prefix, "cmd-" + std::to_string(index + 1),
                                      request.instance_id, "stdout");
    }

    std::string StderrKey(std::size_t index = 0) const {
        const auto& request = world.relay->sent.at(index);
        return world.relay->OutputKey(request.output_key_prefix, "cmd-" + std::to_string(index + 1),
                                      request.instance_id, "stderr");
    }

    fakes::FakeWorld world;
    std::shared_ptr<std::vector<std::chrono::milliseconds>> pauses =
        std::make_shared<std::vector<std::chrono::milliseconds>>();
};

TEST(CommandDispatcherScriptTest, ExportsThenCdThenCommand) {
    auto lines = CommandDispatcher::BuildExecScript(
        {"python3", "-c", "print('hi there')"},
        {{"B_VAR", "two words"}, {"A_VAR", "plain"}},
        std::string("/work dir"));

    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0], "export A_VAR=plain");
    EXPECT_EQ(lines[1], "export B_VAR='two words'");
    EXPECT_EQ(lines[2], "cd '/work dir'");
    EXPECT_EQ(lines[3], "python3 -c 'print('\"'\"'hi there'\"'\"')'");
}

TEST(CommandDispatcherScriptTest, VariableNamesAreQuoted) {
    auto lines = CommandDispatcher::BuildExecScript(
        {"true"}, {{"X;touch /tmp/pwn;Y", "v"}}, std::nullopt);

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "export 'X;touch /tmp/pwn;Y'=v");
}

TEST(CommandDispatcherScriptTest, BareCommand) {
    auto lines = CommandDispatcher::BuildExecScript({"echo", "hello"}, {}, std::nullopt);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "echo hello");
}

TEST_F(CommandDispatcherTest, EchoHelloSucceedsAndCleansUp) {
    world.relay->script.push_back(fakes::Succeeds("hello\n"));
    auto dispatcher = MakeDispatcher();

    auto outcome = dispatcher.RunScript(Operation::EXEC, {"echo hello"}, std::chrono::seconds(30));

    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(outcome.returncode, 0);
    EXPECT_EQ(outcome.stdout_output, "hello\n");
    EXPECT_EQ(outcome.stderr_output, "");

    EXPECT_TRUE(fakes::LogContains(*world.log, "delete:" + StdoutKey()));
    EXPECT_TRUE(fakes::LogContains(*world.log, "delete:" + StderrKey()));
    const auto& prefix = world.relay->sent[0].output_key_prefix;
    EXPECT_TRUE(fakes::LogContains(*world.log, "delete_prefix:" + prefix + "cmd-1/"));
    EXPECT_TRUE(world.store->objects.empty());
}

TEST_F(CommandDispatcherTest, SubmissionCarriesBucketPrefixAndTimeout) {
    auto dispatcher = MakeDispatcher();
    dispatcher.RunScript(Operation::EXEC, {"true"}, std::chrono::seconds(45));

    ASSERT_EQ(world.relay->sent.size(), 1u);
    const auto& request = world.relay->sent[0];
    EXPECT_EQ(request.instance_id, "i-0123456789abcdef0");
    EXPECT_EQ(request.output_bucket, "test-bucket");
    EXPECT_EQ(request.execution_timeout, std::chrono::seconds(45));
    EXPECT_EQ(request.output_key_prefix.rfind("sandbox/exec/", 0), 0u);
    EXPECT_EQ(request.output_key_prefix.back(), '/');
}

TEST_F(CommandDispatcherTest, PrefixesDifferAcrossInvocations) {
    auto dispatcher = MakeDispatcher();
    dispatcher.RunScript(Operation::EXEC, {"true"}, std::chrono::seconds(5));
    dispatcher.RunScript(Operation::EXEC, {"true"}, std::chrono::seconds(5));

    ASSERT_EQ(world.relay->sent.size(), 2u);
    EXPECT_NE(world.relay->sent[0].output_key_prefix, world.relay->sent[1].output_key_prefix);
}

TEST_F(CommandDispatcherTest, PollsOncePerSecondUntilTerminal) {
    fakes::ScriptedCommand command = fakes::Succeeds("done");
    command.statuses = {
        InvocationStatus{CommandState::PENDING, std::nullopt},
        InvocationStatus{CommandState::IN_PROGRESS, std::nullopt},
        InvocationStatus{CommandState::SUCCESS, 0},
    };
    world.relay->script.push_back(command);

    auto outcome = MakeDispatcher().RunScript(Operation::EXEC, {"sleep 2"}, std::chrono::seconds(60));

    EXPECT_EQ(outcome.stdout_output, "done");
    EXPECT_EQ(world.relay->status_calls, 3);
    ASSERT_EQ(pauses->size(), 2u);
    EXPECT_EQ((*pauses)[0], std::chrono::milliseconds(1000));
}

TEST_F(CommandDispatcherTest, StillRunningAtTimeoutCancelsThenThrows) {
    world.relay->script.push_back(fakes::NeverFinishes());
    auto dispatcher = MakeDispatcher();

    EXPECT_THROW(dispatcher.RunScript(Operation::EXEC, {"sleep 100"}, std::chrono::seconds(3)),
                 ExecutionTimeout);

    EXPECT_EQ(world.relay->status_calls, 3);
    ASSERT_EQ(world.relay->cancelled.size(), 1u);
    EXPECT_EQ(world.relay->cancelled[0], "cmd-1");
    ASSERT_EQ(world.relay->cancelled_instances.size(), 1u);
    EXPECT_EQ(world.relay->cancelled_instances[0], "i-0123456789abcdef0");

    // Cancel is issued before the artifacts are removed and no stream is read
    long cancel_at = fakes::IndexOf(*world.log, "cancel:");
    long delete_at = fakes::IndexOf(*world.log, "delete:");
    ASSERT_GE(cancel_at, 0);
    ASSERT_GE(delete_at, 0);
    EXPECT_LT(cancel_at, delete_at);
    EXPECT_EQ(fakes::IndexOf(*world.log, "get:"), -1);
}

TEST_F(CommandDispatcherTest, FailedCancelStillReportsTimeout) {
    world.relay->script.push_back(fakes::NeverFinishes());
    world.relay->fail_cancel = true;

    EXPECT_THROW(MakeDispatcher().RunScript(Operation::EXEC, {"sleep 100"}, std::chrono::seconds(2)),
                 ExecutionTimeout);
    EXPECT_EQ(world.relay->cancelled.size(), 1u);
}

TEST_F(CommandDispatcherTest, NonZeroExitIsAnOutcomeNotAnError) {
    world.relay->script.push_back(fakes::Fails(2, "ls: cannot access 'x'\n"));

    auto outcome = MakeDispatcher().RunScript(Operation::EXEC, {"ls x"}, std::chrono::seconds(10));

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.returncode, 2);
    EXPECT_EQ(outcome.stderr_output, "ls: cannot access 'x'\n");
    EXPECT_TRUE(world.store->objects.empty());
}

TEST_F(CommandDispatcherTest, MissingResponseCodeDefaults) {
    fakes::ScriptedCommand failed;
    failed.statuses = {InvocationStatus{CommandState::FAILED, std::nullopt}};
    world.relay->script.push_back(failed);

    fakes::ScriptedCommand succeeded;
    succeeded.statuses = {InvocationStatus{CommandState::SUCCESS, std::nullopt}};
    world.relay->script.push_back(succeeded);

    auto dispatcher = MakeDispatcher();
    auto first = dispatcher.RunScript(Operation::EXEC, {"false"}, std::chrono::seconds(5));
    EXPECT_EQ(first.returncode, 1);
    EXPECT_FALSE(first.success);

    auto second = dispatcher.RunScript(Operation::EXEC, {"true"}, std::chrono::seconds(5));
    EXPECT_EQ(second.returncode, 0);
    EXPECT_TRUE(second.success);
}

TEST_F(CommandDispatcherTest, RelayCancellationIsAFailureNotATimeout) {
    fakes::ScriptedCommand cancelled;
    cancelled.statuses = {InvocationStatus{CommandState::CANCELLED, std::nullopt}};
    world.relay->script.push_back(cancelled);

    auto outcome = MakeDispatcher().RunScript(Operation::EXEC, {"true"}, std::chrono::seconds(5));
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.returncode, 1);
    EXPECT_TRUE(world.relay->cancelled.empty());
}

TEST_F(CommandDispatcherTest, Exit126MarkerIsPermissionDenied) {
    world.relay->script.push_back(fakes::Fails(
        126, "/tmp/script: line 1: ./run.sh: Permission denied\n"
             "failed to run commands: exit status 126"));

    EXPECT_THROW(MakeDispatcher().RunScript(Operation::EXEC, {"./run.sh"}, std::chrono::seconds(5)),
                 PermissionDenied);
    EXPECT_TRUE(world.store->objects.empty());
}

TEST_F(CommandDispatcherTest, OversizedStdoutRaisesWithPrefixAfterCleanup) {
    world.relay->script.push_back(fakes::Succeeds(std::string(kMaxExecOutputSize + 5, 'a')));

    try {
        MakeDispatcher().RunScript(Operation::EXEC, {"yes"}, std::chrono::seconds(5));
        FAIL() << "expected OutputTruncated";
    } catch (const OutputTruncated& e) {
        EXPECT_EQ(e.LimitStr(), "10 MiB");
        ASSERT_TRUE(e.TruncatedOutput().has_value());
        EXPECT_EQ(e.TruncatedOutput()->size(), kMaxExecOutputSize);
    }
    EXPECT_TRUE(world.store->objects.empty());
}

TEST_F(CommandDispatcherTest, DeleteFailuresDoNotMaskTheResult) {
    world.relay->script.push_back(fakes::Succeeds("ok"));
    world.store->fail_deletes = true;

    auto outcome = MakeDispatcher().RunScript(Operation::EXEC, {"echo ok"}, std::chrono::seconds(5));
    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(outcome.stdout_output, "ok");
    EXPECT_TRUE(fakes::LogContains(*world.log, "delete_prefix:" +
                                   world.relay->sent[0].output_key_prefix + "cmd-1/"));
}

TEST(CompletionWaiterTest, PolicyMatchesTimeout) {
    auto policy = CompletionWaiter::PolicyFor(std::chrono::seconds(90));
    EXPECT_EQ(policy.max_attempts, 90);
    EXPECT_EQ(policy.delay, std::chrono::milliseconds(1000));
    ASSERT_TRUE(policy.deadline.has_value());
    EXPECT_EQ(*policy.deadline, std::chrono::milliseconds(90000));
}
