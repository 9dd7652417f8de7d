// ---------------------------------------------------------------------------
// test_process_runner.cpp
//
// ProcessRunner 단위 테스트. 실제 /bin/sh 자식 프로세스를 띄운다.
//
// [테스트 범위]
// - stdout 수집, 종료 코드, stdin 전달, 환경 변수, 작업 디렉토리 (없으면 kSpawnFailed)
// - max_output_bytes 초과 시 잘라내기 (자식은 막히지 않고 종료)
// - deadline 초과 → kTimeout, 자식은 kill + reap 되어 더 이상 존재하지 않음
// - stdin 을 읽지 않고 종료하는 자식 (EPIPE 는 오류가 아님)
//
// [알려진 한계]
// - 타이밍 기반 테스트는 여유 있는 상한만 검사한다 (CI 부하 대비).
// ---------------------------------------------------------------------------

#include "action/process_runner.hpp"

#include <gtest/gtest.h>
#include <cerrno>
#include <csignal>
#include <filesystem>
#include <string>

namespace {

ProcessRequest request(const std::string& command) {
    ProcessRequest req{};
    req.command = command;
    req.timeout = std::chrono::milliseconds{5000};
    return req;
}

}  // namespace

TEST(ProcessRunner, CollectsStdoutAndExitCode) {
    const auto result = ProcessRunner{}.run(request("printf 'hello'; exit 3"));
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->stdout_data, "hello");
    EXPECT_EQ(result->exit_code, 3);
    EXPECT_FALSE(result->truncated);
    EXPECT_GT(result->pid, 0);
}

TEST(ProcessRunner, StderrIsDiscarded) {
    const auto result = ProcessRunner{}.run(request("echo out; echo err 1>&2"));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->stdout_data, "out\n");
}

TEST(ProcessRunner, PassesStdin) {
    auto req       = request("cat");
    req.stdin_data = R"({"hook_event_name":"PreToolUse"})";
    const auto result = ProcessRunner{}.run(req);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->stdout_data, req.stdin_data);
}

TEST(ProcessRunner, LargeStdinToChildThatIgnoresIt) {
    auto req       = request("exit 0");
    req.stdin_data = std::string(1 << 20, 'x');
    const auto result = ProcessRunner{}.run(req);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->exit_code, 0);
}

TEST(ProcessRunner, AddsEnvironmentAndWorkingDirectory) {
    auto req = request("printf '%s|%s' \"$HOOKGATE_RULE_NAME\" \"$(pwd -P)\"");
    req.env  = {{"HOOKGATE_RULE_NAME", "my-rule"}};
    const auto tmp = std::filesystem::canonical(std::filesystem::temp_directory_path());
    req.working_dir = tmp;
    const auto result = ProcessRunner{}.run(req);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->stdout_data, "my-rule|" + tmp.string());
}

TEST(ProcessRunner, TruncatesOutputAtLimit) {
    auto req             = request("head -c 100000 /dev/zero | tr '\\0' 'a'");
    req.max_output_bytes = 1000;
    const auto result    = ProcessRunner{}.run(req);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->stdout_data.size(), 1000U);
    EXPECT_TRUE(result->truncated);
    EXPECT_EQ(result->exit_code, 0);
}

TEST(ProcessRunner, TimeoutKillsAndReapsChild) {
    auto req    = request("sleep 30");
    req.timeout = std::chrono::milliseconds{200};

    const auto started = std::chrono::steady_clock::now();
    const auto result  = ProcessRunner{}.run(req);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ProcessErrorCode::kTimeout);
    EXPECT_LT(elapsed, std::chrono::seconds{5});

    // reap 까지 끝났으므로 pid 는 더 이상 존재하지 않는다
    ASSERT_GT(result.error().pid, 0);
    errno = 0;
    EXPECT_EQ(::kill(result.error().pid, 0), -1);
    EXPECT_EQ(errno, ESRCH);
}

TEST(ProcessRunner, TimeoutWhileChildHoldsStdoutOpenAfterWriting) {
    auto req    = request("echo partial; sleep 30");
    req.timeout = std::chrono::milliseconds{200};
    const auto result = ProcessRunner{}.run(req);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ProcessErrorCode::kTimeout);
}

TEST(ProcessRunner, ChildClosingStdoutButNotExitingTimesOut) {
    auto req    = request("exec 1>&-; sleep 30");
    req.timeout = std::chrono::milliseconds{300};
    const auto result = ProcessRunner{}.run(req);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ProcessErrorCode::kTimeout);
}

TEST(ProcessRunner, NonexistentWorkingDirectoryIsSpawnFailure) {
    auto req        = request("true");
    req.working_dir = "/nonexistent/hookgate/dir";
    const auto result = ProcessRunner{}.run(req);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ProcessErrorCode::kSpawnFailed);
}
