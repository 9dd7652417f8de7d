// ---------------------------------------------------------------------------
// test_matcher.cpp
//
// CompiledMatchers 단위 테스트.
//
// [테스트 범위]
// - predicate 별 매칭: tools, extensions, directories, operations,
//   command_match, prompt_match, enabled_when
// - 대용량 (200KB) 명령 매칭, UTF-8 코드 포인트 단위 prompt 매칭
// - AND 결합, 빈 Matchers 는 항상 참
// - trace 모드: 모든 predicate 결과 기록 / 비-trace 모드: 첫 거짓에서 단락
// - 경로 헬퍼 경계값: 확장자 없는 파일, 점 파일, 디렉토리 접두사 경계, 절대 경로
// - regex / 조건식 compile 오류 → ConfigError (역참조, lookaround 포함)
//
// [오탐/미탐 트레이드오프]
// - directories 는 glob 이 아닌 접두사 매칭이다. "src/**/*.rs" 같은 패턴의
//   중간 와일드카드는 지원하지 않는다.
// ---------------------------------------------------------------------------

#include "event/event.hpp"
#include "policy/matcher.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace {

Event file_event(const std::string& tool, const std::string& path, const std::string& cwd = "/repo") {
    nlohmann::json j{
        {"hook_event_name", "PreToolUse"},
        {"session_id", "s"},
        {"cwd", cwd},
        {"tool_name", tool},
        {"tool_input", {{"file_path", path}}},
    };
    auto event = event_from_json(j);
    EXPECT_TRUE(event.has_value());
    return event ? std::move(*event) : Event{};
}

Event bash_event(const std::string& command) {
    nlohmann::json j{
        {"hook_event_name", "PreToolUse"},
        {"session_id", "s"},
        {"cwd", "/repo"},
        {"tool_name", "Bash"},
        {"tool_input", {{"command", command}}},
    };
    auto event = event_from_json(j);
    EXPECT_TRUE(event.has_value());
    return event ? std::move(*event) : Event{};
}

Event prompt_event(const std::string& prompt) {
    nlohmann::json j{
        {"hook_event_name", "UserPromptSubmit"},
        {"session_id", "s"},
        {"prompt", prompt},
    };
    auto event = event_from_json(j);
    EXPECT_TRUE(event.has_value());
    return event ? std::move(*event) : Event{};
}

CompiledMatchers compile(const Matchers& m) {
    auto compiled = CompiledMatchers::compile(m);
    EXPECT_TRUE(compiled.has_value()) << (compiled ? "" : compiled.error().message);
    return compiled ? std::move(*compiled) : CompiledMatchers{};
}

bool matches(const Matchers& m, const Event& event, const InvocationContext& ctx = {}) {
    return compile(m).evaluate(event, ctx, false).matched;
}

}  // namespace

// ===========================================================================
// 개별 predicate
// ===========================================================================

TEST(Matcher, EmptyMatchersAlwaysMatch) {
    EXPECT_TRUE(matches(Matchers{}, bash_event("ls")));
    EXPECT_TRUE(matches(Matchers{}, prompt_event("hi")));
}

TEST(Matcher, ToolsIsExactCaseSensitive) {
    Matchers m{};
    m.tools = std::vector<std::string>{"Bash", "Write"};
    EXPECT_TRUE(matches(m, bash_event("ls")));
    EXPECT_TRUE(matches(m, file_event("Write", "a.txt")));
    EXPECT_FALSE(matches(m, file_event("Read", "a.txt")));

    m.tools = std::vector<std::string>{"bash"};
    EXPECT_FALSE(matches(m, bash_event("ls")));
}

TEST(Matcher, ToolsNeverMatchEventWithoutTool) {
    Matchers m{};
    m.tools = std::vector<std::string>{"Bash"};
    EXPECT_FALSE(matches(m, prompt_event("run ls")));
}

TEST(Matcher, ExtensionsCompareLastComponent) {
    Matchers m{};
    m.extensions = std::vector<std::string>{".rs", ".py"};
    EXPECT_TRUE(matches(m, file_event("Edit", "src/lib.rs")));
    EXPECT_TRUE(matches(m, file_event("Write", "/repo/tools/gen.py")));
    EXPECT_FALSE(matches(m, file_event("Write", "Makefile")));
    EXPECT_FALSE(matches(m, file_event("Write", "archive.rs.bak")));
    // 확장자 predicate 는 파일 경로가 없는 이벤트에서 거짓
    EXPECT_FALSE(matches(m, bash_event("cat x.rs")));
}

TEST(Matcher, PathExtensionEdgeCases) {
    EXPECT_EQ(path_extension("a/b/c.tar.gz"), ".gz");
    EXPECT_EQ(path_extension(".bashrc"), "");
    EXPECT_EQ(path_extension("dir.d/file"), "");
    EXPECT_EQ(path_extension("trailing."), "");
    EXPECT_EQ(path_extension("win\\path\\x.cpp"), ".cpp");
}

TEST(Matcher, DirectoriesArePrefixesWithBoundary) {
    Matchers m{};
    m.directories = std::vector<std::string>{"src/**"};
    EXPECT_TRUE(matches(m, file_event("Write", "src/main.rs")));
    EXPECT_TRUE(matches(m, file_event("Write", "src/a/b/c.rs")));
    EXPECT_TRUE(matches(m, file_event("Write", "./src/main.rs")));
    EXPECT_FALSE(matches(m, file_event("Write", "srcfoo/main.rs")));
    EXPECT_FALSE(matches(m, file_event("Write", "tests/src/main.rs")));
}

TEST(Matcher, DirectoriesCompareAbsolutePathsRelativeToCwd) {
    Matchers m{};
    m.directories = std::vector<std::string>{"db/migrations/"};
    EXPECT_TRUE(matches(m, file_event("Write", "/repo/db/migrations/001.sql", "/repo")));
    EXPECT_TRUE(matches(m, file_event("Write", "/repo/db/migrations/001.sql", "/repo/")));
    EXPECT_FALSE(matches(m, file_event("Write", "/other/db/migrations/001.sql", "/repo")));
}

TEST(Matcher, DirectoryPatternNormalization) {
    EXPECT_EQ(normalize_directory_pattern("src/**"), "src");
    EXPECT_EQ(normalize_directory_pattern("src/*"), "src");
    EXPECT_EQ(normalize_directory_pattern("src/"), "src");
    EXPECT_EQ(normalize_directory_pattern("./src"), "src");
    EXPECT_EQ(normalize_directory_pattern("a\\b\\"), "a/b");
    EXPECT_EQ(normalize_directory_pattern("**"), "**");
    EXPECT_EQ(normalize_directory_pattern("./"), "");
    // 빈 접두사는 모든 경로를 잡는다
    EXPECT_TRUE(directory_matches("./", "anything/at/all.txt", std::nullopt));
}

TEST(Matcher, SearchToolPathParticipatesInDirectoryMatch) {
    Matchers m{};
    m.directories = std::vector<std::string>{"vendor"};
    auto event = event_from_json(nlohmann::json{
        {"hook_event_name", "PreToolUse"},
        {"session_id", "s"},
        {"tool_name", "Grep"},
        {"tool_input", {{"pattern", "TODO"}, {"path", "vendor/lib"}}},
    });
    ASSERT_TRUE(event.has_value());
    EXPECT_TRUE(matches(m, *event));
}

TEST(Matcher, OperationsCompareFirstToken) {
    Matchers m{};
    m.operations = std::vector<std::string>{"rm", "git"};
    EXPECT_TRUE(matches(m, bash_event("rm -rf build")));
    EXPECT_TRUE(matches(m, bash_event("   git push")));
    EXPECT_FALSE(matches(m, bash_event("echo rm")));
    EXPECT_FALSE(matches(m, bash_event("rmdir x")));
    EXPECT_FALSE(matches(m, bash_event("")));
    EXPECT_EQ(first_token("\tgit\tstatus"), "git");
}

TEST(Matcher, CommandMatchIsSearchNotFullMatch) {
    Matchers m{};
    m.command_match = "git push.*--force";
    EXPECT_TRUE(matches(m, bash_event("cd repo && git push --force origin main")));
    EXPECT_FALSE(matches(m, bash_event("git push origin main")));
}

TEST(Matcher, CommandMatchUsesToolInputCommandForOtherTools) {
    Matchers m{};
    m.command_match = "^make";
    auto event = event_from_json(nlohmann::json{
        {"hook_event_name", "PreToolUse"},
        {"session_id", "s"},
        {"tool_name", "Shell"},
        {"tool_input", {{"command", "make all"}}},
    });
    ASSERT_TRUE(event.has_value());
    EXPECT_TRUE(matches(m, *event));
}

TEST(Matcher, PromptMatch) {
    Matchers m{};
    m.prompt_match = "(?:deploy|release) to prod";
    EXPECT_TRUE(matches(m, prompt_event("please deploy to prod now")));
    EXPECT_FALSE(matches(m, prompt_event("deploy to staging")));
    EXPECT_FALSE(matches(m, bash_event("deploy to prod")));
}

TEST(Matcher, CommandMatchOnVeryLargeHeredocCommand) {
    // 200KB 짜리 heredoc 에서도 매칭이 끝까지 진행돼야 한다
    Matchers m{};
    m.command_match = "git push.*--force";

    std::string body = "cat <<'EOF' > notes.txt\n";
    body.append(200 * 1024, 'a');
    body += "\nEOF\n";

    EXPECT_FALSE(matches(m, bash_event(body + "git push origin main")));
    EXPECT_TRUE(matches(m, bash_event(body + "git push --force origin main")));
}

TEST(Matcher, PromptMatchIsUtf8Aware) {
    Matchers m{};
    m.prompt_match = "^.$";
    EXPECT_TRUE(matches(m, prompt_event("\xC3\xA9")));  // "é" 한 글자
    EXPECT_FALSE(matches(m, prompt_event("ab")));

    Matchers hangul{};
    hangul.prompt_match = "^\\p{Hangul}+ 배포$";
    EXPECT_TRUE(matches(hangul, prompt_event("운영 배포")));
    EXPECT_FALSE(matches(hangul, prompt_event("prod 배포")));
}

TEST(Matcher, EnabledWhenUsesInvocationEnvironment) {
    Matchers m{};
    m.enabled_when = R"(env.CI == "true")";

    InvocationContext ci{};
    ci.env = {{"CI", "true"}};
    EXPECT_TRUE(matches(m, bash_event("ls"), ci));
    EXPECT_FALSE(matches(m, bash_event("ls"), InvocationContext{}));
}

// ===========================================================================
// 결합 / trace
// ===========================================================================

TEST(Matcher, PredicatesAreAndCombined) {
    Matchers m{};
    m.tools         = std::vector<std::string>{"Bash"};
    m.command_match = "git push.*--force";
    EXPECT_TRUE(matches(m, bash_event("git push --force")));
    EXPECT_FALSE(matches(m, bash_event("git status")));
    EXPECT_FALSE(matches(m, file_event("Write", "git push --force")));
}

TEST(Matcher, NonTraceShortCircuitsAfterFirstFalse) {
    Matchers m{};
    m.tools         = std::vector<std::string>{"Write"};
    m.command_match = "ls";
    const auto result = compile(m).evaluate(bash_event("ls"), InvocationContext{}, false);
    EXPECT_FALSE(result.matched);
    EXPECT_EQ(result.details.tools_matched, false);
    EXPECT_FALSE(result.details.command_match_matched.has_value());
}

TEST(Matcher, TraceRecordsEveryConfiguredPredicate) {
    Matchers m{};
    m.tools         = std::vector<std::string>{"Write"};
    m.command_match = "ls";
    m.operations    = std::vector<std::string>{"ls"};
    const auto result = compile(m).evaluate(bash_event("ls -la"), InvocationContext{}, true);
    EXPECT_FALSE(result.matched);
    EXPECT_EQ(result.details.tools_matched, false);
    EXPECT_EQ(result.details.operations_matched, true);
    EXPECT_EQ(result.details.command_match_matched, true);
    // 설정되지 않은 predicate 는 비어 있다
    EXPECT_FALSE(result.details.extensions_matched.has_value());
    EXPECT_FALSE(result.details.enabled_when_matched.has_value());

    const nlohmann::json j = result.details;
    EXPECT_EQ(j.size(), 3U);
    EXPECT_EQ(j.get<MatcherResults>(), result.details);
}

TEST(Matcher, PermissionRequestMatchesWrappedTool) {
    Matchers m{};
    m.operations = std::vector<std::string>{"rm"};
    auto event = event_from_json(nlohmann::json{
        {"hook_event_name", "PermissionRequest"},
        {"session_id", "s"},
        {"tool_name", "Bash"},
        {"tool_input", {{"command", "rm -rf /tmp/x"}}},
    });
    ASSERT_TRUE(event.has_value());
    EXPECT_TRUE(matches(m, *event));
}

// ===========================================================================
// compile 오류
// ===========================================================================

TEST(Matcher, InvalidRegexIsConfigError) {
    Matchers m{};
    m.command_match = "([a-z";
    const auto compiled = CompiledMatchers::compile(m);
    ASSERT_FALSE(compiled.has_value());
    EXPECT_EQ(compiled.error().code, ConfigErrorCode::kInvalidRegex);
}

TEST(Matcher, LookaroundIsRejectedAtCompile) {
    Matchers m{};
    m.command_match = "rm (?!-i)";
    const auto compiled = CompiledMatchers::compile(m);
    ASSERT_FALSE(compiled.has_value());
    EXPECT_EQ(compiled.error().code, ConfigErrorCode::kInvalidRegex);
}

TEST(Matcher, InvalidExpressionIsConfigError) {
    Matchers m{};
    m.enabled_when = "env.CI ==";
    const auto compiled = CompiledMatchers::compile(m);
    ASSERT_FALSE(compiled.has_value());
    EXPECT_EQ(compiled.error().code, ConfigErrorCode::kInvalidExpression);
}
