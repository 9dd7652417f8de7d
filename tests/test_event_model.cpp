// ---------------------------------------------------------------------------
// test_event_model.cpp
//
// EventModel 단위 테스트.
//
// [테스트 범위]
// - 봉투 파싱: hook_event_name / event_type, session_id 필수, timestamp 기본값
// - 도구별 EventDetails 추출 (Bash, Write/Edit/Read, Glob/Grep, Session, Permission)
// - 알 수 없는 도구/이벤트 종류는 오류가 아니라 Unknown 으로 강등
// - 깨진 봉투 (JSON 문법 오류, 배열, session_id 누락, 빈 입력) → ParseError
// - EventDetails / Event JSON 직렬화 왕복
// - ISO-8601 타임스탬프 변환
// ---------------------------------------------------------------------------

#include "common/time_format.hpp"
#include "event/event.hpp"

#include <gtest/gtest.h>
#include <string>

namespace {

Event must_parse(const std::string& payload) {
    auto event = parse_event(payload);
    EXPECT_TRUE(event.has_value()) << (event ? "" : event.error().message);
    return event ? std::move(*event) : Event{};
}

}  // namespace

// ===========================================================================
// 봉투 파싱
// ===========================================================================

TEST(EventModel, ParsesBashPreToolUse) {
    const auto event = must_parse(R"({
        "hook_event_name": "PreToolUse",
        "session_id": "s-1",
        "timestamp": "2025-01-15T10:30:00Z",
        "cwd": "/work/project",
        "tool_name": "Bash",
        "tool_input": {"command": "git status"}
    })");

    EXPECT_EQ(event.kind, EventKind::kPreToolUse);
    EXPECT_EQ(event.kind_name, "PreToolUse");
    EXPECT_EQ(event.session_id, "s-1");
    EXPECT_EQ(event.cwd, "/work/project");
    EXPECT_EQ(event.tool_name, "Bash");
    EXPECT_EQ(format_iso8601(event.timestamp), "2025-01-15T10:30:00.000000Z");

    const auto* bash = std::get_if<BashDetails>(&event.details.value);
    ASSERT_NE(bash, nullptr);
    EXPECT_EQ(bash->command, "git status");
    EXPECT_EQ(event.details.tool_type(), "Bash");
    EXPECT_EQ(event.details.command(), "git status");
}

TEST(EventModel, EventTypeKeyIsAcceptedAsFallback) {
    const auto event = must_parse(R"({"event_type": "PostToolUse", "session_id": "s"})");
    EXPECT_EQ(event.kind, EventKind::kPostToolUse);
}

TEST(EventModel, HookEventNameWinsOverEventType) {
    const auto event = must_parse(
        R"({"hook_event_name": "SessionEnd", "event_type": "PreToolUse", "session_id": "s"})");
    EXPECT_EQ(event.kind, EventKind::kSessionEnd);
}

TEST(EventModel, MissingTimestampDefaultsToNow) {
    const auto before = std::chrono::system_clock::now() - std::chrono::seconds{1};
    const auto event  = must_parse(R"({"hook_event_name": "PreToolUse", "session_id": "s"})");
    const auto after  = std::chrono::system_clock::now() + std::chrono::seconds{1};
    EXPECT_GE(event.timestamp, before);
    EXPECT_LE(event.timestamp, after);
}

TEST(EventModel, UnknownEventKindPreservesRawName) {
    const auto event = must_parse(R"({"hook_event_name": "Notification", "session_id": "s"})");
    EXPECT_EQ(event.kind, EventKind::kUnknown);
    EXPECT_EQ(event.kind_name, "Notification");
    EXPECT_EQ(event_kind_to_string(event.kind), "Unknown");
}

TEST(EventModel, PromptFromTopLevelOrToolInput) {
    const auto top = must_parse(
        R"({"hook_event_name": "UserPromptSubmit", "session_id": "s", "prompt": "deploy it"})");
    EXPECT_EQ(top.prompt, "deploy it");

    const auto nested = must_parse(
        R"({"hook_event_name": "UserPromptSubmit", "session_id": "s",
            "tool_input": {"prompt": "from input"}})");
    EXPECT_EQ(nested.prompt, "from input");
}

// ===========================================================================
// EventDetails 추출
// ===========================================================================

TEST(EventModel, FileOpsAcceptFilePathAndCamelCase) {
    const auto write = must_parse(R"({"hook_event_name": "PreToolUse", "session_id": "s",
        "tool_name": "Write", "tool_input": {"file_path": "src/main.rs", "content": "x"}})");
    const auto* w = std::get_if<FileDetails>(&write.details.value);
    ASSERT_NE(w, nullptr);
    EXPECT_EQ(w->op, FileOp::kWrite);
    EXPECT_EQ(w->file_path, "src/main.rs");

    const auto edit = must_parse(R"({"hook_event_name": "PreToolUse", "session_id": "s",
        "tool_name": "Edit", "tool_input": {"filePath": "a/b.py"}})");
    const auto* e = std::get_if<FileDetails>(&edit.details.value);
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(e->op, FileOp::kEdit);
    EXPECT_EQ(edit.details.file_path(), "a/b.py");
}

TEST(EventModel, MissingFilePathYieldsEmptyButNoError) {
    const auto event = must_parse(R"({"hook_event_name": "PreToolUse", "session_id": "s",
        "tool_name": "Read", "tool_input": {}})");
    EXPECT_EQ(event.details.tool_type(), "Read");
    EXPECT_FALSE(event.details.file_path().has_value());
}

TEST(EventModel, SearchOpsCarryPatternAndPath) {
    const auto event = must_parse(R"({"hook_event_name": "PreToolUse", "session_id": "s",
        "tool_name": "Grep", "tool_input": {"pattern": "TODO", "path": "src"}})");
    const auto* search = std::get_if<SearchDetails>(&event.details.value);
    ASSERT_NE(search, nullptr);
    EXPECT_EQ(search->op, SearchOp::kGrep);
    EXPECT_EQ(search->pattern, "TODO");
    EXPECT_EQ(search->path, "src");
    EXPECT_EQ(event.details.file_path(), "src");
}

TEST(EventModel, SessionStartWithoutToolYieldsSessionDetails) {
    const auto event = must_parse(R"({"hook_event_name": "SessionStart", "session_id": "s",
        "source": "startup", "transcript_path": "/tmp/t.jsonl", "cwd": "/w"})");
    const auto* session = std::get_if<SessionDetails>(&event.details.value);
    ASSERT_NE(session, nullptr);
    EXPECT_EQ(session->source, "startup");
    EXPECT_EQ(session->transcript_path, "/tmp/t.jsonl");
    EXPECT_EQ(session->cwd, "/w");
    EXPECT_FALSE(session->reason.has_value());
}

TEST(EventModel, PermissionRequestWrapsToolDetailsOneLevel) {
    const auto event = must_parse(R"({"hook_event_name": "PermissionRequest", "session_id": "s",
        "permission_mode": "default", "tool_name": "Bash",
        "tool_input": {"command": "rm -rf build"}})");
    const auto* perm = std::get_if<PermissionDetails>(&event.details.value);
    ASSERT_NE(perm, nullptr);
    EXPECT_EQ(perm->permission_mode, "default");
    ASSERT_NE(perm->tool_details, nullptr);
    EXPECT_EQ(perm->tool_details->tool_type(), "Bash");
    EXPECT_FALSE(std::holds_alternative<PermissionDetails>(perm->tool_details->value));

    // matcher 는 감싼 도구의 명령을 본다
    EXPECT_EQ(event.details.command(), "rm -rf build");
}

TEST(EventModel, UnknownToolDegradesToUnknownDetails) {
    const auto event = must_parse(R"({"hook_event_name": "PreToolUse", "session_id": "s",
        "tool_name": "FutureTool", "tool_input": {"anything": [1, 2, 3]}})");
    const auto* unknown = std::get_if<UnknownDetails>(&event.details.value);
    ASSERT_NE(unknown, nullptr);
    EXPECT_EQ(unknown->tool_name, "FutureTool");
}

TEST(EventModel, WrongFieldTypesDegradeInsteadOfFailing) {
    const auto event = must_parse(R"({"hook_event_name": "PreToolUse", "session_id": "s",
        "tool_name": "Bash", "tool_input": {"command": 42}, "cwd": false})");
    EXPECT_EQ(event.details.command(), "");
    EXPECT_FALSE(event.cwd.has_value());
}

TEST(EventModel, PermissionDetailsCopyIsDeep) {
    const PermissionDetails original{"plan", EventDetails{BashDetails{"ls"}}};
    PermissionDetails       copy = original;
    EXPECT_EQ(copy, original);
    std::get<BashDetails>(copy.tool_details->value).command = "pwd";
    EXPECT_NE(copy, original);
    EXPECT_EQ(std::get<BashDetails>(original.tool_details->value).command, "ls");
}

// ===========================================================================
// 깨진 봉투
// ===========================================================================

TEST(EventModel, MalformedJsonIsParseError) {
    const auto event = parse_event(R"({"hook_event_name": "PreToolUse", )");
    ASSERT_FALSE(event.has_value());
    EXPECT_EQ(event.error().code, ParseErrorCode::kMalformedJson);
}

TEST(EventModel, EmptyInputIsParseError) {
    const auto event = parse_event("  \n");
    ASSERT_FALSE(event.has_value());
    EXPECT_EQ(event.error().code, ParseErrorCode::kEmptyInput);
}

TEST(EventModel, NonObjectIsInvalidEnvelope) {
    const auto event = parse_event("[1, 2]");
    ASSERT_FALSE(event.has_value());
    EXPECT_EQ(event.error().code, ParseErrorCode::kInvalidEnvelope);
}

TEST(EventModel, MissingSessionIdIsInvalidEnvelope) {
    const auto event = parse_event(R"({"hook_event_name": "PreToolUse"})");
    ASSERT_FALSE(event.has_value());
    EXPECT_EQ(event.error().code, ParseErrorCode::kInvalidEnvelope);
}

TEST(EventModel, NonStringKindIsInvalidEnvelope) {
    const auto event = parse_event(R"({"hook_event_name": 3, "session_id": "s"})");
    ASSERT_FALSE(event.has_value());
    EXPECT_EQ(event.error().code, ParseErrorCode::kInvalidEnvelope);
}

// ===========================================================================
// JSON 직렬화
// ===========================================================================

TEST(EventModel, EventDetailsJsonIsTaggedByToolType) {
    const nlohmann::json j = EventDetails{FileDetails{FileOp::kEdit, "x.cpp"}};
    EXPECT_EQ(j.at("tool_type"), "Edit");
    EXPECT_EQ(j.at("file_path"), "x.cpp");

    const nlohmann::json p = EventDetails{
        PermissionDetails{"default", EventDetails{SearchDetails{SearchOp::kGlob, "*.rs", std::nullopt}}}};
    EXPECT_EQ(p.at("tool_type"), "Permission");
    EXPECT_EQ(p.at("tool_details").at("tool_type"), "Glob");
    EXPECT_EQ(p.get<EventDetails>(),
              (EventDetails{PermissionDetails{
                  "default", EventDetails{SearchDetails{SearchOp::kGlob, "*.rs", std::nullopt}}}}));
}

TEST(EventModel, UnknownToolTypeTagReadsAsUnknown) {
    const auto details = nlohmann::json{{"tool_type", "Teleport"}}.get<EventDetails>();
    EXPECT_TRUE(std::holds_alternative<UnknownDetails>(details.value));
}

TEST(EventModel, EventJsonRoundTripPreservesUnknownFields) {
    const auto event = must_parse(R"({"hook_event_name": "PreToolUse", "session_id": "s-9",
        "timestamp": "2025-03-01T08:00:00.123456Z", "tool_name": "Bash",
        "tool_input": {"command": "make"}, "vendor_extension": {"k": 1}})");

    const auto j = event_to_json(event);
    EXPECT_EQ(j.at("vendor_extension").at("k"), 1);

    const auto back = event_from_json(j);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->kind, event.kind);
    EXPECT_EQ(back->session_id, event.session_id);
    EXPECT_EQ(back->timestamp, event.timestamp);
    EXPECT_EQ(back->details, event.details);
}

// ===========================================================================
// 타임스탬프
// ===========================================================================

TEST(TimeFormat, ParsesOffsetsAndFractions) {
    const auto z      = parse_iso8601("2025-01-15T10:30:00Z");
    const auto offset = parse_iso8601("2025-01-15T19:30:00+09:00");
    ASSERT_TRUE(z && offset);
    EXPECT_EQ(*z, *offset);

    const auto frac = parse_iso8601("2025-01-15T10:30:00.5Z");
    ASSERT_TRUE(frac);
    EXPECT_EQ(format_iso8601(*frac), "2025-01-15T10:30:00.500000Z");
}

TEST(TimeFormat, RejectsGarbage) {
    EXPECT_FALSE(parse_iso8601("yesterday").has_value());
    EXPECT_FALSE(parse_iso8601("2025-13-40T99:00:00Z").has_value());
}
