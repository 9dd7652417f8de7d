#pragma once

// ---------------------------------------------------------------------------
// event.hpp
//
// 에이전트 호스트가 stdin 으로 전달하는 hook 이벤트의 타입 모델.
//
// [설계 원칙]
// - 오류는 "이벤트 봉투가 깨진 경우" 하나뿐이다.
//   (JSON 문법 오류, 최상위가 객체 아님, session_id 누락, kind 가 문자열 아님)
// - 알 수 없는 이벤트 종류 / 도구 / 누락된 하위 필드는 오류가 아니다.
//   각각 EventKind::kUnknown, UnknownDetails, std::nullopt 로 강등된다.
// - PermissionRequest 는 감싼 도구의 EventDetails 를 정확히 한 단계만 가진다.
//   재귀 variant 는 unique_ptr 하나로 끊는다.
//
// [JSON 형태]
// EventDetails 는 "tool_type" 태그로 구분되는 객체로 직렬화된다.
//   {"tool_type":"Bash","command":"git status"}
//   {"tool_type":"Permission","permission_mode":"default","tool_details":{...}}
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

#include "common/types.hpp"

// ---------------------------------------------------------------------------
// EventKind
//   입력 키 hook_event_name (우선) 또는 event_type 의 값.
//   원문 문자열은 Event::kind_name 에 그대로 보존된다.
// ---------------------------------------------------------------------------
enum class EventKind : std::uint8_t {
    kPreToolUse        = 0,
    kPostToolUse       = 1,
    kPermissionRequest = 2,
    kUserPromptSubmit  = 3,
    kSessionStart      = 4,
    kSessionEnd        = 5,
    kPreCompact        = 6,
    kUnknown           = 7,
};

[[nodiscard]] std::string_view event_kind_to_string(EventKind kind) noexcept;
[[nodiscard]] EventKind        event_kind_from_string(std::string_view name) noexcept;

enum class FileOp : std::uint8_t {
    kWrite = 0,
    kEdit  = 1,
    kRead  = 2,
};

enum class SearchOp : std::uint8_t {
    kGlob = 0,
    kGrep = 1,
};

struct BashDetails {
    std::string command{};

    bool operator==(const BashDetails&) const = default;
};

struct FileDetails {
    FileOp      op{FileOp::kRead};
    std::string file_path{};  // file_path 또는 filePath

    bool operator==(const FileDetails&) const = default;
};

struct SearchDetails {
    SearchOp                   op{SearchOp::kGlob};
    std::optional<std::string> pattern{};
    std::optional<std::string> path{};

    bool operator==(const SearchDetails&) const = default;
};

// SessionStart / SessionEnd 처럼 도구가 없는 세션 이벤트
struct SessionDetails {
    std::optional<std::string> source{};
    std::optional<std::string> reason{};
    std::optional<std::string> transcript_path{};
    std::optional<std::string> cwd{};

    bool operator==(const SessionDetails&) const = default;
};

struct UnknownDetails {
    std::optional<std::string> tool_name{};

    bool operator==(const UnknownDetails&) const = default;
};

struct EventDetails;

// ---------------------------------------------------------------------------
// PermissionDetails
//   PermissionRequest 이벤트가 감싼 도구의 상세 정보.
//   tool_details 는 항상 non-null 이며 깊은 복사로 값 의미를 유지한다.
// ---------------------------------------------------------------------------
struct PermissionDetails {
    std::optional<std::string>    permission_mode{};
    std::unique_ptr<EventDetails> tool_details{};

    PermissionDetails();
    PermissionDetails(std::optional<std::string> mode, EventDetails inner);
    ~PermissionDetails();

    // 깊은 복사 (EventDetails 가 이 시점에 불완전 타입이므로 out-of-line)
    PermissionDetails(const PermissionDetails& other);
    PermissionDetails& operator=(const PermissionDetails& other);
    PermissionDetails(PermissionDetails&&) noexcept;
    PermissionDetails& operator=(PermissionDetails&&) noexcept;

    bool operator==(const PermissionDetails& other) const;
};

// ---------------------------------------------------------------------------
// EventDetails
//   도구별 상세 정보의 닫힌 합 타입. std::visit 로 빠짐없이 처리한다.
// ---------------------------------------------------------------------------
struct EventDetails {
    using Variant = std::variant<BashDetails, FileDetails, SearchDetails, SessionDetails,
                                 PermissionDetails, UnknownDetails>;

    Variant value{UnknownDetails{}};

    bool operator==(const EventDetails&) const = default;

    // "Bash" / "Write" / "Edit" / "Read" / "Glob" / "Grep" / "Session" /
    // "Permission" / "Unknown"
    [[nodiscard]] std::string_view tool_type() const noexcept;

    // Permission 이면 감싼 도구의 상세, 아니면 자기 자신
    [[nodiscard]] const EventDetails& effective() const noexcept;

    // matcher 가 사용하는 파일 경로: 파일 op 의 file_path, 검색 op 의 path
    [[nodiscard]] std::optional<std::string> file_path() const;

    [[nodiscard]] std::optional<std::string> command() const;
};

void to_json(nlohmann::json& j, const EventDetails& details);
void from_json(const nlohmann::json& j, EventDetails& details);

// ---------------------------------------------------------------------------
// Event
//   파싱된 이벤트 봉투. 한 번의 실행 동안만 살아 있다.
// ---------------------------------------------------------------------------
struct Event {
    EventKind                             kind{EventKind::kUnknown};
    std::string                           kind_name{};        // 원문 kind 문자열
    std::string                           session_id{};
    std::chrono::system_clock::time_point timestamp{};        // 없으면 파싱 시각
    std::optional<std::string>            cwd{};
    std::optional<std::string>            tool_name{};
    std::optional<nlohmann::json>         tool_input{};       // 항상 JSON 객체
    std::optional<std::string>            prompt{};
    std::optional<std::string>            permission_mode{};
    std::optional<std::string>            transcript_path{};
    EventDetails                          details{};
    nlohmann::json                        raw{};              // 입력 원문 JSON

    bool operator==(const Event&) const = default;
};

// ---------------------------------------------------------------------------
// extract_details
//   이벤트 종류 + 도구 이름 + tool_input 에서 EventDetails 를 만든다.
//   절대 실패하지 않는다. 인식하지 못한 입력은 UnknownDetails 로 강등된다.
// ---------------------------------------------------------------------------
[[nodiscard]] EventDetails extract_details(EventKind                         kind,
                                           const std::optional<std::string>& tool_name,
                                           const nlohmann::json*             tool_input,
                                           const nlohmann::json&             raw);

// parse_event
//   stdin 원문을 Event 로 파싱한다. 봉투가 깨진 경우에만 ParseError.
[[nodiscard]] std::expected<Event, ParseError> parse_event(std::string_view payload);

// event_from_json
//   이미 파싱된 JSON 값에서 Event 를 만든다.
[[nodiscard]] std::expected<Event, ParseError> event_from_json(const nlohmann::json& j);

// event_to_json
//   원본 raw 를 기반으로 봉투 필드를 정규화해 덮어쓴다. 알 수 없는 필드는 보존된다.
[[nodiscard]] nlohmann::json event_to_json(const Event& event);
