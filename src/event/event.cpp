// ---------------------------------------------------------------------------
// event.cpp
//
// hook 이벤트 JSON → Event 파싱, EventDetails 추출 및 JSON 직렬화.
//
// [설계 원칙]
// - nlohmann::json 예외(parse_error, type_error)는 이 파일 밖으로 나가지 않는다.
//   parse_event 는 parse_error 만 ParseError 로 변환하고, 나머지 접근은
//   find()/is_string() 검사로 예외 없이 처리한다.
// - 추출은 절대 실패하지 않는다. 타입이 맞지 않는 필드는 "없음" 으로 본다.
// ---------------------------------------------------------------------------

#include "event/event.hpp"

#include <array>
#include <utility>

#include <spdlog/spdlog.h>

#include "common/time_format.hpp"

namespace {

using json = nlohmann::json;

constexpr std::array<std::pair<std::string_view, EventKind>, 7> kKindNames{{
    {"PreToolUse", EventKind::kPreToolUse},
    {"PostToolUse", EventKind::kPostToolUse},
    {"PermissionRequest", EventKind::kPermissionRequest},
    {"UserPromptSubmit", EventKind::kUserPromptSubmit},
    {"SessionStart", EventKind::kSessionStart},
    {"SessionEnd", EventKind::kSessionEnd},
    {"PreCompact", EventKind::kPreCompact},
}};

// 입력 단편은 최대 이 길이까지만 오류 context 에 남긴다.
constexpr std::size_t kMaxContextSnippet = 128;

// ---------------------------------------------------------------------------
// 내부 헬퍼: 객체의 문자열 필드를 읽는다. 없거나 문자열이 아니면 std::nullopt.
// ---------------------------------------------------------------------------
[[nodiscard]] std::optional<std::string> string_field(const json* obj, const char* key) {
    if (obj == nullptr || !obj->is_object()) {
        return std::nullopt;
    }
    const auto it = obj->find(key);
    if (it == obj->end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

// file_path 우선, 없으면 filePath
[[nodiscard]] std::string file_path_field(const json* input) {
    if (auto p = string_field(input, "file_path")) {
        return *p;
    }
    return string_field(input, "filePath").value_or("");
}

[[nodiscard]] EventDetails extract_tool_details(const std::optional<std::string>& tool_name,
                                                const json*                       input) {
    if (!tool_name) {
        return EventDetails{UnknownDetails{}};
    }
    const std::string& name = *tool_name;

    if (name == "Bash") {
        return EventDetails{BashDetails{string_field(input, "command").value_or("")}};
    }
    if (name == "Write") {
        return EventDetails{FileDetails{FileOp::kWrite, file_path_field(input)}};
    }
    if (name == "Edit") {
        return EventDetails{FileDetails{FileOp::kEdit, file_path_field(input)}};
    }
    if (name == "Read") {
        return EventDetails{FileDetails{FileOp::kRead, file_path_field(input)}};
    }
    if (name == "Glob" || name == "Grep") {
        return EventDetails{SearchDetails{
            name == "Glob" ? SearchOp::kGlob : SearchOp::kGrep,
            string_field(input, "pattern"),
            string_field(input, "path"),
        }};
    }
    return EventDetails{UnknownDetails{tool_name}};
}

// 세션 필드는 tool_input 에 있으면 우선, 없으면 최상위에서 찾는다.
[[nodiscard]] std::optional<std::string> session_field(const json* input, const json& raw,
                                                       const char* key) {
    if (auto v = string_field(input, key)) {
        return v;
    }
    return string_field(&raw, key);
}

[[nodiscard]] std::string snippet(std::string_view payload) {
    if (payload.size() <= kMaxContextSnippet) {
        return std::string{payload};
    }
    return std::string{payload.substr(0, kMaxContextSnippet)} + "...";
}

void put_optional(json& j, const char* key, const std::optional<std::string>& value) {
    if (value) {
        j[key] = *value;
    }
}

}  // namespace

// ---------------------------------------------------------------------------
// EventKind
// ---------------------------------------------------------------------------
std::string_view event_kind_to_string(EventKind kind) noexcept {
    for (const auto& [name, k] : kKindNames) {
        if (k == kind) {
            return name;
        }
    }
    return "Unknown";
}

EventKind event_kind_from_string(std::string_view name) noexcept {
    for (const auto& [n, k] : kKindNames) {
        if (n == name) {
            return k;
        }
    }
    return EventKind::kUnknown;
}

// ---------------------------------------------------------------------------
// PermissionDetails
// ---------------------------------------------------------------------------
PermissionDetails::PermissionDetails()
    : tool_details(std::make_unique<EventDetails>()) {}

PermissionDetails::PermissionDetails(std::optional<std::string> mode, EventDetails inner)
    : permission_mode(std::move(mode)),
      tool_details(std::make_unique<EventDetails>(std::move(inner))) {}

PermissionDetails::~PermissionDetails() = default;

PermissionDetails::PermissionDetails(const PermissionDetails& other)
    : permission_mode(other.permission_mode),
      tool_details(other.tool_details ? std::make_unique<EventDetails>(*other.tool_details)
                                      : std::make_unique<EventDetails>()) {}

PermissionDetails& PermissionDetails::operator=(const PermissionDetails& other) {
    if (this != &other) {
        PermissionDetails copy{other};
        *this = std::move(copy);
    }
    return *this;
}

PermissionDetails::PermissionDetails(PermissionDetails&&) noexcept            = default;
PermissionDetails& PermissionDetails::operator=(PermissionDetails&&) noexcept = default;

bool PermissionDetails::operator==(const PermissionDetails& other) const {
    if (permission_mode != other.permission_mode) {
        return false;
    }
    if (!tool_details || !other.tool_details) {
        return tool_details == other.tool_details;
    }
    return *tool_details == *other.tool_details;
}

// ---------------------------------------------------------------------------
// EventDetails
// ---------------------------------------------------------------------------
std::string_view EventDetails::tool_type() const noexcept {
    struct Visitor {
        std::string_view operator()(const BashDetails&) const noexcept { return "Bash"; }
        std::string_view operator()(const FileDetails& d) const noexcept {
            switch (d.op) {
                case FileOp::kWrite: return "Write";
                case FileOp::kEdit:  return "Edit";
                case FileOp::kRead:  return "Read";
            }
            return "Read";
        }
        std::string_view operator()(const SearchDetails& d) const noexcept {
            return d.op == SearchOp::kGlob ? "Glob" : "Grep";
        }
        std::string_view operator()(const SessionDetails&) const noexcept { return "Session"; }
        std::string_view operator()(const PermissionDetails&) const noexcept { return "Permission"; }
        std::string_view operator()(const UnknownDetails&) const noexcept { return "Unknown"; }
    };
    return std::visit(Visitor{}, value);
}

const EventDetails& EventDetails::effective() const noexcept {
    if (const auto* perm = std::get_if<PermissionDetails>(&value)) {
        if (perm->tool_details) {
            return *perm->tool_details;
        }
    }
    return *this;
}

std::optional<std::string> EventDetails::file_path() const {
    const EventDetails& inner = effective();
    if (const auto* file = std::get_if<FileDetails>(&inner.value)) {
        if (file->file_path.empty()) {
            return std::nullopt;
        }
        return file->file_path;
    }
    if (const auto* search = std::get_if<SearchDetails>(&inner.value)) {
        return search->path;
    }
    return std::nullopt;
}

std::optional<std::string> EventDetails::command() const {
    const EventDetails& inner = effective();
    if (const auto* bash = std::get_if<BashDetails>(&inner.value)) {
        return bash->command;
    }
    return std::nullopt;
}

void to_json(nlohmann::json& j, const EventDetails& details) {
    j              = json::object();
    j["tool_type"] = std::string{details.tool_type()};

    std::visit(
        [&j](const auto& d) {
            using T = std::decay_t<decltype(d)>;
            if constexpr (std::is_same_v<T, BashDetails>) {
                j["command"] = d.command;
            } else if constexpr (std::is_same_v<T, FileDetails>) {
                j["file_path"] = d.file_path;
            } else if constexpr (std::is_same_v<T, SearchDetails>) {
                put_optional(j, "pattern", d.pattern);
                put_optional(j, "path", d.path);
            } else if constexpr (std::is_same_v<T, SessionDetails>) {
                put_optional(j, "source", d.source);
                put_optional(j, "reason", d.reason);
                put_optional(j, "transcript_path", d.transcript_path);
                put_optional(j, "cwd", d.cwd);
            } else if constexpr (std::is_same_v<T, PermissionDetails>) {
                put_optional(j, "permission_mode", d.permission_mode);
                j["tool_details"] = d.tool_details ? json(*d.tool_details)
                                                   : json(EventDetails{});
            } else {
                put_optional(j, "tool_name", d.tool_name);
            }
        },
        details.value);
}

void from_json(const nlohmann::json& j, EventDetails& details) {
    const auto type = string_field(&j, "tool_type").value_or("Unknown");

    if (type == "Bash") {
        details.value = BashDetails{string_field(&j, "command").value_or("")};
    } else if (type == "Write" || type == "Edit" || type == "Read") {
        const FileOp op = type == "Write" ? FileOp::kWrite
                        : type == "Edit"  ? FileOp::kEdit
                                          : FileOp::kRead;
        details.value = FileDetails{op, file_path_field(&j)};
    } else if (type == "Glob" || type == "Grep") {
        details.value = SearchDetails{
            type == "Glob" ? SearchOp::kGlob : SearchOp::kGrep,
            string_field(&j, "pattern"),
            string_field(&j, "path"),
        };
    } else if (type == "Session") {
        details.value = SessionDetails{
            string_field(&j, "source"),
            string_field(&j, "reason"),
            string_field(&j, "transcript_path"),
            string_field(&j, "cwd"),
        };
    } else if (type == "Permission") {
        EventDetails inner{};
        const auto it = j.find("tool_details");
        if (it != j.end() && it->is_object()) {
            from_json(*it, inner);
        }
        details.value = PermissionDetails{string_field(&j, "permission_mode"), std::move(inner)};
    } else {
        details.value = UnknownDetails{string_field(&j, "tool_name")};
    }
}

// ---------------------------------------------------------------------------
// extract_details
// ---------------------------------------------------------------------------
EventDetails extract_details(EventKind                         kind,
                             const std::optional<std::string>& tool_name,
                             const nlohmann::json*             tool_input,
                             const nlohmann::json&             raw) {
    if (kind == EventKind::kPermissionRequest) {
        // 한 단계만 감싼다. 내부 도구가 또 Permission 이 되는 경로는 없다.
        auto mode = string_field(&raw, "permission_mode");
        return EventDetails{PermissionDetails{std::move(mode),
                                              extract_tool_details(tool_name, tool_input)}};
    }
    if (tool_name) {
        return extract_tool_details(tool_name, tool_input);
    }
    if (kind == EventKind::kSessionStart || kind == EventKind::kSessionEnd) {
        return EventDetails{SessionDetails{
            session_field(tool_input, raw, "source"),
            session_field(tool_input, raw, "reason"),
            session_field(tool_input, raw, "transcript_path"),
            session_field(tool_input, raw, "cwd"),
        }};
    }
    return EventDetails{UnknownDetails{}};
}

// ---------------------------------------------------------------------------
// event_from_json
// ---------------------------------------------------------------------------
std::expected<Event, ParseError> event_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return std::unexpected(ParseError{
            ParseErrorCode::kInvalidEnvelope,
            "event payload is not a JSON object",
            j.type_name(),
        });
    }

    Event event{};

    auto kind_it = j.find("hook_event_name");
    if (kind_it == j.end()) {
        kind_it = j.find("event_type");
    }
    if (kind_it == j.end()) {
        return std::unexpected(ParseError{
            ParseErrorCode::kInvalidEnvelope,
            "missing hook_event_name",
            {},
        });
    }
    if (!kind_it->is_string()) {
        return std::unexpected(ParseError{
            ParseErrorCode::kInvalidEnvelope,
            "hook_event_name is not a string",
            kind_it->dump(),
        });
    }
    event.kind_name = kind_it->get<std::string>();
    event.kind      = event_kind_from_string(event.kind_name);

    auto session = string_field(&j, "session_id");
    if (!session) {
        return std::unexpected(ParseError{
            ParseErrorCode::kInvalidEnvelope,
            "missing or non-string session_id",
            {},
        });
    }
    event.session_id = std::move(*session);

    event.timestamp = now_micros();
    if (auto ts = string_field(&j, "timestamp")) {
        if (auto parsed = parse_iso8601(*ts)) {
            event.timestamp = *parsed;
        } else {
            spdlog::debug("event: unparseable timestamp '{}', using current time", *ts);
        }
    }

    event.cwd             = string_field(&j, "cwd");
    event.tool_name       = string_field(&j, "tool_name");
    event.permission_mode = string_field(&j, "permission_mode");
    event.transcript_path = string_field(&j, "transcript_path");

    const auto input_it = j.find("tool_input");
    if (input_it != j.end() && input_it->is_object()) {
        event.tool_input = *input_it;
    }
    const json* input = event.tool_input ? &*event.tool_input : nullptr;

    event.prompt = string_field(&j, "prompt");
    if (!event.prompt) {
        event.prompt = string_field(input, "prompt");
    }

    event.details = extract_details(event.kind, event.tool_name, input, j);
    event.raw     = j;
    return event;
}

// ---------------------------------------------------------------------------
// parse_event
// ---------------------------------------------------------------------------
std::expected<Event, ParseError> parse_event(std::string_view payload) {
    if (payload.find_first_not_of(" \t\r\n") == std::string_view::npos) {
        return std::unexpected(ParseError{
            ParseErrorCode::kEmptyInput,
            "empty event payload",
            {},
        });
    }

    json j;
    try {
        j = json::parse(payload);
    } catch (const json::parse_error& e) {
        return std::unexpected(ParseError{
            ParseErrorCode::kMalformedJson,
            fmt::format("invalid JSON at byte {}: {}", e.byte, e.what()),
            snippet(payload),
        });
    }
    return event_from_json(j);
}

// ---------------------------------------------------------------------------
// event_to_json
// ---------------------------------------------------------------------------
nlohmann::json event_to_json(const Event& event) {
    json out = event.raw.is_object() ? event.raw : json::object();

    out["hook_event_name"] = event.kind_name;
    if (out.contains("event_type")) {
        out["event_type"] = event.kind_name;
    }
    out["session_id"] = event.session_id;
    out["timestamp"]  = format_iso8601(event.timestamp);

    const auto set_or_erase = [&out](const char* key, const std::optional<std::string>& value) {
        if (value) {
            out[key] = *value;
        } else {
            out.erase(key);
        }
    };
    set_or_erase("cwd", event.cwd);
    set_or_erase("tool_name", event.tool_name);
    set_or_erase("permission_mode", event.permission_mode);
    set_or_erase("transcript_path", event.transcript_path);

    if (event.tool_input) {
        out["tool_input"] = *event.tool_input;
    } else {
        out.erase("tool_input");
    }
    if (event.prompt) {
        out["prompt"] = *event.prompt;
    }
    return out;
}
