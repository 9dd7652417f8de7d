// ---------------------------------------------------------------------------
// action_executor.cpp
//
// [검증 스크립트 프로토콜]
//   stdin  : 원본 이벤트 JSON
//   env    : HOOKGATE_EVENT, HOOKGATE_TOOL_NAME, HOOKGATE_SESSION_ID,
//            HOOKGATE_RULE_NAME, HOOKGATE_PROJECT_DIR
//   stdout : JSON 객체 정확히 하나 {"continue": bool, "context"?: str, "reason"?: str}
//   exit   : 0 이 아니면 검증 실패
//
// 출력 앞뒤 공백은 허용한다. 객체 두 개, JSON 이 아닌 출력, continue 누락 또는
// bool 이 아닌 continue 는 모두 검증 실패다.
// ---------------------------------------------------------------------------

#include "action/action_executor.hpp"

#include <array>
#include <fstream>
#include <sstream>
#include <vector>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace {

using json = nlohmann::json;

// 검증 스크립트 출력은 컨텍스트 상한 + JSON 봉투 여유분까지 받는다.
constexpr std::size_t kOutputEnvelopeSlack = 64 * 1024;

// block_if_match 기본 필드 탐색 순서
constexpr std::array<std::string_view, 4> kDefaultMatchFields{
    "content", "new_string", "newString", "command"};

// 내부 헬퍼: 바이트 상한으로 자른다. UTF-8 연속 바이트 중간에서 자르지 않는다.
[[nodiscard]] std::string truncate_utf8(std::string text, std::size_t limit) {
    if (text.size() <= limit) {
        return text;
    }
    std::size_t cut = limit;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    text.resize(cut);
    return text;
}

[[nodiscard]] std::string_view trim(std::string_view s) noexcept {
    constexpr std::string_view kSpace = " \t\r\n";
    const auto begin = s.find_first_not_of(kSpace);
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = s.find_last_not_of(kSpace);
    return s.substr(begin, end - begin + 1);
}

[[nodiscard]] std::optional<std::string> read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    if (in.bad()) {
        return std::nullopt;
    }
    return oss.str();
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 검증 스크립트 stdout 을 Response 로 해석한다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<Response, std::string> parse_validator_output(std::string_view output) {
    const std::string_view body = trim(output);
    if (body.empty()) {
        return std::unexpected(std::string{"validator produced no output"});
    }

    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error& e) {
        return std::unexpected(fmt::format("validator output is not a single JSON object: {}", e.what()));
    }
    if (!j.is_object()) {
        return std::unexpected(
            fmt::format("validator output must be a JSON object, got {}", j.type_name()));
    }
    const auto cont = j.find("continue");
    if (cont == j.end() || !cont->is_boolean()) {
        return std::unexpected(std::string{"validator output is missing boolean 'continue'"});
    }

    Response response{};
    response.continue_ = cont->get<bool>();
    if (const auto it = j.find("context"); it != j.end() && it->is_string()) {
        response.context = it->get<std::string>();
    }
    if (const auto it = j.find("reason"); it != j.end() && it->is_string()) {
        response.reason = it->get<std::string>();
    }
    return response;
}

[[nodiscard]] ActionOutcome blocked(std::string reason) {
    return ActionOutcome{Decision::kBlocked, Response::block(std::move(reason)), std::nullopt,
                         std::nullopt};
}

}  // namespace

const nlohmann::json* find_input_field(const Event& event, std::string_view dotted) {
    if (!event.tool_input || dotted.empty()) {
        return nullptr;
    }
    const json* cur = &*event.tool_input;
    std::size_t start = 0;
    while (start <= dotted.size()) {
        const auto dot = dotted.find('.', start);
        const std::string key{dotted.substr(start, dot == std::string_view::npos ? std::string_view::npos
                                                                                 : dot - start)};
        if (!cur->is_object()) {
            return nullptr;
        }
        const auto it = cur->find(key);
        if (it == cur->end()) {
            return nullptr;
        }
        cur = &*it;
        if (dot == std::string_view::npos) {
            break;
        }
        start = dot + 1;
    }
    return cur->is_null() ? nullptr : cur;
}

// ---------------------------------------------------------------------------
// ActionExecutor
// ---------------------------------------------------------------------------
ActionExecutor::ActionExecutor(Settings settings, ProcessRunner runner)
    : settings_(std::move(settings)), runner_(std::move(runner)) {}

std::string ActionExecutor::warning_text(std::string_view rule_name, std::string_view reason) {
    return fmt::format(
        "[WARNING] Rule '{}' would have blocked this operation: {}\n"
        "This rule is in 'warn' mode - operation will proceed.",
        rule_name, reason);
}

std::string ActionExecutor::default_block_reason(const Rule& rule) {
    return fmt::format("Blocked by rule '{}': {}", rule.name,
                       rule.description.value_or("no description"));
}

ActionOutcome ActionExecutor::execute(const Resolution&        resolution,
                                      const Event&             event,
                                      const InvocationContext& ctx) const {
    if (resolution.governing == nullptr) {
        return ActionOutcome{};
    }
    const CompiledRule& rule = *resolution.governing;

    switch (resolution.mode) {
        case PolicyMode::kAudit:
            spdlog::debug("action_executor: rule '{}' is audit-only, no action executed", rule.name());
            return ActionOutcome{Decision::kAudited, Response::allow(), std::nullopt, std::nullopt};

        case PolicyMode::kEnforce:
            return run_action(rule, event, ctx);

        case PolicyMode::kWarn: {
            ActionOutcome outcome = run_action(rule, event, ctx);
            if (outcome.decision == Decision::kBlocked) {
                const std::string reason = outcome.response.reason.value_or(default_block_reason(rule.rule));
                outcome.decision = Decision::kWarned;
                outcome.response = Response::inject(warning_text(rule.name(), reason));
            } else if (outcome.response.context) {
                outcome.decision = Decision::kWarned;
            } else {
                outcome.decision = Decision::kAllowed;
            }
            return outcome;
        }
    }
    return ActionOutcome{};
}

ActionOutcome ActionExecutor::run_action(const CompiledRule&       rule,
                                         const Event&             event,
                                         const InvocationContext& ctx) const {
    return std::visit(
        [&](const auto& action) -> ActionOutcome {
            using T = std::decay_t<decltype(action)>;

            if constexpr (std::is_same_v<T, BlockAction>) {
                return blocked(action.reason.value_or(default_block_reason(rule.rule)));

            } else if constexpr (std::is_same_v<T, InjectAction>) {
                return run_inject(rule, action, event, ctx);

            } else if constexpr (std::is_same_v<T, RunAction>) {
                return run_validator(rule, action, event, ctx);

            } else if constexpr (std::is_same_v<T, BlockIfMatchAction>) {
                // 패턴 없이는 검사할 수 없으므로 통과시키지 않는다
                if (!rule.action_pattern) {
                    return blocked(fmt::format("Blocked by rule '{}': block_if_match pattern is not compiled",
                                               rule.name()));
                }
                const auto try_field = [&](std::string_view field) -> std::optional<ActionOutcome> {
                    const json* value = find_input_field(event, field);
                    if (value == nullptr || !value->is_string()) {
                        return std::nullopt;
                    }
                    if (!rule.action_pattern->search(value->get_ref<const std::string&>())) {
                        return ActionOutcome{};
                    }
                    return blocked(fmt::format("Blocked by rule '{}': field '{}' matches pattern '{}'",
                                               rule.name(), field, action.pattern));
                };

                if (action.field) {
                    return try_field(*action.field).value_or(ActionOutcome{});
                }
                // 기본 순서에서 처음 존재하는 문자열 필드 하나만 검사한다.
                for (const auto field : kDefaultMatchFields) {
                    if (auto outcome = try_field(field)) {
                        return *outcome;
                    }
                }
                return ActionOutcome{};

            } else {
                std::vector<std::string> missing;
                for (const auto& field : action.fields) {
                    if (find_input_field(event, field) == nullptr) {
                        missing.push_back(field);
                    }
                }
                if (missing.empty()) {
                    return ActionOutcome{};
                }
                return blocked(fmt::format("Blocked by rule '{}': missing required field(s): {}",
                                           rule.name(), fmt::join(missing, ", ")));
            }
        },
        rule.rule.action);
}

ActionOutcome ActionExecutor::run_inject(const CompiledRule&       rule,
                                         const InjectAction&      action,
                                         const Event&             event,
                                         const InvocationContext& ctx) const {
    std::optional<std::string> content;
    std::string                failure;

    if (const auto* file = std::get_if<InjectFile>(&action.source)) {
        std::filesystem::path path{file->path};
        if (path.is_relative()) {
            path = ctx.project_root / path;
        }
        content = read_file(path);
        if (!content) {
            failure = fmt::format("cannot read inject file '{}'", path.string());
        }
    } else if (const auto* inline_text = std::get_if<InjectInline>(&action.source)) {
        content = inline_text->text;
    } else if (const auto* cmd = std::get_if<InjectCommand>(&action.source)) {
        // 명령 실패는 검증 스크립트 실패와 같은 fail_open 정책을 따른다
        auto result = runner_.run(make_request(rule, cmd->command, event, ctx));
        if (!result) {
            return on_failure(fmt::format("inject command '{}' failed: {}", cmd->command,
                                          result.error().message));
        }
        if (result->exit_code != 0) {
            return on_failure(fmt::format("inject command '{}' exited with code {}", cmd->command,
                                          result->exit_code));
        }
        content = std::move(result->stdout_data);
    }

    if (!content) {
        spdlog::warn("action_executor: rule '{}': {}", rule.name(), failure);
        return ActionOutcome{Decision::kAllowed, Response::allow(), failure, std::nullopt};
    }
    if (content->size() > settings_.max_context_size) {
        spdlog::debug("action_executor: rule '{}': context truncated from {} to {} bytes",
                      rule.name(), content->size(), settings_.max_context_size);
        *content = truncate_utf8(std::move(*content), settings_.max_context_size);
    }
    if (content->empty()) {
        return ActionOutcome{};
    }
    return ActionOutcome{Decision::kAllowed, Response::inject(std::move(*content)), std::nullopt,
                         std::nullopt};
}

ActionOutcome ActionExecutor::run_validator(const CompiledRule&       rule,
                                            const RunAction&         action,
                                            const Event&             event,
                                            const InvocationContext& ctx) const {
    const TrustLevel trust = action.trust.value_or(TrustLevel::kLocal);

    const auto with_trust = [trust](ActionOutcome outcome) {
        outcome.trust_level = trust;
        return outcome;
    };

    auto result = runner_.run(make_request(rule, action.script, event, ctx));
    if (!result) {
        return with_trust(on_failure(
            fmt::format("validator '{}' failed: {}", action.script, result.error().message)));
    }
    if (result->exit_code != 0) {
        return with_trust(on_failure(
            fmt::format("validator '{}' exited with code {}", action.script, result->exit_code)));
    }

    auto response = parse_validator_output(result->stdout_data);
    if (!response) {
        return with_trust(on_failure(fmt::format("validator '{}': {}", action.script, response.error())));
    }

    if (!response->continue_) {
        std::string reason = response->reason.value_or(
            fmt::format("Blocked by validator '{}' (rule '{}')", action.script, rule.name()));
        return with_trust(blocked(std::move(reason)));
    }
    if (response->context && !response->context->empty()) {
        return with_trust(ActionOutcome{
            Decision::kAllowed,
            Response::inject(truncate_utf8(std::move(*response->context), settings_.max_context_size)),
            std::nullopt,
            std::nullopt,
        });
    }
    return with_trust(ActionOutcome{});
}

ActionOutcome ActionExecutor::on_failure(std::string failure) const {
    spdlog::warn("action_executor: {}", failure);
    if (settings_.fail_open) {
        return ActionOutcome{Decision::kAllowed, Response::allow(), std::move(failure), std::nullopt};
    }
    std::string reason = fmt::format("Validator failure (fail_open disabled): {}", failure);
    return ActionOutcome{Decision::kBlocked, Response::block(std::move(reason)), std::move(failure),
                         std::nullopt};
}

std::chrono::milliseconds ActionExecutor::timeout_for(const Rule& rule) const noexcept {
    return rule.timeout.value_or(settings_.script_timeout);
}

ProcessRequest ActionExecutor::make_request(const CompiledRule&       rule,
                                            std::string              command,
                                            const Event&             event,
                                            const InvocationContext& ctx) const {
    ProcessRequest request{};
    request.command          = std::move(command);
    request.timeout          = timeout_for(rule.rule);
    request.max_output_bytes = settings_.max_context_size + kOutputEnvelopeSlack;

    // project root 가 없으면 ProcessRunner 가 kSpawnFailed 로 거부한다 (fail_open 정책 적용)
    request.working_dir = ctx.project_root;

    request.stdin_data = event.raw.is_object() ? event.raw.dump() : event_to_json(event).dump();
    request.env        = {
        {"HOOKGATE_EVENT", event.kind_name},
        {"HOOKGATE_TOOL_NAME", event.tool_name.value_or("")},
        {"HOOKGATE_SESSION_ID", event.session_id},
        {"HOOKGATE_RULE_NAME", rule.name()},
        {"HOOKGATE_PROJECT_DIR", ctx.project_root.string()},
    };
    return request;
}
