// ---------------------------------------------------------------------------
// policy_loader.cpp
//
// YAML 설정 파일을 로드하여 PolicyConfig 구조체로 파싱한다.
//
// [설계 원칙]
// - All-or-nothing: 파싱 실패 시 부분 설정을 반환하지 않는다.
// - YAML 파일 전체를 로그에 출력하지 않는다.
// - 선택 필드 누락 시 기본값(구조체 기본값)을 적용한다.
// - 규칙마다 actions 블록에 정확히 하나의 액션이 있어야 한다.
//   block: false 는 액션으로 세지 않는다.
//
// [알려진 한계]
// - timeout / script_timeout: 정수(초) 또는 "30s" 형태. 다른 단위는 오류.
// - events / tools 등 목록 필드는 단일 문자열도 길이 1 목록으로 받는다.
// - log_path 의 "~" 확장은 main 에서 수행한다.
// ---------------------------------------------------------------------------

#include "policy/policy_loader.hpp"

#include <charconv>
#include <string>
#include <vector>

#include <fmt/ranges.h>
#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>

#include "policy/pattern.hpp"

namespace {

[[nodiscard]] std::unexpected<ConfigError> schema_error(std::string message,
                                                        std::string rule_name = {}) {
    return std::unexpected(
        ConfigError{ConfigErrorCode::kSchema, std::move(message), std::move(rule_name)});
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: timeout 문자열("30" 또는 "30s")에서 초를 추출.
// 숫자가 없거나 단위가 s 가 아니면 std::nullopt.
// ---------------------------------------------------------------------------
[[nodiscard]] std::optional<std::uint32_t> parse_timeout_str(const std::string& raw) {
    if (raw.empty()) {
        return std::nullopt;
    }
    const char* begin = raw.data();
    const char* end   = raw.data() + raw.size();

    std::uint32_t value{0};
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{}) {
        return std::nullopt;
    }
    const std::string_view unit{ptr, static_cast<std::size_t>(end - ptr)};
    if (!unit.empty() && unit != "s") {
        return std::nullopt;
    }
    return value;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 노드에서 string 목록을 읽는다.
// 단일 스칼라는 길이 1 목록. 노드가 없으면 std::nullopt.
// ---------------------------------------------------------------------------
[[nodiscard]] std::optional<std::vector<std::string>> read_string_list(const YAML::Node& node) {
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    std::vector<std::string> result;
    if (node.IsScalar()) {
        result.push_back(node.as<std::string>());
        return result;
    }
    if (!node.IsSequence()) {
        return std::nullopt;
    }
    result.reserve(node.size());
    for (const auto& item : node) {
        if (item.IsScalar()) {
            result.push_back(item.as<std::string>());
        }
    }
    return result;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 노드에서 bool 값을 읽는다. 없으면 fallback 반환.
// ---------------------------------------------------------------------------
[[nodiscard]] bool read_bool(const YAML::Node& node, bool fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return node.as<bool>();
    } catch (const YAML::Exception&) {
        return fallback;
    }
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 노드에서 string 값을 읽는다. 없으면 std::nullopt.
// ---------------------------------------------------------------------------
[[nodiscard]] std::optional<std::string> read_string(const YAML::Node& node) {
    if (!node || !node.IsScalar()) {
        return std::nullopt;
    }
    try {
        return node.as<std::string>();
    } catch (const YAML::Exception&) {
        return std::nullopt;
    }
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: Settings 파싱
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<Settings, ConfigError> parse_settings(const YAML::Node& node) {
    Settings cfg{};
    if (!node || node.IsNull()) {
        return cfg;
    }
    if (!node.IsMap()) {
        return schema_error("'settings' must be a map");
    }

    cfg.log_level  = read_string(node["log_level"]).value_or(cfg.log_level);
    cfg.fail_open  = read_bool(node["fail_open"], cfg.fail_open);
    cfg.debug_logs = read_bool(node["debug_logs"], cfg.debug_logs);

    if (auto raw = read_string(node["script_timeout"])) {
        const auto secs = parse_timeout_str(*raw);
        if (!secs) {
            return schema_error(fmt::format("settings.script_timeout '{}' is not a number of seconds", *raw));
        }
        cfg.script_timeout = std::chrono::seconds{*secs};
    }

    if (auto raw = read_string(node["max_context_size"])) {
        std::size_t value{0};
        auto [ptr, ec] = std::from_chars(raw->data(), raw->data() + raw->size(), value);
        if (ec != std::errc{} || ptr != raw->data() + raw->size()) {
            return schema_error(fmt::format("settings.max_context_size '{}' is not a byte count", *raw));
        }
        cfg.max_context_size = value;
    }

    if (auto path = read_string(node["log_path"])) {
        cfg.log_path = std::filesystem::path{*path};
    }
    return cfg;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 규칙 필드용 엄격한 읽기.
//   키가 없거나 null 이면 std::nullopt. 키가 있는데 모양이 다르면 schema 오류.
//   predicate 가 "없음" 으로 잘못 읽히면 모든 이벤트에 매칭되므로 조용히 넘기지 않는다.
// ---------------------------------------------------------------------------
using StringResult = std::expected<std::optional<std::string>, ConfigError>;
using ListResult   = std::expected<std::optional<std::vector<std::string>>, ConfigError>;

[[nodiscard]] StringResult read_rule_string(const YAML::Node& node,
                                            std::string_view  key,
                                            const std::string& rule_name) {
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    if (!node.IsScalar()) {
        return schema_error(fmt::format("rule '{}': '{}' must be a string", rule_name, key), rule_name);
    }
    return node.as<std::string>();
}

[[nodiscard]] ListResult read_rule_list(const YAML::Node& node,
                                        std::string_view  key,
                                        const std::string& rule_name) {
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    if (node.IsScalar()) {
        return std::vector<std::string>{node.as<std::string>()};
    }
    if (!node.IsSequence()) {
        return schema_error(
            fmt::format("rule '{}': '{}' must be a string or a list of strings", rule_name, key),
            rule_name);
    }
    std::vector<std::string> result;
    result.reserve(node.size());
    for (std::size_t i = 0; i < node.size(); ++i) {
        const YAML::Node item = node[i];
        if (!item.IsScalar()) {
            return schema_error(fmt::format("rule '{}': '{}' item #{} must be a string", rule_name,
                                            key, i + 1),
                                rule_name);
        }
        result.push_back(item.as<std::string>());
    }
    return result;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: Matchers 파싱
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<Matchers, ConfigError> parse_matchers(const YAML::Node&  node,
                                                                  const std::string& rule_name) {
    Matchers m{};
    if (!node || node.IsNull()) {
        return m;
    }
    if (!node.IsMap()) {
        return schema_error(fmt::format("rule '{}': 'matchers' must be a map", rule_name), rule_name);
    }

    const auto list = [&](const char* key, std::optional<std::vector<std::string>>& out)
        -> std::optional<ConfigError> {
        auto value = read_rule_list(node[key], key, rule_name);
        if (!value) {
            return std::move(value.error());
        }
        out = std::move(*value);
        return std::nullopt;
    };
    const auto scalar = [&](const char* key, std::optional<std::string>& out)
        -> std::optional<ConfigError> {
        auto value = read_rule_string(node[key], key, rule_name);
        if (!value) {
            return std::move(value.error());
        }
        out = std::move(*value);
        return std::nullopt;
    };

    for (auto err : {list("tools", m.tools),
                     list("extensions", m.extensions),
                     list("directories", m.directories),
                     list("operations", m.operations),
                     scalar("command_match", m.command_match),
                     scalar("prompt_match", m.prompt_match),
                     scalar("enabled_when", m.enabled_when)}) {
        if (err) {
            return std::unexpected(std::move(*err));
        }
    }
    return m;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: actions 블록 파싱. 정확히 하나의 액션을 요구한다.
//
//   block: true            (+ block_reason)
//   inject: <path>
//   inject_inline: <text>
//   inject_command: <cmd>
//   run: <script> | {script, trust}
//   block_if_match: <pattern> | {pattern, field}
//   require_fields: [a, b.c]
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<Action, ConfigError> parse_action(const YAML::Node&  node,
                                                              const std::string& rule_name) {
    if (!node || !node.IsMap()) {
        return std::unexpected(ConfigError{ConfigErrorCode::kInvalidAction,
                                           fmt::format("rule '{}' has no actions block", rule_name),
                                           rule_name});
    }

    std::vector<Action>      found;
    std::vector<std::string> keys;

    if (read_bool(node["block"], false)) {
        found.emplace_back(BlockAction{read_string(node["block_reason"])});
        keys.emplace_back("block");
    }
    if (auto path = read_string(node["inject"])) {
        found.emplace_back(InjectAction{InjectFile{*path}});
        keys.emplace_back("inject");
    }
    if (auto text = read_string(node["inject_inline"])) {
        found.emplace_back(InjectAction{InjectInline{*text}});
        keys.emplace_back("inject_inline");
    }
    if (auto cmd = read_string(node["inject_command"])) {
        found.emplace_back(InjectAction{InjectCommand{*cmd}});
        keys.emplace_back("inject_command");
    }
    if (const YAML::Node run = node["run"]; run && !run.IsNull()) {
        RunAction action{};
        if (run.IsScalar()) {
            action.script = run.as<std::string>();
        } else if (run.IsMap()) {
            action.script = read_string(run["script"]).value_or("");
            if (auto trust = read_string(run["trust"])) {
                action.trust = trust_level_from_string(*trust);
                if (!action.trust) {
                    return schema_error(
                        fmt::format("rule '{}': unknown trust level '{}'", rule_name, *trust),
                        rule_name);
                }
            }
        } else {
            return schema_error(fmt::format("rule '{}': 'run' must be a string or map", rule_name),
                                rule_name);
        }
        found.emplace_back(std::move(action));
        keys.emplace_back("run");
    }
    if (const YAML::Node bim = node["block_if_match"]; bim && !bim.IsNull()) {
        BlockIfMatchAction action{};
        if (bim.IsScalar()) {
            action.pattern = bim.as<std::string>();
        } else if (bim.IsMap()) {
            action.pattern = read_string(bim["pattern"]).value_or("");
            action.field   = read_string(bim["field"]);
        } else {
            return schema_error(
                fmt::format("rule '{}': 'block_if_match' must be a string or map", rule_name),
                rule_name);
        }
        found.emplace_back(std::move(action));
        keys.emplace_back("block_if_match");
    }
    if (auto fields = read_string_list(node["require_fields"])) {
        found.emplace_back(RequireFieldsAction{std::move(*fields)});
        keys.emplace_back("require_fields");
    }

    if (found.size() != 1) {
        return std::unexpected(ConfigError{
            ConfigErrorCode::kInvalidAction,
            found.empty()
                ? fmt::format("rule '{}' has no action", rule_name)
                : fmt::format("rule '{}' has {} actions ({}), expected exactly one",
                              rule_name, found.size(), fmt::join(keys, ", ")),
            rule_name,
        });
    }
    return std::move(found.front());
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: RuleMetadata 파싱
// ---------------------------------------------------------------------------
[[nodiscard]] std::optional<RuleMetadata> parse_metadata(const YAML::Node& node) {
    if (!node || !node.IsMap()) {
        return std::nullopt;
    }
    RuleMetadata md{};
    md.author        = read_string(node["author"]);
    md.created_by    = read_string(node["created_by"]);
    md.reason        = read_string(node["reason"]);
    md.last_reviewed = read_string(node["last_reviewed"]);
    md.ticket        = read_string(node["ticket"]);
    md.tags          = read_string_list(node["tags"]);
    if (auto c = read_string(node["confidence"])) {
        md.confidence = confidence_from_string(*c);
        if (!md.confidence) {
            spdlog::warn("policy_loader: unknown metadata.confidence '{}', ignoring", *c);
        }
    }
    return md;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: Rule 파싱
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<Rule, ConfigError> parse_rule(const YAML::Node& node, std::size_t index) {
    if (!node.IsMap()) {
        return schema_error(fmt::format("rule #{} is not a map", index + 1));
    }

    Rule rule{};
    auto name = read_string(node["name"]);
    if (!name) {
        return schema_error(fmt::format("rule #{} is missing 'name'", index + 1));
    }
    rule.name        = std::move(*name);
    rule.description = read_string(node["description"]);
    rule.enabled     = read_bool(node["enabled"], true);
    rule.metadata    = parse_metadata(node["metadata"]);

    auto events = read_rule_list(node["events"], "events", rule.name);
    if (!events) {
        return std::unexpected(std::move(events.error()));
    }
    rule.events = std::move(*events).value_or(std::vector<std::string>{});

    auto matchers = parse_matchers(node["matchers"], rule.name);
    if (!matchers) {
        return std::unexpected(std::move(matchers.error()));
    }
    rule.matchers = std::move(*matchers);

    if (auto mode = read_string(node["mode"])) {
        rule.mode = policy_mode_from_string(*mode);
        if (!rule.mode) {
            return schema_error(
                fmt::format("rule '{}': unknown mode '{}' (expected enforce, warn or audit)",
                            rule.name, *mode),
                rule.name);
        }
    }

    if (const YAML::Node p = node["priority"]; p && p.IsScalar()) {
        try {
            rule.priority = p.as<int>();
        } catch (const YAML::Exception&) {
            return schema_error(fmt::format("rule '{}': priority must be an integer", rule.name),
                                rule.name);
        }
    }

    if (auto raw = read_string(node["timeout"])) {
        const auto secs = parse_timeout_str(*raw);
        if (!secs) {
            return schema_error(
                fmt::format("rule '{}': timeout '{}' is not a number of seconds", rule.name, *raw),
                rule.name);
        }
        rule.timeout = std::chrono::seconds{*secs};
    }

    auto action = parse_action(node["actions"], rule.name);
    if (!action) {
        return std::unexpected(std::move(action.error()));
    }
    rule.action = std::move(*action);
    return rule;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 최상위 맵 → PolicyConfig
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<PolicyConfig, ConfigError> parse_root(const YAML::Node& root,
                                                                  std::string_view  origin) {
    PolicyConfig cfg{};

    // 빈 파일은 빈 설정
    if (!root || root.IsNull()) {
        return cfg;
    }
    if (!root.IsMap()) {
        return schema_error(fmt::format("'{}' is not a valid YAML map (top-level)", origin));
    }

    if (auto version = read_string(root["version"])) {
        static const auto kVersionRe = Pattern::compile(R"(^\d+\.\d+$)");
        if (!kVersionRe || !kVersionRe->search(*version)) {
            return schema_error(
                fmt::format("unsupported version '{}' (expected <major>.<minor>)", *version));
        }
        cfg.version = *version;
    }

    // 각 섹션 파싱 (섹션마다 try-catch, YAML 예외 안전)
    try {
        auto settings = parse_settings(root["settings"]);
        if (!settings) {
            return std::unexpected(std::move(settings.error()));
        }
        cfg.settings = std::move(*settings);
    } catch (const YAML::Exception& e) {
        return schema_error(fmt::format("error parsing 'settings' section: {}", e.what()));
    }

    try {
        const YAML::Node rules_node = root["rules"];
        if (rules_node && !rules_node.IsNull()) {
            if (!rules_node.IsSequence()) {
                return schema_error("'rules' must be a sequence");
            }
            cfg.rules.reserve(rules_node.size());
            std::size_t index = 0;
            for (const auto& rule_node : rules_node) {
                auto rule = parse_rule(rule_node, index++);
                if (!rule) {
                    return std::unexpected(std::move(rule.error()));
                }
                cfg.rules.push_back(std::move(*rule));
            }
        }
    } catch (const YAML::Exception& e) {
        return schema_error(fmt::format("error parsing 'rules' section: {}", e.what()));
    }

    return cfg;
}

[[nodiscard]] std::unexpected<ConfigError> log_and_fail(ConfigError err, std::string_view origin) {
    err.message = fmt::format("{}: {}", origin, err.message);
    spdlog::error("policy_loader: {}", err.message);
    return std::unexpected(std::move(err));
}

}  // namespace

// ---------------------------------------------------------------------------
// PolicyLoader::load 구현
// ---------------------------------------------------------------------------
std::expected<PolicyConfig, ConfigError>
PolicyLoader::load(const std::filesystem::path& config_path) {
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(config_path, ec);
    if (ec) {
        return log_and_fail(
            ConfigError{ConfigErrorCode::kFileNotFound,
                        fmt::format("cannot resolve config path: {}", ec.message()), {}},
            config_path.string());
    }

    spdlog::debug("policy_loader: loading config from '{}'", canonical_path.string());

    YAML::Node root;
    try {
        root = YAML::LoadFile(canonical_path.string());
    } catch (const YAML::BadFile& e) {
        return log_and_fail(
            ConfigError{ConfigErrorCode::kFileNotFound,
                        fmt::format("cannot open file: {}", e.what()), {}},
            canonical_path.string());
    } catch (const YAML::ParserException& e) {
        // 라인 번호 포함한 상세 에러 메시지
        return log_and_fail(
            ConfigError{ConfigErrorCode::kYamlSyntax,
                        fmt::format("YAML parse error at line {}, col {}: {}",
                                    e.mark.line + 1,  // yaml-cpp는 0-based
                                    e.mark.column + 1, e.msg),
                        {}},
            canonical_path.string());
    } catch (const YAML::Exception& e) {
        return log_and_fail(
            ConfigError{ConfigErrorCode::kYamlSyntax, fmt::format("YAML error: {}", e.what()), {}},
            canonical_path.string());
    }

    auto cfg = parse_root(root, canonical_path.string());
    if (!cfg) {
        return log_and_fail(std::move(cfg.error()), canonical_path.string());
    }
    spdlog::debug("policy_loader: {} rule(s) loaded", cfg->rules.size());
    return cfg;
}

std::expected<PolicyConfig, ConfigError>
PolicyLoader::load_from_string(std::string_view yaml, std::string_view origin) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string{yaml});
    } catch (const YAML::ParserException& e) {
        return log_and_fail(
            ConfigError{ConfigErrorCode::kYamlSyntax,
                        fmt::format("YAML parse error at line {}, col {}: {}",
                                    e.mark.line + 1, e.mark.column + 1, e.msg),
                        {}},
            origin);
    } catch (const YAML::Exception& e) {
        return log_and_fail(
            ConfigError{ConfigErrorCode::kYamlSyntax, fmt::format("YAML error: {}", e.what()), {}},
            origin);
    }

    auto cfg = parse_root(root, origin);
    if (!cfg) {
        return log_and_fail(std::move(cfg.error()), origin);
    }
    return cfg;
}

std::optional<std::filesystem::path>
PolicyLoader::discover(const std::optional<std::filesystem::path>& explicit_path,
                       const std::filesystem::path&                project_root,
                       const std::optional<std::filesystem::path>& home_dir) {
    if (explicit_path && !explicit_path->empty()) {
        return explicit_path;
    }

    std::error_code ec;
    const auto project_cfg = project_root / ".claude" / "hooks.yaml";
    if (std::filesystem::is_regular_file(project_cfg, ec)) {
        return project_cfg;
    }
    if (home_dir && !home_dir->empty()) {
        const auto user_cfg = *home_dir / ".claude" / "hooks.yaml";
        if (std::filesystem::is_regular_file(user_cfg, ec)) {
            return user_cfg;
        }
    }
    return std::nullopt;
}

std::expected<PolicyConfig, ConfigError>
PolicyLoader::load_for_project(const std::optional<std::filesystem::path>& explicit_path,
                               const std::filesystem::path&                project_root,
                               const std::optional<std::filesystem::path>& home_dir) {
    const auto path = discover(explicit_path, project_root, home_dir);
    if (!path) {
        spdlog::debug("policy_loader: no configuration found, using empty rule set");
        return PolicyConfig{};
    }
    return load(*path);
}
