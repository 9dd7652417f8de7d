// ---------------------------------------------------------------------------
// main.cpp
//
// hookgate 진입점. 호출 한 번 = 이벤트 한 개.
//
//   stdin  : 이벤트 JSON 객체 하나
//   stdout : {"continue": bool, "context"?: str, "reason"?: str}
//   exit   : 0 허용/경고/감사, 2 차단 (사유는 stderr 에도), 1 입력/설정 오류
//
// stdout 은 프로토콜 채널이므로 진단 로그는 전부 stderr 로 보낸다.
// ---------------------------------------------------------------------------

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include <unistd.h>

#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

#include "common/types.hpp"
#include "engine/hook_processor.hpp"
#include "event/event.hpp"
#include "logger/audit_logger.hpp"
#include "policy/policy_loader.hpp"
#include "policy/rule_set.hpp"

extern char** environ;

// ---------------------------------------------------------------------------
// Helper: 환경변수 읽기
// ---------------------------------------------------------------------------
namespace {

namespace fs = std::filesystem;

std::optional<std::string> env_opt(const char* name) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val != nullptr && val[0] != '\0') {
        return std::string{val};
    }
    return std::nullopt;
}

std::map<std::string, std::string> env_snapshot() {
    std::map<std::string, std::string> env;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        const std::string kv{*entry};
        const auto        eq = kv.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        env.emplace(kv.substr(0, eq), kv.substr(eq + 1));
    }
    return env;
}

// "~" / "~/..." 를 HOME 기준으로 펼친다
fs::path expand_home(const std::string& path, const std::optional<fs::path>& home) {
    if (!home || path.empty() || path[0] != '~') {
        return fs::path{path};
    }
    if (path.size() == 1) {
        return *home;
    }
    if (path[1] == '/') {
        return *home / path.substr(2);
    }
    return fs::path{path};
}

void init_diagnostics(const std::optional<std::string>& level) {
    auto logger = std::make_shared<spdlog::logger>(
        "hookgate", std::make_shared<spdlog::sinks::stderr_sink_mt>());
    logger->set_pattern("hookgate [%l] %v");
    logger->set_level(spdlog::level::from_str(level.value_or("warn")));
    spdlog::set_default_logger(std::move(logger));
}

int fail(const std::string& message) {
    std::cerr << "hookgate: " << message << '\n';
    return kExitError;
}

int run() {
    const auto level_override = env_opt("HOOKGATE_LOG_LEVEL");
    init_diagnostics(level_override);

    // ── 이벤트 읽기 ─────────────────────────────────────────────────────
    const std::string payload{std::istreambuf_iterator<char>(std::cin),
                              std::istreambuf_iterator<char>()};
    auto event = parse_event(payload);
    if (!event) {
        return fail(event.error().message);
    }

    std::error_code cwd_ec;
    const fs::path project_root = event->cwd && !event->cwd->empty()
                                      ? fs::path{*event->cwd}
                                      : fs::current_path(cwd_ec);

    // ── 설정 로드 ───────────────────────────────────────────────────────
    std::optional<fs::path> home;
    if (auto h = env_opt("HOME")) {
        home = fs::path{*h};
    }
    std::optional<fs::path> explicit_config;
    if (auto c = env_opt("HOOKGATE_CONFIG")) {
        explicit_config = expand_home(*c, home);
    }

    auto config = PolicyLoader::load_for_project(explicit_config, project_root, home);
    if (!config) {
        return fail(config.error().message);
    }
    if (!level_override) {
        spdlog::set_level(spdlog::level::from_str(config->settings.log_level));
    }

    auto rules = RuleSet::build(std::move(config->rules));
    if (!rules) {
        return fail(rules.error().message);
    }

    InvocationContext ctx{};
    ctx.debug        = env_opt("HOOKGATE_DEBUG_LOGS").has_value() || config->settings.debug_logs;
    ctx.project_root = project_root;
    ctx.env          = env_snapshot();

    // ── 판정 ────────────────────────────────────────────────────────────
    const HookProcessor processor{std::make_shared<const RuleSet>(std::move(*rules)),
                                  config->settings};
    HookResult result = processor.process(*event, ctx);

    // ── 감사 로그 (실패해도 판정은 바뀌지 않는다) ─────────────────────────
    fs::path log_path;
    if (auto p = env_opt("HOOKGATE_LOG_PATH")) {
        log_path = expand_home(*p, home);
    } else if (config->settings.log_path) {
        log_path = expand_home(config->settings.log_path->string(), home);
    } else if (home) {
        log_path = *home / ".claude" / "logs" / "hookgate.log";
    }
    if (log_path.empty()) {
        spdlog::warn("main: no audit log path (HOME is unset), record not written");
    } else {
        AuditLogger audit{log_path};
        if (auto appended = audit.append(result.log_entry); !appended) {
            spdlog::warn("main: failed to write audit log {}: {}", log_path.string(), appended.error());
        }
    }

    // ── 응답 ────────────────────────────────────────────────────────────
    const nlohmann::json response = result.response;
    std::cout << response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
    std::cout.flush();

    if (result.decision == Decision::kBlocked) {
        std::cerr << result.response.reason.value_or("blocked by hookgate policy") << '\n';
    }
    return result.exit_code;
}

}  // namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int /*argc*/, char* /*argv*/[]) {
    try {
        return run();
    } catch (const std::exception& ex) {
        // 어떤 경우에도 오류를 차단(2)으로 보고하지 않는다
        return fail(std::string{"internal error: "} + ex.what());
    }
}
