// ---------------------------------------------------------------------------
// matcher.cpp
// ---------------------------------------------------------------------------

#include "policy/matcher.hpp"

#include <algorithm>
#include <vector>

#include <spdlog/spdlog.h>

namespace {

[[nodiscard]] bool contains(const std::vector<std::string>& list, std::string_view value) {
    return std::any_of(list.begin(), list.end(),
                       [value](const std::string& item) { return item == value; });
}

[[nodiscard]] std::string to_forward_slashes(std::string_view path) {
    std::string out{path};
    std::replace(out.begin(), out.end(), '\\', '/');
    return out;
}

// "./src" → "src"
[[nodiscard]] std::string_view strip_dot_prefix(std::string_view path) noexcept {
    while (path.size() >= 2 && path[0] == '.' && path[1] == '/') {
        path.remove_prefix(2);
    }
    return path;
}

[[nodiscard]] bool has_prefix_boundary(std::string_view path, std::string_view prefix) noexcept {
    if (prefix.empty()) {
        return true;
    }
    if (path == prefix) {
        return true;
    }
    return path.size() > prefix.size() && path.starts_with(prefix) && path[prefix.size()] == '/';
}

// 내부 헬퍼: 명령 텍스트. Bash 상세가 없으면 tool_input.command 문자열.
[[nodiscard]] std::optional<std::string> command_text(const Event& event) {
    if (auto cmd = event.details.command()) {
        return cmd;
    }
    if (event.tool_input && event.tool_input->is_object()) {
        const auto it = event.tool_input->find("command");
        if (it != event.tool_input->end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return std::nullopt;
}

[[nodiscard]] std::expected<Pattern, ConfigError> compile_regex(const std::string& pattern,
                                                                std::string_view   field) {
    auto re = Pattern::compile(pattern);
    if (!re) {
        return std::unexpected(ConfigError{
            ConfigErrorCode::kInvalidRegex,
            fmt::format("{} '{}' is not a valid regex: {}", field, pattern, re.error()),
            {},
        });
    }
    return std::move(*re);
}

}  // namespace

// ---------------------------------------------------------------------------
// MatcherResults JSON
// ---------------------------------------------------------------------------
void to_json(nlohmann::json& j, const MatcherResults& results) {
    j = nlohmann::json::object();
    const auto put = [&j](const char* key, const std::optional<bool>& v) {
        if (v) {
            j[key] = *v;
        }
    };
    put("tools_matched", results.tools_matched);
    put("extensions_matched", results.extensions_matched);
    put("directories_matched", results.directories_matched);
    put("operations_matched", results.operations_matched);
    put("command_match_matched", results.command_match_matched);
    put("prompt_match_matched", results.prompt_match_matched);
    put("enabled_when_matched", results.enabled_when_matched);
}

void from_json(const nlohmann::json& j, MatcherResults& results) {
    const auto get = [&j](const char* key) -> std::optional<bool> {
        const auto it = j.find(key);
        if (it == j.end() || !it->is_boolean()) {
            return std::nullopt;
        }
        return it->get<bool>();
    };
    results.tools_matched         = get("tools_matched");
    results.extensions_matched    = get("extensions_matched");
    results.directories_matched   = get("directories_matched");
    results.operations_matched    = get("operations_matched");
    results.command_match_matched = get("command_match_matched");
    results.prompt_match_matched  = get("prompt_match_matched");
    results.enabled_when_matched  = get("enabled_when_matched");
}

// ---------------------------------------------------------------------------
// 경로 / 명령 헬퍼
// ---------------------------------------------------------------------------
std::string path_extension(std::string_view path) {
    const std::string normalized = to_forward_slashes(path);
    std::string_view  name{normalized};
    if (const auto slash = name.rfind('/'); slash != std::string_view::npos) {
        name.remove_prefix(slash + 1);
    }
    const auto dot = name.rfind('.');
    if (dot == std::string_view::npos || dot == 0 || dot + 1 == name.size()) {
        return {};
    }
    return std::string{name.substr(dot)};
}

std::string normalize_directory_pattern(std::string_view pattern) {
    std::string out = to_forward_slashes(pattern);
    for (;;) {
        if (out.ends_with("/**")) {
            out.resize(out.size() - 3);
        } else if (out.ends_with("/*")) {
            out.resize(out.size() - 2);
        } else if (out.ends_with('/')) {
            out.pop_back();
        } else {
            break;
        }
    }
    const std::string_view stripped = strip_dot_prefix(out);
    // "." 는 프로젝트 루트 = 전체
    if (stripped == ".") {
        return {};
    }
    return std::string{stripped};
}

bool directory_matches(std::string_view                  pattern,
                       std::string_view                  file_path,
                       const std::optional<std::string>& cwd) {
    const std::string prefix     = normalize_directory_pattern(pattern);
    const std::string normalized = to_forward_slashes(file_path);
    const std::string_view path  = strip_dot_prefix(normalized);

    if (has_prefix_boundary(path, prefix)) {
        return true;
    }

    // 절대 경로 이벤트: cwd 기준 상대 경로로 다시 비교
    if (cwd && !cwd->empty() && path.starts_with('/')) {
        std::string base = to_forward_slashes(*cwd);
        while (base.size() > 1 && base.ends_with('/')) {
            base.pop_back();
        }
        if (path.size() > base.size() && path.starts_with(base) && path[base.size()] == '/') {
            return has_prefix_boundary(path.substr(base.size() + 1), prefix);
        }
    }
    return false;
}

std::string_view first_token(std::string_view command) noexcept {
    constexpr std::string_view kSpace = " \t\r\n";
    const auto begin = command.find_first_not_of(kSpace);
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = command.find_first_of(kSpace, begin);
    return command.substr(begin, end == std::string_view::npos ? std::string_view::npos : end - begin);
}

// ---------------------------------------------------------------------------
// CompiledMatchers
// ---------------------------------------------------------------------------
std::expected<CompiledMatchers, ConfigError> CompiledMatchers::compile(const Matchers& matchers) {
    CompiledMatchers out{};
    out.source_ = matchers;

    if (matchers.command_match) {
        auto re = compile_regex(*matchers.command_match, "command_match");
        if (!re) {
            return std::unexpected(std::move(re.error()));
        }
        out.command_re_ = std::move(*re);
    }
    if (matchers.prompt_match) {
        auto re = compile_regex(*matchers.prompt_match, "prompt_match");
        if (!re) {
            return std::unexpected(std::move(re.error()));
        }
        out.prompt_re_ = std::move(*re);
    }
    if (matchers.enabled_when) {
        auto expr = Expression::compile(*matchers.enabled_when);
        if (!expr) {
            return std::unexpected(ConfigError{
                ConfigErrorCode::kInvalidExpression,
                fmt::format("enabled_when '{}': {}", *matchers.enabled_when, expr.error()),
                {},
            });
        }
        out.condition_ = std::move(*expr);
    }
    return out;
}

MatchResult CompiledMatchers::evaluate(const Event&             event,
                                       const InvocationContext& ctx,
                                       bool                     trace) const {
    MatchResult result{};
    bool        all = true;

    // predicate 하나 평가. 이미 거짓이고 trace 가 아니면 건너뛴다.
    const auto step = [&](bool present, std::optional<bool>& slot, auto&& test) {
        if (!present || (!all && !trace)) {
            return;
        }
        const bool ok = test();
        slot          = ok;
        all           = all && ok;
    };

    const auto file_path = event.details.file_path();
    const auto command   = command_text(event);

    step(source_.tools.has_value(), result.details.tools_matched, [&] {
        return event.tool_name && contains(*source_.tools, *event.tool_name);
    });

    step(source_.extensions.has_value(), result.details.extensions_matched, [&] {
        if (!file_path) {
            return false;
        }
        const std::string ext = path_extension(*file_path);
        return !ext.empty() && contains(*source_.extensions, ext);
    });

    step(source_.directories.has_value(), result.details.directories_matched, [&] {
        if (!file_path) {
            return false;
        }
        return std::any_of(source_.directories->begin(), source_.directories->end(),
                           [&](const std::string& dir) {
                               return directory_matches(dir, *file_path, event.cwd);
                           });
    });

    step(source_.operations.has_value(), result.details.operations_matched, [&] {
        if (!command) {
            return false;
        }
        const std::string_view token = first_token(*command);
        return !token.empty() && contains(*source_.operations, token);
    });

    step(command_re_.has_value(), result.details.command_match_matched, [&] {
        return command && command_re_->search(*command);
    });

    step(prompt_re_.has_value(), result.details.prompt_match_matched, [&] {
        return event.prompt && prompt_re_->search(*event.prompt);
    });

    step(condition_.has_value(), result.details.enabled_when_matched, [&] {
        return condition_->evaluate(event, ctx.env);
    });

    result.matched = all;
    return result;
}
