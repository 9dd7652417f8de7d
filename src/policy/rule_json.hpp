#pragma once

// ---------------------------------------------------------------------------
// rule_json.hpp
//
// Rule / RuleMetadata 의 JSON 직렬화.
// 감사 로그의 metadata 필드와 규칙 덤프에 사용한다.
//
// JSON 형태는 YAML 설정 스키마와 같다 (actions 블록 포함).
// 설정된 optional 필드만 출력하므로 직렬화 → 역직렬화가 무손실이다.
// 역직렬화는 알 수 없는 필드를 무시한다.
// ---------------------------------------------------------------------------

#include <nlohmann/json.hpp>

#include "policy/rule.hpp"

void to_json(nlohmann::json& j, const RuleMetadata& metadata);
void from_json(const nlohmann::json& j, RuleMetadata& metadata);

void to_json(nlohmann::json& j, const Matchers& matchers);
void from_json(const nlohmann::json& j, Matchers& matchers);

// actions 블록: {"block": true, "block_reason": ...} / {"inject": ...} / {"run": ...} ...
[[nodiscard]] nlohmann::json action_to_json(const Action& action);
[[nodiscard]] Action         action_from_json(const nlohmann::json& j);

void to_json(nlohmann::json& j, const Rule& rule);
void from_json(const nlohmann::json& j, Rule& rule);
