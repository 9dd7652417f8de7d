// ---------------------------------------------------------------------------
// test_rule_set.cpp
//
// RuleSet::build / applicable 단위 테스트.
//
// [테스트 범위]
// - priority 내림차순 정렬, 동률은 선언 순서 (안정 정렬)
// - 비활성 규칙 제거 (절대 매칭되지 않음). 제거 전 regex / 조건식 검증은 그대로 받는다
// - 이름 형식 / 중복 이름 (비활성 규칙 포함) → ConfigError
// - 액션 내용 검증 (빈 스크립트, 빈 필드 목록, 잘못된 block_if_match 패턴)
// - events 제한에 따른 applicable() 필터링
// - Rule JSON 직렬화 왕복
// ---------------------------------------------------------------------------

#include "event/event.hpp"
#include "policy/rule_json.hpp"
#include "policy/rule_set.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace {

Rule make_rule(const std::string& name, std::optional<int> priority = std::nullopt) {
    Rule r{};
    r.name     = name;
    r.priority = priority;
    r.action   = BlockAction{};
    return r;
}

std::vector<std::string> names(const RuleSet& set) {
    std::vector<std::string> out;
    for (const auto& r : set.rules()) {
        out.push_back(r.name());
    }
    return out;
}

Event event_of_kind(const std::string& kind) {
    auto event = event_from_json(nlohmann::json{{"hook_event_name", kind}, {"session_id", "s"}});
    EXPECT_TRUE(event.has_value());
    return event ? std::move(*event) : Event{};
}

}  // namespace

// ===========================================================================
// 정렬
// ===========================================================================

TEST(RuleSet, SortsByPriorityDescendingStable) {
    auto set = RuleSet::build({
        make_rule("low", 1),
        make_rule("default-a"),
        make_rule("high", 100),
        make_rule("default-b"),
        make_rule("negative", -5),
        make_rule("high-2", 100),
    });
    ASSERT_TRUE(set.has_value()) << set.error().message;
    EXPECT_EQ(names(*set), (std::vector<std::string>{"high", "high-2", "low", "default-a",
                                                     "default-b", "negative"}));
    // 선언 순서는 원본 인덱스로 보존된다
    EXPECT_EQ(set->rules().front().declaration_index, 2U);
}

TEST(RuleSet, EmptyInputBuildsEmptySet) {
    auto set = RuleSet::build({});
    ASSERT_TRUE(set.has_value());
    EXPECT_TRUE(set->empty());
    EXPECT_TRUE(set->applicable(event_of_kind("PreToolUse")).empty());
}

// ===========================================================================
// 비활성 규칙
// ===========================================================================

TEST(RuleSet, DisabledRulesAreDropped) {
    auto disabled    = make_rule("off", 1000);
    disabled.enabled = false;
    auto set         = RuleSet::build({make_rule("on"), disabled});
    ASSERT_TRUE(set.has_value());
    EXPECT_EQ(names(*set), std::vector<std::string>{"on"});
}

TEST(RuleSet, DisabledRuleWithInvalidRegexIsRejected) {
    auto disabled                   = make_rule("off");
    disabled.enabled                = false;
    disabled.matchers.command_match = "([";
    auto set                        = RuleSet::build({disabled});
    ASSERT_FALSE(set.has_value());
    EXPECT_EQ(set.error().code, ConfigErrorCode::kInvalidRegex);
    EXPECT_EQ(set.error().rule_name, "off");
}

TEST(RuleSet, DisabledRuleWithInvalidExpressionIsRejected) {
    auto disabled                  = make_rule("off");
    disabled.enabled               = false;
    disabled.matchers.enabled_when = "tool.name ==";
    auto set                       = RuleSet::build({disabled});
    ASSERT_FALSE(set.has_value());
    EXPECT_EQ(set.error().code, ConfigErrorCode::kInvalidExpression);
    EXPECT_EQ(set.error().rule_name, "off");
}

// ===========================================================================
// 검증 오류
// ===========================================================================

TEST(RuleSet, InvalidNameIsRejected) {
    for (const std::string bad : {"", "has space", "dots.are.bad", "slash/no", "ümlaut"}) {
        auto set = RuleSet::build({make_rule(bad)});
        ASSERT_FALSE(set.has_value()) << bad;
        EXPECT_EQ(set.error().code, ConfigErrorCode::kInvalidRuleName);
    }
    EXPECT_TRUE(is_valid_rule_name("Block_rm-rf-2"));
}

TEST(RuleSet, DuplicateNameIsRejectedEvenWhenDisabled) {
    auto dup    = make_rule("same");
    dup.enabled = false;
    auto set    = RuleSet::build({make_rule("same"), dup});
    ASSERT_FALSE(set.has_value());
    EXPECT_EQ(set.error().code, ConfigErrorCode::kDuplicateRule);
    EXPECT_EQ(set.error().rule_name, "same");
}

TEST(RuleSet, EmptyActionContentsAreRejected) {
    auto run   = make_rule("run");
    run.action = RunAction{"", std::nullopt};
    EXPECT_EQ(RuleSet::build({run}).error().code, ConfigErrorCode::kInvalidAction);

    auto fields   = make_rule("fields");
    fields.action = RequireFieldsAction{};
    EXPECT_EQ(RuleSet::build({fields}).error().code, ConfigErrorCode::kInvalidAction);

    auto inject   = make_rule("inject");
    inject.action = InjectAction{InjectFile{""}};
    EXPECT_EQ(RuleSet::build({inject}).error().code, ConfigErrorCode::kInvalidAction);
}

TEST(RuleSet, InvalidBlockIfMatchPatternIsRejected) {
    auto rule   = make_rule("bim");
    rule.action = BlockIfMatchAction{std::nullopt, "(unclosed"};
    auto set    = RuleSet::build({rule});
    ASSERT_FALSE(set.has_value());
    EXPECT_EQ(set.error().code, ConfigErrorCode::kInvalidRegex);
    EXPECT_EQ(set.error().rule_name, "bim");
}

TEST(RuleSet, MatcherErrorsCarryRuleName) {
    auto rule                  = make_rule("cond");
    rule.matchers.enabled_when = "nope.nope";
    auto set                   = RuleSet::build({rule});
    ASSERT_FALSE(set.has_value());
    EXPECT_EQ(set.error().code, ConfigErrorCode::kInvalidExpression);
    EXPECT_EQ(set.error().rule_name, "cond");
    EXPECT_NE(set.error().message.find("cond"), std::string::npos);
}

TEST(RuleSet, ValidBlockIfMatchIsCompiledOnce) {
    auto rule   = make_rule("bim");
    rule.action = BlockIfMatchAction{"content", "AKIA[0-9A-Z]{16}"};
    auto set    = RuleSet::build({rule});
    ASSERT_TRUE(set.has_value());
    ASSERT_TRUE(set->rules().front().action_pattern.has_value());
}

// ===========================================================================
// applicable
// ===========================================================================

TEST(RuleSet, ApplicableFiltersByEventKindName) {
    auto pre    = make_rule("pre", 10);
    pre.events  = {"PreToolUse"};
    auto post   = make_rule("post", 20);
    post.events = {"PostToolUse", "PreToolUse"};
    auto any    = make_rule("any", 5);
    auto custom = make_rule("custom");
    custom.events = {"Notification"};

    auto set = RuleSet::build({pre, post, any, custom});
    ASSERT_TRUE(set.has_value());

    const auto for_pre = set->applicable(event_of_kind("PreToolUse"));
    ASSERT_EQ(for_pre.size(), 3U);
    EXPECT_EQ(for_pre[0]->name(), "post");
    EXPECT_EQ(for_pre[1]->name(), "pre");
    EXPECT_EQ(for_pre[2]->name(), "any");

    // 알 수 없는 이벤트 종류도 원문 이름으로 매칭된다
    const auto for_custom = set->applicable(event_of_kind("Notification"));
    ASSERT_EQ(for_custom.size(), 2U);
    EXPECT_EQ(for_custom[0]->name(), "any");
    EXPECT_EQ(for_custom[1]->name(), "custom");
}

// ===========================================================================
// Rule JSON
// ===========================================================================

TEST(RuleJson, RoundTripsEveryActionKind) {
    const std::vector<Action> actions{
        BlockAction{"no"},
        InjectAction{InjectFile{"docs/style.md"}},
        InjectAction{InjectInline{"be careful"}},
        InjectAction{InjectCommand{"git log -1"}},
        RunAction{"./check.sh", TrustLevel::kVerified},
        BlockIfMatchAction{"content", "secret"},
        RequireFieldsAction{{"file_path", "meta.owner"}},
    };
    for (const auto& action : actions) {
        Rule rule        = make_rule("r", 7);
        rule.action      = action;
        rule.description = "desc";
        rule.events      = {"PreToolUse"};
        rule.mode        = PolicyMode::kWarn;
        rule.timeout     = std::chrono::milliseconds{5000};
        rule.matchers.tools = std::vector<std::string>{"Bash"};
        rule.metadata    = RuleMetadata{"me", std::nullopt, "why", Confidence::kHigh,
                                        std::nullopt, "T-1", std::vector<std::string>{"x"}};

        const nlohmann::json j = rule;
        EXPECT_EQ(j.get<Rule>(), rule) << j.dump();
    }
}

TEST(RuleJson, DisabledFlagIsOnlyEmittedWhenFalse) {
    Rule rule = make_rule("r");
    EXPECT_FALSE(nlohmann::json(rule).contains("enabled"));
    rule.enabled = false;
    EXPECT_EQ(nlohmann::json(rule).at("enabled"), false);
}
