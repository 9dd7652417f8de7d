// ---------------------------------------------------------------------------
// expression.cpp
//
// 조건식 토크나이저 + 재귀 하강 파서 + 평가기.
//
// [알려진 한계]
// - 숫자 리터럴은 문자열로 비교한다. tool.input 의 정수 3 과 리터럴 3 은 같지만
//   3.0 과 3 은 다르다.
// - 중첩 깊이는 kMaxDepth 로 제한한다 (설정 파일의 병적인 괄호 중첩 방지).
// ---------------------------------------------------------------------------

#include "policy/expression.hpp"

#include <cctype>
#include <optional>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "event/event.hpp"
#include "policy/pattern.hpp"

namespace {

constexpr int kMaxDepth = 64;

enum class TokenType : std::uint8_t {
    kIdent  = 0,
    kString = 1,
    kNumber = 2,
    kDot    = 3,
    kLParen = 4,
    kRParen = 5,
    kEq     = 6,
    kNe     = 7,
    kMatch  = 8,
    kAnd    = 9,
    kOr     = 10,
    kNot    = 11,
    kEnd    = 12,
};

struct Token {
    TokenType   type{TokenType::kEnd};
    std::string text{};
    std::size_t offset{0};
};

[[nodiscard]] bool is_ident_start(char c) noexcept {
    return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

[[nodiscard]] bool is_ident_char(char c) noexcept {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '-';
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 소스 문자열을 토큰 목록으로 분해한다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<std::vector<Token>, std::string> tokenize(std::string_view src) {
    std::vector<Token> tokens;
    std::size_t        i = 0;

    while (i < src.size()) {
        const char c = src[i];
        if (std::isspace(static_cast<unsigned char>(c)) != 0) {
            ++i;
            continue;
        }

        const std::size_t start = i;
        const auto two = [&](char a, char b) {
            return c == a && i + 1 < src.size() && src[i + 1] == b;
        };

        if (two('=', '=')) {
            tokens.push_back({TokenType::kEq, "==", start});
            i += 2;
        } else if (two('!', '=')) {
            tokens.push_back({TokenType::kNe, "!=", start});
            i += 2;
        } else if (two('=', '~')) {
            tokens.push_back({TokenType::kMatch, "=~", start});
            i += 2;
        } else if (two('&', '&')) {
            tokens.push_back({TokenType::kAnd, "&&", start});
            i += 2;
        } else if (two('|', '|')) {
            tokens.push_back({TokenType::kOr, "||", start});
            i += 2;
        } else if (c == '!') {
            tokens.push_back({TokenType::kNot, "!", start});
            ++i;
        } else if (c == '(') {
            tokens.push_back({TokenType::kLParen, "(", start});
            ++i;
        } else if (c == ')') {
            tokens.push_back({TokenType::kRParen, ")", start});
            ++i;
        } else if (c == '.') {
            tokens.push_back({TokenType::kDot, ".", start});
            ++i;
        } else if (c == '\'' || c == '"') {
            // 문자열 리터럴: \\ 와 \<quote> 만 이스케이프로 해석한다.
            // regex 의 \d 같은 시퀀스는 그대로 남긴다.
            const char  quote = c;
            std::string value;
            ++i;
            bool closed = false;
            while (i < src.size()) {
                const char ch = src[i];
                if (ch == '\\' && i + 1 < src.size()
                    && (src[i + 1] == quote || src[i + 1] == '\\')) {
                    value.push_back(src[i + 1]);
                    i += 2;
                    continue;
                }
                if (ch == quote) {
                    closed = true;
                    ++i;
                    break;
                }
                value.push_back(ch);
                ++i;
            }
            if (!closed) {
                return std::unexpected(fmt::format("unterminated string literal at offset {}", start));
            }
            tokens.push_back({TokenType::kString, std::move(value), start});
        } else if (std::isdigit(static_cast<unsigned char>(c)) != 0
                   || (c == '-' && i + 1 < src.size()
                       && std::isdigit(static_cast<unsigned char>(src[i + 1])) != 0)) {
            ++i;
            while (i < src.size()
                   && (std::isdigit(static_cast<unsigned char>(src[i])) != 0 || src[i] == '.')) {
                ++i;
            }
            tokens.push_back({TokenType::kNumber, std::string{src.substr(start, i - start)}, start});
        } else if (is_ident_start(c)) {
            while (i < src.size() && is_ident_char(src[i])) {
                ++i;
            }
            tokens.push_back({TokenType::kIdent, std::string{src.substr(start, i - start)}, start});
        } else {
            return std::unexpected(fmt::format("unexpected character '{}' at offset {}", c, start));
        }
    }

    tokens.push_back({TokenType::kEnd, "", src.size()});
    return tokens;
}

// ---------------------------------------------------------------------------
// Operand
//   리터럴 또는 이벤트/환경에서 값을 꺼내는 경로.
// ---------------------------------------------------------------------------
struct Operand {
    enum class Kind : std::uint8_t {
        kLiteral        = 0,
        kToolName       = 1,
        kToolInput      = 2,
        kEnv            = 3,
        kSessionId      = 4,
        kSessionProject = 5,
    };

    Kind                     kind{Kind::kLiteral};
    std::string              literal{};  // kLiteral 값 또는 kEnv 변수 이름
    std::vector<std::string> path{};     // kToolInput 하위 필드
    bool                     quoted{false};
};

enum class CompareOp : std::uint8_t {
    kEq    = 0,
    kNe    = 1,
    kMatch = 2,
};

// 내부 헬퍼: JSON 스칼라를 문자열 값으로. null 은 "없음".
[[nodiscard]] std::optional<std::string> json_value_string(const nlohmann::json& v) {
    if (v.is_null()) {
        return std::nullopt;
    }
    if (v.is_string()) {
        return v.get<std::string>();
    }
    if (v.is_boolean()) {
        return v.get<bool>() ? "true" : "false";
    }
    return v.dump();
}

// 내부 헬퍼: cwd 의 마지막 경로 성분 (끝 '/' 무시)
[[nodiscard]] std::optional<std::string> project_name(const std::optional<std::string>& cwd) {
    if (!cwd || cwd->empty()) {
        return std::nullopt;
    }
    std::string_view view{*cwd};
    while (view.size() > 1 && view.back() == '/') {
        view.remove_suffix(1);
    }
    const auto slash = view.rfind('/');
    const auto name  = slash == std::string_view::npos ? view : view.substr(slash + 1);
    if (name.empty()) {
        return std::nullopt;
    }
    return std::string{name};
}

[[nodiscard]] std::optional<std::string> resolve(const Operand&                            op,
                                                 const Event&                              event,
                                                 const std::map<std::string, std::string>& env) {
    switch (op.kind) {
        case Operand::Kind::kLiteral:
            return op.literal;
        case Operand::Kind::kToolName:
            return event.tool_name;
        case Operand::Kind::kToolInput: {
            if (!event.tool_input) {
                return std::nullopt;
            }
            const nlohmann::json* cur = &*event.tool_input;
            for (const auto& seg : op.path) {
                if (!cur->is_object()) {
                    return std::nullopt;
                }
                const auto it = cur->find(seg);
                if (it == cur->end()) {
                    return std::nullopt;
                }
                cur = &*it;
            }
            return json_value_string(*cur);
        }
        case Operand::Kind::kEnv: {
            const auto it = env.find(op.literal);
            if (it == env.end()) {
                return std::nullopt;
            }
            return it->second;
        }
        case Operand::Kind::kSessionId:
            return event.session_id;
        case Operand::Kind::kSessionProject:
            return project_name(event.cwd);
    }
    return std::nullopt;
}

[[nodiscard]] bool truthy(const std::optional<std::string>& v) {
    return v && !v->empty() && *v != "false" && *v != "0";
}

}  // namespace

// ---------------------------------------------------------------------------
// Expression::Node
//   불변 AST 노드. regex 는 compile 시점에 한 번만 생성된다.
// ---------------------------------------------------------------------------
struct Expression::Node {
    enum class Kind : std::uint8_t {
        kOr      = 0,
        kAnd     = 1,
        kNot     = 2,
        kCompare = 3,
        kTruth   = 4,
    };

    Kind                        kind{Kind::kTruth};
    std::shared_ptr<const Node> lhs{};
    std::shared_ptr<const Node> rhs{};
    Operand                     left{};
    Operand                     right{};
    CompareOp                   op{CompareOp::kEq};
    std::optional<Pattern>      regex{};
};

namespace {

using NodePtr    = std::shared_ptr<const Expression::Node>;
using NodeResult = std::expected<NodePtr, std::string>;

// ---------------------------------------------------------------------------
// Parser
//   토큰 목록 위의 재귀 하강 파서. 오류 메시지에 토큰 offset 을 포함한다.
// ---------------------------------------------------------------------------
class Parser {
public:
    explicit Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

    [[nodiscard]] NodeResult parse() {
        auto root = parse_or(0);
        if (!root) {
            return root;
        }
        if (peek().type != TokenType::kEnd) {
            return fail("unexpected token");
        }
        return root;
    }

private:
    [[nodiscard]] const Token& peek() const { return tokens_[pos_]; }

    const Token& advance() {
        const Token& t = tokens_[pos_];
        if (t.type != TokenType::kEnd) {
            ++pos_;
        }
        return t;
    }

    [[nodiscard]] std::unexpected<std::string> fail(std::string_view what) const {
        const Token& t = peek();
        if (t.type == TokenType::kEnd) {
            return std::unexpected(fmt::format("{} at end of expression", what));
        }
        return std::unexpected(fmt::format("{} '{}' at offset {}", what, t.text, t.offset));
    }

    [[nodiscard]] NodeResult parse_or(int depth) {
        auto lhs = parse_and(depth);
        if (!lhs) {
            return lhs;
        }
        while (peek().type == TokenType::kOr) {
            advance();
            auto rhs = parse_and(depth);
            if (!rhs) {
                return rhs;
            }
            auto node  = std::make_shared<Expression::Node>();
            node->kind = Expression::Node::Kind::kOr;
            node->lhs  = std::move(*lhs);
            node->rhs  = std::move(*rhs);
            lhs        = NodePtr{std::move(node)};
        }
        return lhs;
    }

    [[nodiscard]] NodeResult parse_and(int depth) {
        auto lhs = parse_unary(depth);
        if (!lhs) {
            return lhs;
        }
        while (peek().type == TokenType::kAnd) {
            advance();
            auto rhs = parse_unary(depth);
            if (!rhs) {
                return rhs;
            }
            auto node  = std::make_shared<Expression::Node>();
            node->kind = Expression::Node::Kind::kAnd;
            node->lhs  = std::move(*lhs);
            node->rhs  = std::move(*rhs);
            lhs        = NodePtr{std::move(node)};
        }
        return lhs;
    }

    [[nodiscard]] NodeResult parse_unary(int depth) {
        if (depth > kMaxDepth) {
            return std::unexpected(std::string{"expression nested too deeply"});
        }
        if (peek().type == TokenType::kNot) {
            advance();
            auto inner = parse_unary(depth + 1);
            if (!inner) {
                return inner;
            }
            auto node  = std::make_shared<Expression::Node>();
            node->kind = Expression::Node::Kind::kNot;
            node->lhs  = std::move(*inner);
            return NodePtr{std::move(node)};
        }
        return parse_primary(depth);
    }

    [[nodiscard]] NodeResult parse_primary(int depth) {
        if (peek().type == TokenType::kLParen) {
            advance();
            auto inner = parse_or(depth + 1);
            if (!inner) {
                return inner;
            }
            if (peek().type != TokenType::kRParen) {
                return fail("expected ')' but found");
            }
            advance();
            return inner;
        }

        auto left = parse_operand();
        if (!left) {
            return std::unexpected(std::move(left.error()));
        }

        auto node  = std::make_shared<Expression::Node>();
        node->left = std::move(*left);

        const TokenType t = peek().type;
        if (t != TokenType::kEq && t != TokenType::kNe && t != TokenType::kMatch) {
            node->kind = Expression::Node::Kind::kTruth;
            return NodePtr{std::move(node)};
        }
        advance();

        auto right = parse_operand();
        if (!right) {
            return std::unexpected(std::move(right.error()));
        }
        node->kind  = Expression::Node::Kind::kCompare;
        node->right = std::move(*right);
        node->op    = t == TokenType::kEq ? CompareOp::kEq
                    : t == TokenType::kNe ? CompareOp::kNe
                                          : CompareOp::kMatch;

        if (node->op == CompareOp::kMatch) {
            if (node->right.kind != Operand::Kind::kLiteral || !node->right.quoted) {
                return std::unexpected(std::string{"right-hand side of =~ must be a string literal"});
            }
            auto re = Pattern::compile(node->right.literal);
            if (!re) {
                return std::unexpected(
                    fmt::format("invalid regex '{}': {}", node->right.literal, re.error()));
            }
            node->regex = std::move(*re);
        }
        return NodePtr{std::move(node)};
    }

    [[nodiscard]] std::expected<Operand, std::string> parse_operand() {
        const Token& tok = peek();

        if (tok.type == TokenType::kString) {
            advance();
            return Operand{Operand::Kind::kLiteral, tok.text, {}, true};
        }
        if (tok.type == TokenType::kNumber) {
            advance();
            return Operand{Operand::Kind::kLiteral, tok.text, {}, false};
        }
        if (tok.type != TokenType::kIdent) {
            return fail("expected operand but found");
        }

        if (tok.text == "true" || tok.text == "false") {
            advance();
            return Operand{Operand::Kind::kLiteral, tok.text, {}, false};
        }

        // 경로: root ( "." segment )+
        const std::string root   = advance().text;
        const std::size_t offset = tokens_[pos_ > 0 ? pos_ - 1 : 0].offset;
        std::vector<std::string> segments;
        while (peek().type == TokenType::kDot) {
            advance();
            if (peek().type != TokenType::kIdent && peek().type != TokenType::kNumber) {
                return fail("expected field name after '.' but found");
            }
            segments.push_back(advance().text);
        }

        if (root == "tool") {
            if (segments.size() == 1 && segments[0] == "name") {
                return Operand{Operand::Kind::kToolName, {}, {}, false};
            }
            if (segments.size() >= 2 && segments[0] == "input") {
                segments.erase(segments.begin());
                return Operand{Operand::Kind::kToolInput, {}, std::move(segments), false};
            }
            return std::unexpected(fmt::format(
                "invalid tool path at offset {} (expected tool.name or tool.input.<field>)", offset));
        }
        if (root == "env") {
            if (segments.size() != 1) {
                return std::unexpected(
                    fmt::format("invalid env path at offset {} (expected env.<VAR>)", offset));
            }
            return Operand{Operand::Kind::kEnv, segments[0], {}, false};
        }
        if (root == "session") {
            if (segments.size() == 1 && segments[0] == "id") {
                return Operand{Operand::Kind::kSessionId, {}, {}, false};
            }
            if (segments.size() == 1 && segments[0] == "project") {
                return Operand{Operand::Kind::kSessionProject, {}, {}, false};
            }
            return std::unexpected(fmt::format(
                "invalid session path at offset {} (expected session.id or session.project)",
                offset));
        }
        return std::unexpected(fmt::format("unknown root '{}' at offset {}", root, offset));
    }

    std::vector<Token> tokens_;
    std::size_t        pos_{0};
};

[[nodiscard]] bool eval_node(const Expression::Node&                   node,
                             const Event&                              event,
                             const std::map<std::string, std::string>& env) {
    using Kind = Expression::Node::Kind;
    switch (node.kind) {
        case Kind::kOr:
            return eval_node(*node.lhs, event, env) || eval_node(*node.rhs, event, env);
        case Kind::kAnd:
            return eval_node(*node.lhs, event, env) && eval_node(*node.rhs, event, env);
        case Kind::kNot:
            return !eval_node(*node.lhs, event, env);
        case Kind::kTruth:
            return truthy(resolve(node.left, event, env));
        case Kind::kCompare: {
            const auto lhs = resolve(node.left, event, env);
            if (node.op == CompareOp::kMatch) {
                return lhs && node.regex && node.regex->search(*lhs);
            }
            const auto rhs   = resolve(node.right, event, env);
            const bool equal = lhs == rhs;  // 양쪽 모두 없음도 같음
            return node.op == CompareOp::kEq ? equal : !equal;
        }
    }
    return false;
}

}  // namespace

// ---------------------------------------------------------------------------
// Expression
// ---------------------------------------------------------------------------
Expression::Expression(std::string source, std::shared_ptr<const Node> root)
    : source_(std::move(source)), root_(std::move(root)) {}

std::expected<Expression, std::string> Expression::compile(std::string_view source) {
    auto tokens = tokenize(source);
    if (!tokens) {
        return std::unexpected(std::move(tokens.error()));
    }
    if (tokens->size() == 1) {
        return std::unexpected(std::string{"empty expression"});
    }

    Parser parser{std::move(*tokens)};
    auto   root = parser.parse();
    if (!root) {
        return std::unexpected(std::move(root.error()));
    }
    return Expression{std::string{source}, std::move(*root)};
}

bool Expression::evaluate(const Event& event, const std::map<std::string, std::string>& env) const {
    if (!root_) {
        return false;
    }
    return eval_node(*root_, event, env);
}
