#pragma once

// ---------------------------------------------------------------------------
// expression.hpp
//
// enabled_when 매처가 사용하는 조건식 언어.
//
//   expr     := and ( "||" and )*
//   and      := unary ( "&&" unary )*
//   unary    := "!" unary | primary
//   primary  := "(" expr ")" | operand ( ("==" | "!=" | "=~") operand )?
//   operand  := path | 'string' | "string" | true | false | number
//   path     := tool.name | tool.input.<field>[.<field>...]
//             | env.<VAR> | session.id | session.project
//
// [평가 규칙]
// - 값은 "있을 수도 없을 수도 있는 문자열" 이다.
// - ==  : 양쪽 모두 있고 같거나, 양쪽 모두 없으면 참. != 는 그 부정.
// - =~  : 오른쪽은 문자열 리터럴이어야 하며 compile 시 regex 로 컴파일된다.
//         왼쪽 값이 없으면 거짓.
// - 단독 operand : 값이 있고 비어 있지 않으며 "false" / "0" 이 아니면 참.
// - && / || 는 단락 평가한다.
//
// [설계 원칙]
// - 문법 오류, 알 수 없는 루트, 잘못된 regex 는 모두 compile 시점 오류다.
//   evaluate 는 실패하지 않는다.
// - 컴파일된 AST 는 불변이며 shared_ptr 로 공유되므로 Expression 복사는 저렴하다.
// ---------------------------------------------------------------------------

#include <expected>
#include <map>
#include <memory>
#include <string>
#include <string_view>

struct Event;

class Expression {
public:
    struct Node;

    [[nodiscard]] static std::expected<Expression, std::string> compile(std::string_view source);

    [[nodiscard]] bool evaluate(const Event&                              event,
                                const std::map<std::string, std::string>& env) const;

    [[nodiscard]] const std::string& source() const noexcept { return source_; }

private:
    Expression(std::string source, std::shared_ptr<const Node> root);

    std::string                 source_;
    std::shared_ptr<const Node> root_;
};
