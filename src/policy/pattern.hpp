#pragma once

// ---------------------------------------------------------------------------
// pattern.hpp
//
// 규칙 regex (command_match, prompt_match, block_if_match, 조건식 =~) 의
// 컴파일된 형태.
//
// [설계 원칙]
// - RE2 기반: 입력 길이에 선형 시간으로 매칭하고 재귀 백트래킹을 하지 않는다.
//   수백 KB 짜리 heredoc 이나 Write content 에도 스택을 소모하지 않는다.
// - 패턴과 입력은 UTF-8 이다. "." 와 문자 클래스는 코드 포인트 단위로 동작한다.
//   "\w" "\d" 는 ASCII 전용이고, 유니코드 범주는 "\p{L}" 처럼 쓴다.
// - 컴파일은 로드 시점에 한 번. 실패는 값으로 돌려준다.
// - search() 는 실패하지 않는다. 복사는 컴파일된 객체를 공유한다.
//
// [알려진 한계]
// - 역참조와 전후방 탐색(lookaround)은 지원하지 않는다. 이런 패턴은 로드 시점에
//   오류로 거부된다.
// ---------------------------------------------------------------------------

#include <expected>
#include <memory>
#include <string>
#include <string_view>

namespace re2 {
class RE2;
}

class Pattern {
public:
    Pattern() = default;

    // 실패 시 RE2 의 오류 설명
    [[nodiscard]] static std::expected<Pattern, std::string> compile(std::string_view pattern);

    // 부분 일치 검색 (어디서든 매치되면 참). 컴파일되지 않은 Pattern 은 항상 거짓.
    [[nodiscard]] bool search(std::string_view text) const noexcept;

    [[nodiscard]] const std::string& source() const noexcept { return source_; }

private:
    std::string                     source_{};
    std::shared_ptr<const re2::RE2> re_{};
};
