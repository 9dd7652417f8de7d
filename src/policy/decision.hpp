#pragma once

// ---------------------------------------------------------------------------
// decision.hpp
//
// 이벤트 하나에 대한 최종 판정과 호스트로 돌려보낼 응답.
//
// [종료 코드 계약]
//   kAllowed / kWarned / kAudited → 0
//   kBlocked                      → 2 (사유는 stderr 에도 출력)
//   파싱/설정 오류                 → 1 (차단에 절대 사용하지 않는다)
// ---------------------------------------------------------------------------

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>

enum class Decision : std::uint8_t {
    kAllowed = 0,
    kBlocked = 1,
    kWarned  = 2,
    kAudited = 3,
};

[[nodiscard]] std::string_view        decision_to_string(Decision decision) noexcept;
[[nodiscard]] std::optional<Decision> decision_from_string(std::string_view s) noexcept;

inline constexpr int kExitAllow   = 0;
inline constexpr int kExitError   = 1;
inline constexpr int kExitBlocked = 2;

[[nodiscard]] constexpr int exit_code_for(Decision decision) noexcept {
    return decision == Decision::kBlocked ? kExitBlocked : kExitAllow;
}

// ---------------------------------------------------------------------------
// Response
//   stdout 으로 나가는 {"continue": bool, "context"?: ..., "reason"?: ...}
//   continue 는 C++ 예약어이므로 멤버 이름은 continue_ 이다.
// ---------------------------------------------------------------------------
struct Response {
    bool                       continue_{true};
    std::optional<std::string> context{};
    std::optional<std::string> reason{};

    bool operator==(const Response&) const = default;

    [[nodiscard]] static Response allow() { return Response{}; }

    [[nodiscard]] static Response block(std::string reason) {
        return Response{false, std::nullopt, std::move(reason)};
    }

    [[nodiscard]] static Response inject(std::string context) {
        return Response{true, std::move(context), std::nullopt};
    }
};

void to_json(nlohmann::json& j, const Response& response);
void from_json(const nlohmann::json& j, Response& response);
