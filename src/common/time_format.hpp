#pragma once

// ---------------------------------------------------------------------------
// time_format.hpp
//
// 이벤트/감사 로그 타임스탬프의 ISO-8601 변환.
//
// - 출력은 항상 UTC, 마이크로초 6자리, 'Z' 접미사.
// - 입력은 초 단위 이하 자릿수 가변, 'Z' 또는 ±HH:MM 오프셋 허용.
//   마이크로초 미만 자릿수는 버린다 (직렬화 왕복이 무손실이 되도록).
// ---------------------------------------------------------------------------

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

[[nodiscard]] std::string format_iso8601(std::chrono::system_clock::time_point tp);

[[nodiscard]] std::optional<std::chrono::system_clock::time_point>
parse_iso8601(std::string_view text);

// 현재 시각을 마이크로초 정밀도로 절삭해 반환한다.
[[nodiscard]] std::chrono::system_clock::time_point now_micros();
