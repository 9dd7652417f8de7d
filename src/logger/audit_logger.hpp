#pragma once

// ---------------------------------------------------------------------------
// audit_logger.hpp
//
// AuditLogEntry 를 JSON Lines 로 감사 로그 파일에 붙여 쓴다.
//
// [설계 원칙]
// - 싱글턴 금지: 전역 spdlog 레지스트리에 등록하지 않는다.
//   호출자가 인스턴스를 소유한다.
// - 로그 기록 실패는 판정을 바꾸지 않는다. append() 는 실패를 값으로 돌려주고
//   호출자는 경고만 남긴다.
// - 생성자는 던지지 않는다. 파일을 열 수 없으면 이후 append() 가 그 오류를
//   돌려준다.
// ---------------------------------------------------------------------------

#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "logger/log_types.hpp"

namespace spdlog {
class logger;
}

class AuditLogger {
public:
    explicit AuditLogger(const std::filesystem::path& log_path);

    ~AuditLogger();

    // 복사/이동 금지 (error handler 가 this 를 캡처한다)
    AuditLogger(const AuditLogger&)            = delete;
    AuditLogger& operator=(const AuditLogger&) = delete;
    AuditLogger(AuditLogger&&)                 = delete;
    AuditLogger& operator=(AuditLogger&&)      = delete;

    // 레코드 한 줄 기록
    [[nodiscard]] std::expected<void, std::string> append(const AuditLogEntry& entry);

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return log_path_; }

private:
    std::filesystem::path           log_path_;
    std::shared_ptr<spdlog::logger> logger_{};
    std::optional<std::string>      open_error_{};
    std::optional<std::string>      last_error_{};
};

// 레코드를 개행 없는 한 줄 JSON 으로 직렬화한다. 잘못된 UTF-8 은 U+FFFD 로 바꾼다.
[[nodiscard]] std::string to_jsonl(const AuditLogEntry& entry);
