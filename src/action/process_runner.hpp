#pragma once

// ---------------------------------------------------------------------------
// process_runner.hpp
//
// 제한 시간이 있는 외부 프로세스 실행 (검증 스크립트, inject_command).
//
// [동작]
// 1. /bin/sh -c <command> 를 자체 프로세스 그룹에서 실행한다.
// 2. stdin 데이터를 비동기로 쓰고 닫는다.
// 3. stdout 을 EOF 까지 읽는 코루틴과 deadline 타이머를 같은 io_context 에서
//    경쟁시킨다. 먼저 끝나는 쪽이 이긴다.
//    - deadline 먼저: 프로세스 그룹 전체 SIGKILL → reap → kTimeout
//    - EOF 먼저: 남은 시간 동안 종료를 기다리고, 넘기면 kill → reap → kTimeout
// 4. stdout 은 max_output_bytes 까지만 보관한다. stderr 는 버린다.
// 5. working_dir 가 지정됐는데 디렉토리가 아니면 spawn 하지 않고 kSpawnFailed.
//
// [설계 원칙]
// - 실행 하나마다 전용 단일 스레드 io_context 를 쓴다. 공유 상태가 없다.
// - 어떤 경로로 끝나도 자식 프로세스는 반드시 reap 된다 (좀비 금지).
// - SIGPIPE 는 프로세스 전체에서 무시된다 (stdin 을 읽지 않고 종료한 자식에게
//   쓰는 경우 EPIPE 로 처리하기 위함).
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

struct ProcessRequest {
    std::string                                      command{};
    std::filesystem::path                            working_dir{};     // 비어 있으면 현재 디렉토리
    std::vector<std::pair<std::string, std::string>> env{};             // 상속 환경에 추가/덮어쓰기
    std::string                                      stdin_data{};
    std::chrono::milliseconds                        timeout{30'000};
    std::size_t                                      max_output_bytes{1024 * 1024};
};

struct ProcessResult {
    int                       exit_code{0};
    std::string               stdout_data{};
    bool                      truncated{false};  // max_output_bytes 초과분 폐기 여부
    int                       pid{0};
    std::chrono::milliseconds elapsed{0};
};

enum class ProcessErrorCode : std::uint8_t {
    kSpawnFailed = 0,
    kTimeout     = 1,
    kIoError     = 2,
};

struct ProcessError {
    ProcessErrorCode code{ProcessErrorCode::kSpawnFailed};
    std::string      message{};
    int              pid{0};  // spawn 이후 오류일 때만 유효
};

class ProcessRunner {
public:
    ProcessRunner() = default;

    [[nodiscard]] std::expected<ProcessResult, ProcessError> run(const ProcessRequest& request) const;
};
