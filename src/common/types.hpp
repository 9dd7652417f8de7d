#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>

// ---------------------------------------------------------------------------
// InvocationContext
//   hookgate 프로세스 한 번의 실행(= 이벤트 하나)을 식별하는 불변 컨텍스트.
//   main 이 한 번 생성하고 matcher/action/logger 레이어에 const-ref 로 전달한다.
//   전역 상태 대신 이 값을 통해 debug 플래그와 환경 변수 스냅샷을 공유한다.
// ---------------------------------------------------------------------------
struct InvocationContext {
    bool                               debug{false};    // 디버그 레코드(raw_event, rule trace) 기록 여부
    std::filesystem::path              project_root{};  // 이벤트 cwd, 없으면 프로세스 작업 디렉토리
    std::map<std::string, std::string> env{};           // 실행 시점 환경 변수 스냅샷
};

// ---------------------------------------------------------------------------
// ParseErrorCode
//   이벤트 입력 파싱 단계에서 발생 가능한 오류 분류.
// ---------------------------------------------------------------------------
enum class ParseErrorCode : std::uint8_t {
    kMalformedJson   = 0,  // JSON 문법 오류
    kInvalidEnvelope = 1,  // 최상위 객체 아님, session_id 누락, kind 타입 불일치
    kEmptyInput      = 2,  // stdin 이 비어 있음
    kInternalError   = 3,  // 파서 내부 오류
};

// ---------------------------------------------------------------------------
// ParseError
//   파싱 실패 시 반환되는 오류 정보.
//   std::expected<T, ParseError> 패턴과 함께 사용한다.
// ---------------------------------------------------------------------------
struct ParseError {
    ParseErrorCode code{ParseErrorCode::kInternalError};
    std::string    message{};  // 사람이 읽을 수 있는 오류 설명
    std::string    context{};  // 오류가 발생한 위치/입력 단편 (로깅용)
};

// ---------------------------------------------------------------------------
// ConfigErrorCode
//   설정 로드/규칙 컴파일 단계의 오류 분류. 모두 로드 시점에만 발생한다.
// ---------------------------------------------------------------------------
enum class ConfigErrorCode : std::uint8_t {
    kFileNotFound      = 0,
    kYamlSyntax        = 1,  // YAML 문법 오류 (line/column 포함)
    kSchema            = 2,  // 필드 타입/필수 필드 불일치
    kDuplicateRule     = 3,
    kInvalidRuleName   = 4,
    kInvalidAction     = 5,  // action 이 0개 또는 2개 이상
    kInvalidRegex      = 6,
    kInvalidExpression = 7,  // enabled_when 문법 오류
};

// ---------------------------------------------------------------------------
// ConfigError
//   std::expected<T, ConfigError> 패턴과 함께 사용한다.
//   rule_name 은 특정 규칙에서 발생한 오류일 때만 채워진다.
// ---------------------------------------------------------------------------
struct ConfigError {
    ConfigErrorCode code{ConfigErrorCode::kSchema};
    std::string     message{};
    std::string     rule_name{};
};
