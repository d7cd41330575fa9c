#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 로거 서브시스템에서 사용하는 구조화 로그 타입 정의.
//
// [민감정보 취급 주의]
// - 비밀번호와 커맨드 응답 본문은 어떤 로그 타입에도 담지 않는다.
// - 커맨드는 본문 대신 길이만 기록한다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <string>

// ---------------------------------------------------------------------------
// LogLevel
//   로거의 최소 출력 레벨. config 에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

// ---------------------------------------------------------------------------
// SessionLog
//   세션 생명주기 이벤트 로그.
//   event  : "connect" | "authenticate" | "close"
//   outcome: "ok" 또는 RconErrorCode 이름 ("connection_error" 등)
// ---------------------------------------------------------------------------
struct SessionLog {
    std::string                                event{};
    std::string                                host{};
    std::uint16_t                              port{0};
    std::string                                outcome{};
    std::chrono::system_clock::time_point      timestamp{};
};

// ---------------------------------------------------------------------------
// CommandLog
//   command() 1회 실행 로그.
//   response_id 는 서버가 돌려준 request_id (불일치 진단용).
// ---------------------------------------------------------------------------
struct CommandLog {
    std::int32_t                               request_id{0};
    std::int32_t                               response_id{0};
    std::size_t                                command_bytes{0};
    std::size_t                                response_bytes{0};
    std::string                                outcome{};
    std::chrono::system_clock::time_point      timestamp{};
    std::chrono::microseconds                  duration{0};
};
