#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// ConnectionParams
//   RCON 세션 하나의 접속 파라미터.
//   세션 생성 시 한 번 주입되며 세션 수명 동안 변경되지 않는다.
// ---------------------------------------------------------------------------
struct ConnectionParams {
    std::string               host{};           // 서버 호스트명 또는 IP
    std::uint16_t             port{0};          // 서버 RCON 포트 (1~65535)
    std::string               password{};       // RCON 비밀번호 (로그 출력 금지)
    std::chrono::milliseconds timeout{10'000};  // blocking 호출 1회당 제한 시간
};

// ---------------------------------------------------------------------------
// RconErrorCode
//   세션/프로토콜 단계에서 발생 가능한 오류 분류.
//   core 는 재시도하지 않으며, 모든 오류는 호출자에게 그대로 전달된다.
// ---------------------------------------------------------------------------
enum class RconErrorCode : std::uint8_t {
    kConnectionError      = 0,  // TCP 연결 수립 실패 (거부, DNS 실패, connect 타임아웃)
    kConnectionClosed     = 1,  // 선언된 길이를 다 읽기 전에 peer 가 스트림을 닫음
    kAuthenticationFailed = 2,  // 비밀번호 거부 (request_id == -1)
    kTimeout              = 3,  // read/write 가 제한 시간 초과
    kProtocolState        = 4,  // 현재 세션 상태에서 허용되지 않는 호출
    kMalformedPacket      = 5,  // 길이 필드가 허용 범위를 벗어남
    kIoError              = 6,  // 그 외 소켓 I/O 오류
};

// ---------------------------------------------------------------------------
// RconError
//   실패 시 반환되는 오류 정보.
//   std::expected<T, RconError> 패턴과 함께 사용한다.
// ---------------------------------------------------------------------------
struct RconError {
    RconErrorCode code{RconErrorCode::kIoError};
    std::string   message{};  // 사람이 읽을 수 있는 오류 설명
    std::string   context{};  // 부가 정보 (errno 메시지, 주소 등)
};

// 오류 코드의 짧은 이름 ("connection_closed" 등). 로그/테스트용.
[[nodiscard]] constexpr auto to_string(RconErrorCode code) noexcept -> std::string_view {
    switch (code) {
        case RconErrorCode::kConnectionError:      return "connection_error";
        case RconErrorCode::kConnectionClosed:     return "connection_closed";
        case RconErrorCode::kAuthenticationFailed: return "authentication_failed";
        case RconErrorCode::kTimeout:              return "timeout";
        case RconErrorCode::kProtocolState:        return "protocol_state";
        case RconErrorCode::kMalformedPacket:      return "malformed_packet";
        case RconErrorCode::kIoError:              return "io_error";
    }
    return "unknown";
}
