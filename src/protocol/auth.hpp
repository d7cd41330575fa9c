#pragma once

#include "protocol/rcon_packet.hpp"

#include <cstdint>

// ---------------------------------------------------------------------------
// auth.hpp
//
// SERVERDATA_AUTH 응답 판정 규칙. 소켓과 무관한 순수 함수만 둔다.
//
// 서버 동작 특성:
//   일부 서버는 AUTH_RESPONSE 앞에 빈 RESPONSE_VALUE 패킷을 먼저 보낸다.
//   따라서 첫 패킷이 AUTH_RESPONSE 가 아니면 두 번째 패킷을 읽어
//   그것을 최종 판정 대상으로 삼는다.
//
// 판정:
//   - request_id == -1 → 거부 (type 과 무관, 첫 패킷이어도 즉시 확정)
//   - 그 외            → 승인 (보낸 id 와 일치하지 않아도 승인)
// ---------------------------------------------------------------------------

// authenticate() 가 읽는 최대 패킷 수
inline constexpr int kMaxAuthPackets = 2;

// ---------------------------------------------------------------------------
// AuthVerdict
//   auth 응답 패킷 하나를 본 뒤의 판정.
// ---------------------------------------------------------------------------
enum class AuthVerdict : std::uint8_t {
    kAccepted    = 0,  // 인증 성공
    kRejected    = 1,  // 비밀번호 거부
    kReadAnother = 2,  // 빈 ack 패킷. 다음 패킷이 최종 응답
};

// ---------------------------------------------------------------------------
// evaluate_auth_packet
//   packet     : 수신한 auth 단계 패킷
//   packet_no  : 1 이면 첫 패킷, kMaxAuthPackets 이면 마지막(최종) 패킷
//
//   마지막 패킷에서는 kReadAnother 를 반환하지 않는다.
// ---------------------------------------------------------------------------
[[nodiscard]] auto evaluate_auth_packet(const RconPacket& packet, int packet_no) noexcept
    -> AuthVerdict;
