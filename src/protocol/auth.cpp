#include "protocol/auth.hpp"

auto evaluate_auth_packet(const RconPacket& packet, int packet_no) noexcept -> AuthVerdict {
    if (packet.request_id() == kAuthFailureId) {
        return AuthVerdict::kRejected;
    }

    const bool is_final = packet_no >= kMaxAuthPackets;
    if (!is_final && packet.kind(ProtocolPhase::kAuth) != PacketKind::kAuthResponse) {
        return AuthVerdict::kReadAnother;
    }

    return AuthVerdict::kAccepted;
}
