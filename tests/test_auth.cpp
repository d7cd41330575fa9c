// ---------------------------------------------------------------------------
// test_auth.cpp
//
// evaluate_auth_packet 판정 규칙 단위 테스트 (소켓 없음).
// ---------------------------------------------------------------------------

#include "protocol/auth.hpp"

#include <gtest/gtest.h>

TEST(EvaluateAuthPacket, AuthResponseAccepted) {
    const RconPacket pkt{1, kServerdataAuthResponse, ""};
    EXPECT_EQ(evaluate_auth_packet(pkt, 1), AuthVerdict::kAccepted);
}

TEST(EvaluateAuthPacket, MinusOneRejectedOnFirstPacket) {
    const RconPacket pkt{kAuthFailureId, kServerdataAuthResponse, ""};
    EXPECT_EQ(evaluate_auth_packet(pkt, 1), AuthVerdict::kRejected);
}

// 거부 판정은 type 과 무관하다
TEST(EvaluateAuthPacket, MinusOneRejectedRegardlessOfType) {
    const RconPacket pkt{kAuthFailureId, kServerdataResponseValue, ""};
    EXPECT_EQ(evaluate_auth_packet(pkt, 1), AuthVerdict::kRejected);
    EXPECT_EQ(evaluate_auth_packet(pkt, 2), AuthVerdict::kRejected);
}

TEST(EvaluateAuthPacket, EmptyAckRequestsSecondPacket) {
    const RconPacket ack{1, kServerdataResponseValue, ""};
    EXPECT_EQ(evaluate_auth_packet(ack, 1), AuthVerdict::kReadAnother);
}

TEST(EvaluateAuthPacket, SecondPacketIsFinal) {
    const RconPacket second{1, kServerdataResponseValue, ""};
    EXPECT_EQ(evaluate_auth_packet(second, kMaxAuthPackets), AuthVerdict::kAccepted);
}

// 보낸 id 와 달라도 -1 이 아니면 승인
TEST(EvaluateAuthPacket, MismatchedIdStillAccepted) {
    const RconPacket pkt{999, kServerdataAuthResponse, ""};
    EXPECT_EQ(evaluate_auth_packet(pkt, 1), AuthVerdict::kAccepted);
}
