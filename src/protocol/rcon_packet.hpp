#pragma once

#include "common/types.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Source RCON 패킷 type 값 (wire 상수)
//   AUTH_RESPONSE 와 EXECCOMMAND 는 같은 값(2)을 공유한다.
//   방향과 세션 단계로만 구분되므로 수신 패킷 해석은 반드시
//   classify_packet(phase, type) 을 거친다.
// ---------------------------------------------------------------------------
inline constexpr std::int32_t kServerdataAuth          = 3;
inline constexpr std::int32_t kServerdataAuthResponse  = 2;
inline constexpr std::int32_t kServerdataExecCommand   = 2;
inline constexpr std::int32_t kServerdataResponseValue = 0;

// 인증 실패 시 서버가 request_id 자리에 넣는 sentinel
inline constexpr std::int32_t kAuthFailureId = -1;

// length prefix 크기 / 최소 length(id + type + 빈 body + null 2개) / 상한
inline constexpr std::size_t  kLengthPrefixSize = 4;
inline constexpr std::int32_t kMinPacketLength  = 10;
inline constexpr std::int32_t kMaxPacketLength  = 1 << 20;

// ---------------------------------------------------------------------------
// RequestKind
//   클라이언트 → 서버 방향 패킷 종류.
// ---------------------------------------------------------------------------
enum class RequestKind : std::uint8_t {
    kAuth        = 0,  // SERVERDATA_AUTH (3)
    kExecCommand = 1,  // SERVERDATA_EXECCOMMAND (2)
};

// ---------------------------------------------------------------------------
// ProtocolPhase
//   수신 패킷을 어떤 단계에서 기다리고 있었는지를 나타낸다.
//   같은 raw type 이라도 단계에 따라 의미가 달라진다.
// ---------------------------------------------------------------------------
enum class ProtocolPhase : std::uint8_t {
    kAuth    = 0,  // authenticate() 응답 대기
    kCommand = 1,  // command() 응답 대기
};

// ---------------------------------------------------------------------------
// PacketKind
//   서버 → 클라이언트 방향 패킷을 단계 기준으로 분류한 결과.
// ---------------------------------------------------------------------------
enum class PacketKind : std::uint8_t {
    kAuthResponse  = 0,  // SERVERDATA_AUTH_RESPONSE (auth 단계의 type 2)
    kResponseValue = 1,  // SERVERDATA_RESPONSE_VALUE (type 0)
    kUnknown       = 2,  // 해당 단계에서 기대하지 않은 type
};

[[nodiscard]] auto wire_type(RequestKind kind) noexcept -> std::int32_t;

[[nodiscard]] auto classify_packet(ProtocolPhase phase, std::int32_t raw_type) noexcept
    -> PacketKind;

// ---------------------------------------------------------------------------
// RconPacket
//   Source RCON 와이어 프로토콜의 단일 패킷.
//
//   Wire 포맷 (정수는 모두 int32 little-endian):
//     [length][request_id][type][body bytes...][0x00][0x00]
//     length = 4 + 4 + body 바이트 수 + 2 (length 필드 자신은 제외)
//
//   parse()         : length prefix 를 포함한 원시 바이트 → RconPacket
//   parse_payload() : length prefix 뒤의 length 바이트 → RconPacket
//   serialize()     : RconPacket → 원시 바이트
// ---------------------------------------------------------------------------
class RconPacket {
public:
    RconPacket() = default;
    RconPacket(std::int32_t request_id, std::int32_t type, std::string body);

    static auto make(std::int32_t request_id, RequestKind kind, std::string body) -> RconPacket;

    // -----------------------------------------------------------------------
    // parse
    //   data 는 length prefix(4바이트)와 length 바이트를 모두 포함해야 한다.
    //   뒤에 남는 바이트는 무시한다.
    //
    //   실패 시: std::unexpected(RconError{kMalformedPacket, ...})
    // -----------------------------------------------------------------------
    static auto parse(std::span<const std::uint8_t> data)
        -> std::expected<RconPacket, RconError>;

    // -----------------------------------------------------------------------
    // parse_payload
    //   소켓에서 length 만큼 읽은 바이트를 해석한다.
    //   끝의 2바이트(null terminator)는 검증하지 않고 버린다.
    // -----------------------------------------------------------------------
    static auto parse_payload(std::span<const std::uint8_t> payload)
        -> std::expected<RconPacket, RconError>;

    [[nodiscard]] auto request_id() const noexcept -> std::int32_t;
    [[nodiscard]] auto type()       const noexcept -> std::int32_t;
    [[nodiscard]] auto body()       const noexcept -> const std::string&;
    [[nodiscard]] auto length()     const noexcept -> std::int64_t;

    [[nodiscard]] auto kind(ProtocolPhase phase) const noexcept -> PacketKind;

    // -----------------------------------------------------------------------
    // serialize
    //   length prefix + 본문을 이어붙인 바이트 벡터를 반환한다.
    //   length 가 kMaxPacketLength 를 넘으면 kMalformedPacket.
    // -----------------------------------------------------------------------
    [[nodiscard]] auto serialize() const -> std::expected<std::vector<std::uint8_t>, RconError>;

    friend bool operator==(const RconPacket&, const RconPacket&) = default;

private:
    std::int32_t request_id_{0};
    std::int32_t type_{kServerdataResponseValue};
    std::string  body_{};
};

// ---------------------------------------------------------------------------
// decode_length_prefix / check_packet_length
//   소켓 reader 가 length prefix 4바이트를 받은 직후 사용한다.
//   범위를 벗어난 length 는 body 를 읽기 전에 거부한다.
// ---------------------------------------------------------------------------
[[nodiscard]] auto decode_length_prefix(std::span<const std::uint8_t, kLengthPrefixSize> prefix) noexcept
    -> std::int32_t;

[[nodiscard]] auto check_packet_length(std::int32_t length) -> std::expected<void, RconError>;
