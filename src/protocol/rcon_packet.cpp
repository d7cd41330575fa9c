#include "protocol/rcon_packet.hpp"

#include <fmt/format.h>

#include <utility>

// ---------------------------------------------------------------------------
// RconPacket 구현
//
// Source RCON 와이어 포맷:
//   [int32 LE length][int32 LE request_id][int32 LE type][body][0x00][0x00]
// ---------------------------------------------------------------------------

namespace {

auto read_le32(const std::uint8_t* p) noexcept -> std::int32_t {
    const std::uint32_t v =
        static_cast<std::uint32_t>(p[0])
        | (static_cast<std::uint32_t>(p[1]) << 8U)
        | (static_cast<std::uint32_t>(p[2]) << 16U)
        | (static_cast<std::uint32_t>(p[3]) << 24U);
    return static_cast<std::int32_t>(v);
}

void append_le32(std::vector<std::uint8_t>& out, std::int32_t value) {
    const auto v = static_cast<std::uint32_t>(value);
    out.push_back(static_cast<std::uint8_t>(v & 0xFFU));
    out.push_back(static_cast<std::uint8_t>((v >> 8U) & 0xFFU));
    out.push_back(static_cast<std::uint8_t>((v >> 16U) & 0xFFU));
    out.push_back(static_cast<std::uint8_t>((v >> 24U) & 0xFFU));
}

}  // namespace

auto wire_type(RequestKind kind) noexcept -> std::int32_t {
    switch (kind) {
        case RequestKind::kAuth:        return kServerdataAuth;
        case RequestKind::kExecCommand: return kServerdataExecCommand;
    }
    return kServerdataExecCommand;
}

auto classify_packet(ProtocolPhase phase, std::int32_t raw_type) noexcept -> PacketKind {
    if (raw_type == kServerdataResponseValue) {
        // auth 단계에서는 AUTH_RESPONSE 앞에 오는 빈 ack 패킷이 이 값이다
        return PacketKind::kResponseValue;
    }
    if (phase == ProtocolPhase::kAuth && raw_type == kServerdataAuthResponse) {
        return PacketKind::kAuthResponse;
    }
    return PacketKind::kUnknown;
}

RconPacket::RconPacket(std::int32_t request_id, std::int32_t type, std::string body)
    : request_id_{request_id}
    , type_{type}
    , body_{std::move(body)}
{}

// static
auto RconPacket::make(std::int32_t request_id, RequestKind kind, std::string body) -> RconPacket {
    return RconPacket{request_id, wire_type(kind), std::move(body)};
}

// static
auto RconPacket::parse(std::span<const std::uint8_t> data)
    -> std::expected<RconPacket, RconError>
{
    if (data.size() < kLengthPrefixSize) {
        return std::unexpected(RconError{
            RconErrorCode::kMalformedPacket,
            "packet too short",
            fmt::format("received {} bytes, need at least {}", data.size(), kLengthPrefixSize)
        });
    }

    const std::int32_t length = read_le32(data.data());
    if (auto ok = check_packet_length(length); !ok) {
        return std::unexpected(ok.error());
    }

    const auto available = data.size() - kLengthPrefixSize;
    if (available < static_cast<std::size_t>(length)) {
        return std::unexpected(RconError{
            RconErrorCode::kMalformedPacket,
            "incomplete packet",
            fmt::format("declared length={}, available={}", length, available)
        });
    }

    return parse_payload(data.subspan(kLengthPrefixSize, static_cast<std::size_t>(length)));
}

// static
auto RconPacket::parse_payload(std::span<const std::uint8_t> payload)
    -> std::expected<RconPacket, RconError>
{
    if (payload.size() < static_cast<std::size_t>(kMinPacketLength)) {
        return std::unexpected(RconError{
            RconErrorCode::kMalformedPacket,
            "packet payload too short",
            fmt::format("payload={} bytes, minimum={}", payload.size(), kMinPacketLength)
        });
    }

    RconPacket pkt;
    pkt.request_id_ = read_le32(payload.data());
    pkt.type_       = read_le32(payload.data() + 4);

    // body = [8, size - 2). 끝의 null 2바이트는 검증 없이 버린다.
    const auto* body_begin = reinterpret_cast<const char*>(payload.data() + 8);
    pkt.body_.assign(body_begin, payload.size() - 10);

    return pkt;
}

auto RconPacket::request_id() const noexcept -> std::int32_t {
    return request_id_;
}

auto RconPacket::type() const noexcept -> std::int32_t {
    return type_;
}

auto RconPacket::body() const noexcept -> const std::string& {
    return body_;
}

auto RconPacket::length() const noexcept -> std::int64_t {
    return static_cast<std::int64_t>(kMinPacketLength) + static_cast<std::int64_t>(body_.size());
}

auto RconPacket::kind(ProtocolPhase phase) const noexcept -> PacketKind {
    return classify_packet(phase, type_);
}

auto RconPacket::serialize() const -> std::expected<std::vector<std::uint8_t>, RconError> {
    const std::int64_t len = length();
    if (len > kMaxPacketLength) {
        return std::unexpected(RconError{
            RconErrorCode::kMalformedPacket,
            "packet body too large",
            fmt::format("length={}, maximum={}", len, kMaxPacketLength)
        });
    }

    std::vector<std::uint8_t> out;
    out.reserve(kLengthPrefixSize + static_cast<std::size_t>(len));

    append_le32(out, static_cast<std::int32_t>(len));
    append_le32(out, request_id_);
    append_le32(out, type_);
    out.insert(out.end(), body_.begin(), body_.end());

    // body terminator + 빈 trailing string terminator
    out.push_back(0x00);
    out.push_back(0x00);

    return out;
}

auto decode_length_prefix(std::span<const std::uint8_t, kLengthPrefixSize> prefix) noexcept
    -> std::int32_t
{
    return read_le32(prefix.data());
}

auto check_packet_length(std::int32_t length) -> std::expected<void, RconError> {
    if (length < kMinPacketLength || length > kMaxPacketLength) {
        return std::unexpected(RconError{
            RconErrorCode::kMalformedPacket,
            "declared packet length out of range",
            fmt::format("length={}, allowed=[{}, {}]", length, kMinPacketLength, kMaxPacketLength)
        });
    }
    return {};
}
