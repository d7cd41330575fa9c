#pragma once

// ---------------------------------------------------------------------------
// mock_rcon_server.hpp
//
// 테스트 전용 스크립트형 RCON 서버.
//
// [동작]
// - 127.0.0.1 의 임시 포트(0)에 바인드하고, 백그라운드 스레드에서
//   연결 하나를 accept 한 뒤 테스트가 넘긴 handler 를 동기 실행한다.
// - handler 는 MockConnection 으로 패킷을 읽고/쓰고/원시 바이트를 보낸다.
// - 읽은 요청 패킷은 모두 기록되어 requests() 로 확인할 수 있다.
//
// [수명]
// - 클라이언트가 접속하지 않으면 소멸자가 accept 를 취소한다.
// - handler 가 drain() 으로 EOF 를 기다리는 경우, 세션을 먼저 닫아야
//   서버 스레드가 끝난다 (서버 객체를 세션보다 먼저 선언할 것).
// ---------------------------------------------------------------------------

#include "protocol/rcon_packet.hpp"

#include <utility>  // boost/asio/awaitable.hpp (1.74) uses std::exchange without including it

#include <boost/asio.hpp>

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

// ---------------------------------------------------------------------------
// MockConnection
//   accept 된 소켓 하나에 대한 동기 헬퍼.
// ---------------------------------------------------------------------------
class MockConnection {
public:
    MockConnection(tcp::socket& sock, std::vector<RconPacket>& requests, std::mutex& mtx)
        : sock_{sock}, requests_{requests}, mtx_{mtx} {}

    // 요청 패킷 1개를 읽는다. EOF/오류면 nullopt.
    std::optional<RconPacket> read() {
        std::array<std::uint8_t, kLengthPrefixSize> prefix{};
        boost::system::error_code ec;
        asio::read(sock_, asio::buffer(prefix), ec);
        if (ec) { return std::nullopt; }

        const std::int32_t length = decode_length_prefix(prefix);
        if (length < kMinPacketLength || length > kMaxPacketLength) { return std::nullopt; }

        std::vector<std::uint8_t> payload(static_cast<std::size_t>(length));
        asio::read(sock_, asio::buffer(payload), ec);
        if (ec) { return std::nullopt; }

        auto pkt = RconPacket::parse_payload(payload);
        if (!pkt) { return std::nullopt; }

        std::lock_guard lock{mtx_};
        requests_.push_back(*pkt);
        return *pkt;
    }

    // 응답 패킷 1개를 보낸다.
    void send(std::int32_t id, std::int32_t type, std::string body) {
        const auto bytes = RconPacket{id, type, std::move(body)}.serialize();
        if (bytes) {
            send_raw(*bytes);
        }
    }

    // 원시 바이트를 그대로 보낸다 (부분 전송, malformed 테스트용).
    void send_raw(const std::vector<std::uint8_t>& bytes) {
        boost::system::error_code ec;
        asio::write(sock_, asio::buffer(bytes), ec);
    }

    // 바이트를 pieces 조각으로 나눠 간격을 두고 보낸다.
    void send_in_pieces(const std::vector<std::uint8_t>& bytes, std::size_t pieces) {
        const std::size_t step = (bytes.size() + pieces - 1) / pieces;
        for (std::size_t off = 0; off < bytes.size(); off += step) {
            const std::size_t n = std::min(step, bytes.size() - off);
            send_raw(std::vector<std::uint8_t>(bytes.begin() + static_cast<std::ptrdiff_t>(off),
                                               bytes.begin() + static_cast<std::ptrdiff_t>(off + n)));
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
    }

    // 클라이언트가 닫을 때까지 읽고 버린다.
    void drain() {
        std::array<std::uint8_t, 256> buf{};
        boost::system::error_code ec;
        while (!ec) {
            sock_.read_some(asio::buffer(buf), ec);
        }
    }

    // 서버 측에서 먼저 연결을 끊는다.
    void close() {
        boost::system::error_code ec;
        sock_.shutdown(tcp::socket::shutdown_both, ec);
        sock_.close(ec);
    }

private:
    tcp::socket&             sock_;
    std::vector<RconPacket>& requests_;
    std::mutex&              mtx_;
};

// ---------------------------------------------------------------------------
// MockRconServer
// ---------------------------------------------------------------------------
class MockRconServer {
public:
    using Handler = std::function<void(MockConnection&)>;

    explicit MockRconServer(Handler handler)
        : acceptor_{ioc_, tcp::endpoint{asio::ip::make_address("127.0.0.1"), 0}}
        , handler_{std::move(handler)}
    {
        port_ = acceptor_.local_endpoint().port();

        acceptor_.async_accept(socket_, [this](const boost::system::error_code& ec) {
            if (ec) { return; }
            socket_.set_option(tcp::no_delay{true});
            MockConnection conn{socket_, requests_, mtx_};
            handler_(conn);
            conn.close();
        });

        thread_ = std::thread([this] { ioc_.run(); });
    }

    ~MockRconServer() {
        join();
    }

    MockRconServer(const MockRconServer&)            = delete;
    MockRconServer& operator=(const MockRconServer&) = delete;

    [[nodiscard]] std::uint16_t port() const noexcept { return port_; }

    // 접속이 없었다면 accept 를 취소하고 서버 스레드를 기다린다.
    void join() {
        if (!thread_.joinable()) { return; }
        asio::post(ioc_, [this] {
            boost::system::error_code ec;
            acceptor_.close(ec);
        });
        thread_.join();
    }

    [[nodiscard]] std::vector<RconPacket> requests() const {
        std::lock_guard lock{mtx_};
        return requests_;
    }

private:
    asio::io_context        ioc_;
    tcp::acceptor           acceptor_;
    tcp::socket             socket_{ioc_};
    Handler                 handler_;
    std::uint16_t           port_{0};
    std::thread             thread_;

    mutable std::mutex      mtx_;
    std::vector<RconPacket> requests_;
};

// 접속을 거부하는 포트 (바인드 후 즉시 해제)
inline std::uint16_t unused_local_port() {
    asio::io_context ioc;
    tcp::acceptor    acceptor{ioc, tcp::endpoint{asio::ip::make_address("127.0.0.1"), 0}};
    return acceptor.local_endpoint().port();
}
