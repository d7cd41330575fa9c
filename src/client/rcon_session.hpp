#pragma once

#include "common/types.hpp"
#include "logger/structured_logger.hpp"
#include "protocol/rcon_packet.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// SessionState
//   RconSession 의 생명주기 상태.
//
//   kUnconnected   : 생성 직후, 스트림 없음
//   kConnected     : TCP 연결 수립, 미인증
//   kAuthenticated : 인증 완료, command() 가능
//   kClosed        : 스트림 해제 (terminal). 어느 상태에서든 도달 가능
// ---------------------------------------------------------------------------
enum class SessionState : std::uint8_t {
    kUnconnected   = 0,
    kConnected     = 1,
    kAuthenticated = 2,
    kClosed        = 3,
};

[[nodiscard]] auto to_string(SessionState state) noexcept -> std::string_view;

// ---------------------------------------------------------------------------
// RconSession
//   Source RCON 서버와의 TCP 연결 하나를 소유하는 동기 세션.
//
//   사용 예:
//     boost::asio::io_context ioc;
//     RconSession session{ioc, params, logger};
//     session.connect();  session.authenticate();  session.command("list");
//
//   각 blocking 호출은 내부적으로 코루틴을 io_ctx 위에서 최대
//   params.timeout 동안 구동한다. 제한 시간을 넘기면 소켓을 닫고
//   kTimeout (connect 는 kConnectionError) 을 반환한다.
//
//   소유권:
//     소켓은 세션이 단독 소유하며 소멸자에서 반드시 해제된다.
//     io_ctx 는 세션보다 오래 살아야 한다.
//
//   스레드 안전성:
//     없음. 한 번에 하나의 호출만 허용된다.
// ---------------------------------------------------------------------------
class RconSession {
public:
    RconSession(boost::asio::io_context&          io_ctx,
                ConnectionParams                  params,
                std::shared_ptr<StructuredLogger> logger = nullptr);

    ~RconSession();

    RconSession(const RconSession&)            = delete;
    RconSession& operator=(const RconSession&) = delete;
    RconSession(RconSession&&)                 = delete;
    RconSession& operator=(RconSession&&)      = delete;

    // -----------------------------------------------------------------------
    // open
    //   connect() + authenticate() 를 수행한 세션을 반환한다.
    //   실패 시 생성된 세션은 즉시 파괴되어 소켓이 해제된다.
    // -----------------------------------------------------------------------
    static auto open(boost::asio::io_context&          io_ctx,
                     ConnectionParams                  params,
                     std::shared_ptr<StructuredLogger> logger = nullptr)
        -> std::expected<std::unique_ptr<RconSession>, RconError>;

    // -----------------------------------------------------------------------
    // connect
    //   host:port 로 TCP 연결을 연다. 재시도하지 않는다.
    //   kUnconnected 에서만 호출 가능 (그 외 kProtocolState).
    //   실패 시 소켓을 해제하고 kUnconnected 로 남는다.
    //
    //   [알려진 한계]
    //   이미 시작된 이름 해석(getaddrinfo)은 취소되지 않는다. DNS 가
    //   응답하지 않으면 timeout 이후에도 해석이 끝날 때까지 반환이 늦어진다.
    // -----------------------------------------------------------------------
    [[nodiscard]] auto connect() -> std::expected<void, RconError>;

    // -----------------------------------------------------------------------
    // authenticate
    //   SERVERDATA_AUTH(body=password) 를 보내고 응답을 판정한다.
    //   빈 ack 패킷이 먼저 오면 두 번째 패킷이 최종 응답이다.
    //   거부 시 kAuthenticationFailed, 세션은 kConnected 로 남는다.
    // -----------------------------------------------------------------------
    [[nodiscard]] auto authenticate() -> std::expected<void, RconError>;

    // -----------------------------------------------------------------------
    // command
    //   SERVERDATA_EXECCOMMAND(body=text) 를 보내고 응답 패킷 1개의 body 를
    //   반환한다. kAuthenticated 에서만 호출 가능.
    //
    //   [알려진 한계]
    //   응답 request_id 는 검증하지 않는다 (불일치 시 warn 로그만).
    //   서버가 큰 응답을 여러 RESPONSE_VALUE 패킷으로 나눠 보내면
    //   첫 패킷만 반환되고 나머지는 다음 command() 의 응답으로 읽힌다.
    // -----------------------------------------------------------------------
    [[nodiscard]] auto command(std::string_view text) -> std::expected<std::string, RconError>;

    // -----------------------------------------------------------------------
    // close
    //   소켓을 해제하고 kClosed 로 전이한다. 멱등, 예외 없음.
    //   진행 중인 blocking 호출이 있으면 해당 호출은 실패로 끝난다.
    // -----------------------------------------------------------------------
    void close() noexcept;

    [[nodiscard]] auto state()           const noexcept -> SessionState { return state_; }
    [[nodiscard]] auto last_request_id() const noexcept -> std::int32_t { return request_id_; }

private:
    boost::asio::io_context&          io_ctx_;
    ConnectionParams                  params_;
    std::shared_ptr<StructuredLogger> logger_;

    boost::asio::ip::tcp::resolver    resolver_;
    boost::asio::ip::tcp::socket      socket_;

    SessionState                      state_{SessionState::kUnconnected};
    std::int32_t                      request_id_{0};

    // 코루틴 op 을 io_ctx_ 위에서 최대 params_.timeout 동안 구동한다.
    // 시간 초과 시 close() 후 코루틴을 끝까지 drain 하고 on_timeout 을 반환한다.
    template <typename T>
    auto run_blocking(boost::asio::awaitable<std::expected<T, RconError>> op,
                      RconError                                           on_timeout)
        -> std::expected<T, RconError>;

    auto do_connect()      -> boost::asio::awaitable<std::expected<void, RconError>>;
    auto do_authenticate() -> boost::asio::awaitable<std::expected<void, RconError>>;
    auto do_command(std::string text) -> boost::asio::awaitable<std::expected<RconPacket, RconError>>;

    // 새 request id 를 할당해 패킷 1개를 전송한다.
    auto send_packet(RequestKind kind, std::string body)
        -> boost::asio::awaitable<std::expected<void, RconError>>;

    // length prefix → length 바이트를 끝까지 읽어 패킷 1개를 만든다.
    auto read_packet() -> boost::asio::awaitable<std::expected<RconPacket, RconError>>;

    auto next_request_id() -> std::expected<std::int32_t, RconError>;

    auto require_state(SessionState expected, std::string_view operation) const
        -> std::expected<void, RconError>;

    // 스트림 위치가 불확실해진 오류면 세션을 닫는다.
    void close_if_stream_broken(const RconError& error) noexcept;

    void log_session_event(std::string_view event, const RconError* error);
};
