#include "client/rcon_session.hpp"
#include "protocol/auth.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include <fmt/format.h>

#include <array>
#include <chrono>
#include <exception>
#include <limits>
#include <optional>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// RconSession 구현
//
// 흐름:
//   1. connect()      : resolve → async_connect        → kConnected
//   2. authenticate() : AUTH 전송 → 응답 1~2개 판정      → kAuthenticated
//   3. command()      : EXECCOMMAND 전송 → 응답 1개 body 반환
//   4. close()        : 소켓 해제                       → kClosed
//
// 상태 전이는 run_blocking() 이 성공을 돌려준 뒤 동기 코드에서만 수행한다.
// 시간 초과 후 drain 되는 코루틴이 상태를 바꾸지 못하게 하기 위함이다.
// ---------------------------------------------------------------------------

namespace {

auto socket_error(const boost::system::error_code& ec, std::string_view what) -> RconError {
    namespace error = boost::asio::error;

    if (ec == error::eof || ec == error::connection_reset || ec == error::broken_pipe) {
        return RconError{RconErrorCode::kConnectionClosed,
                         fmt::format("connection closed by peer while {}", what),
                         ec.message()};
    }
    // close() 가 대기 중인 연산을 취소한 경우 (시간 초과, SIGINT)
    if (ec == error::operation_aborted || ec == error::bad_descriptor) {
        return RconError{RconErrorCode::kConnectionClosed,
                         fmt::format("connection closed locally while {}", what),
                         ec.message()};
    }
    return RconError{RconErrorCode::kIoError,
                     fmt::format("socket error while {}", what),
                     ec.message()};
}

auto exception_error(const std::exception_ptr& eptr) -> RconError {
    try {
        std::rethrow_exception(eptr);
    } catch (const std::exception& e) {
        return RconError{RconErrorCode::kIoError, "unexpected exception in session", e.what()};
    }
    return RconError{RconErrorCode::kIoError, "unexpected exception in session", {}};
}

auto is_stream_fatal(RconErrorCode code) noexcept -> bool {
    switch (code) {
        case RconErrorCode::kConnectionClosed:
        case RconErrorCode::kTimeout:
        case RconErrorCode::kMalformedPacket:
        case RconErrorCode::kIoError:
            return true;
        default:
            return false;
    }
}

}  // namespace

auto to_string(SessionState state) noexcept -> std::string_view {
    switch (state) {
        case SessionState::kUnconnected:   return "unconnected";
        case SessionState::kConnected:     return "connected";
        case SessionState::kAuthenticated: return "authenticated";
        case SessionState::kClosed:        return "closed";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// 생성자 / 소멸자
// ---------------------------------------------------------------------------
RconSession::RconSession(boost::asio::io_context&          io_ctx,
                         ConnectionParams                  params,
                         std::shared_ptr<StructuredLogger> logger)
    : io_ctx_{io_ctx}
    , params_{std::move(params)}
    , logger_{std::move(logger)}
    , resolver_{io_ctx}
    , socket_{io_ctx}
{}

RconSession::~RconSession() {
    close();
}

// static
auto RconSession::open(boost::asio::io_context&          io_ctx,
                       ConnectionParams                  params,
                       std::shared_ptr<StructuredLogger> logger)
    -> std::expected<std::unique_ptr<RconSession>, RconError>
{
    auto session = std::make_unique<RconSession>(io_ctx, std::move(params), std::move(logger));

    if (auto connected = session->connect(); !connected) {
        return std::unexpected(connected.error());
    }
    if (auto authed = session->authenticate(); !authed) {
        return std::unexpected(authed.error());
    }
    return session;
}

// ---------------------------------------------------------------------------
// run_blocking
//   완료 핸들러가 io_ctx_.stop() 을 호출하므로, io_ctx_ 에 다른 대기 작업
//   (CLI 의 signal_set 등) 이 있어도 op 완료 즉시 run_for 가 반환된다.
// ---------------------------------------------------------------------------
template <typename T>
auto RconSession::run_blocking(boost::asio::awaitable<std::expected<T, RconError>> op,
                               RconError                                           on_timeout)
    -> std::expected<T, RconError>
{
    std::optional<std::expected<T, RconError>> result;

    io_ctx_.restart();
    boost::asio::co_spawn(
        io_ctx_,
        std::move(op),
        [this, &result](std::exception_ptr eptr, std::expected<T, RconError> value) {
            if (eptr) {
                result.emplace(std::unexpected(exception_error(eptr)));
            } else {
                result.emplace(std::move(value));
            }
            io_ctx_.stop();
        });

    io_ctx_.run_for(params_.timeout);

    if (result.has_value()) {
        return std::move(*result);
    }

    // 시간 초과: 대기 중인 연산을 취소하고, result 가 참조하는 코루틴이
    // 끝날 때까지 돌린다 (스택 변수 result 보다 먼저 끝나야 한다).
    close();
    io_ctx_.restart();
    while (!result.has_value()) {
        if (io_ctx_.run_one() == 0) {
            break;
        }
    }
    return std::unexpected(std::move(on_timeout));
}

// ---------------------------------------------------------------------------
// connect
// ---------------------------------------------------------------------------
auto RconSession::connect() -> std::expected<void, RconError> {
    if (auto ok = require_state(SessionState::kUnconnected, "connect"); !ok) {
        return ok;
    }

    if (logger_) {
        logger_->debug(fmt::format("connecting to {}:{} (timeout {}ms)",
                                   params_.host, params_.port, params_.timeout.count()));
    }

    auto result = run_blocking(
        do_connect(),
        RconError{RconErrorCode::kConnectionError,
                  "connection timed out",
                  fmt::format("{}:{} after {}ms", params_.host, params_.port,
                              params_.timeout.count())});

    if (!result) {
        // 반쯤 열린 소켓은 해제하고, 호출자가 같은 세션으로 재시도할 수 있게 둔다
        close();
        state_ = SessionState::kUnconnected;
        log_session_event("connect", &result.error());
        return result;
    }

    state_ = SessionState::kConnected;
    log_session_event("connect", nullptr);
    return {};
}

auto RconSession::do_connect() -> boost::asio::awaitable<std::expected<void, RconError>> {
    boost::system::error_code ec;

    const auto endpoints = co_await resolver_.async_resolve(
        params_.host,
        std::to_string(params_.port),
        boost::asio::redirect_error(boost::asio::use_awaitable, ec)
    );

    if (ec) {
        co_return std::unexpected(RconError{
            RconErrorCode::kConnectionError,
            "failed to resolve host",
            fmt::format("{}: {}", params_.host, ec.message())
        });
    }

    co_await boost::asio::async_connect(
        socket_,
        endpoints,
        boost::asio::redirect_error(boost::asio::use_awaitable, ec)
    );

    if (ec) {
        co_return std::unexpected(RconError{
            RconErrorCode::kConnectionError,
            "failed to connect",
            fmt::format("{}:{}: {}", params_.host, params_.port, ec.message())
        });
    }

    co_return std::expected<void, RconError>{};
}

// ---------------------------------------------------------------------------
// authenticate
// ---------------------------------------------------------------------------
auto RconSession::authenticate() -> std::expected<void, RconError> {
    if (auto ok = require_state(SessionState::kConnected, "authenticate"); !ok) {
        return ok;
    }

    auto result = run_blocking(
        do_authenticate(),
        RconError{RconErrorCode::kTimeout,
                  "timed out waiting for auth response",
                  fmt::format("after {}ms", params_.timeout.count())});

    if (!result) {
        close_if_stream_broken(result.error());
        log_session_event("authenticate", &result.error());
        return result;
    }

    state_ = SessionState::kAuthenticated;
    log_session_event("authenticate", nullptr);
    return {};
}

auto RconSession::do_authenticate() -> boost::asio::awaitable<std::expected<void, RconError>> {
    auto sent = co_await send_packet(RequestKind::kAuth, params_.password);
    if (!sent) {
        co_return std::unexpected(sent.error());
    }

    for (int packet_no = 1; packet_no <= kMaxAuthPackets; ++packet_no) {
        auto pkt = co_await read_packet();
        if (!pkt) {
            co_return std::unexpected(pkt.error());
        }

        switch (evaluate_auth_packet(*pkt, packet_no)) {
            case AuthVerdict::kAccepted:
                co_return std::expected<void, RconError>{};
            case AuthVerdict::kRejected:
                co_return std::unexpected(RconError{
                    RconErrorCode::kAuthenticationFailed,
                    "invalid password",
                    fmt::format("{}:{}", params_.host, params_.port)
                });
            case AuthVerdict::kReadAnother:
                if (logger_) {
                    logger_->debug(fmt::format(
                        "auth: skipping preliminary packet (id={}, type={}, {} bytes)",
                        pkt->request_id(), pkt->type(), pkt->body().size()));
                }
                break;
        }
    }

    // evaluate_auth_packet 은 마지막 패킷에서 kReadAnother 를 반환하지 않는다
    co_return std::unexpected(RconError{
        RconErrorCode::kIoError, "auth response not resolved", {}
    });
}

// ---------------------------------------------------------------------------
// command
// ---------------------------------------------------------------------------
auto RconSession::command(std::string_view text) -> std::expected<std::string, RconError> {
    if (auto ok = require_state(SessionState::kAuthenticated, "command"); !ok) {
        return std::unexpected(ok.error());
    }

    const auto started = std::chrono::steady_clock::now();

    auto result = run_blocking(
        do_command(std::string{text}),
        RconError{RconErrorCode::kTimeout,
                  "timed out waiting for command response",
                  fmt::format("after {}ms", params_.timeout.count())});

    CommandLog entry;
    entry.request_id    = request_id_;
    entry.command_bytes = text.size();
    entry.timestamp     = std::chrono::system_clock::now();
    entry.duration      = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - started);

    if (!result) {
        close_if_stream_broken(result.error());
        if (logger_) {
            entry.outcome = std::string{to_string(result.error().code)};
            logger_->log_command(entry);
        }
        return std::unexpected(result.error());
    }

    if (logger_) {
        entry.response_id    = result->request_id();
        entry.response_bytes = result->body().size();
        entry.outcome        = "ok";
        logger_->log_command(entry);

        if (result->request_id() != request_id_) {
            logger_->warn(fmt::format("command: response id {} does not match request id {}",
                                      result->request_id(), request_id_));
        }
        if (result->kind(ProtocolPhase::kCommand) != PacketKind::kResponseValue) {
            logger_->warn(fmt::format("command: unexpected response packet type {}",
                                      result->type()));
        }
    }

    return result->body();
}

auto RconSession::do_command(std::string text)
    -> boost::asio::awaitable<std::expected<RconPacket, RconError>>
{
    auto sent = co_await send_packet(RequestKind::kExecCommand, std::move(text));
    if (!sent) {
        co_return std::unexpected(sent.error());
    }
    co_return co_await read_packet();
}

// ---------------------------------------------------------------------------
// close
// ---------------------------------------------------------------------------
void RconSession::close() noexcept {
    resolver_.cancel();

    const bool was_open = socket_.is_open();
    if (was_open) {
        boost::system::error_code ec;
        // peer 가 이미 끊었으면 shutdown 은 실패한다. close 는 계속 진행.
        socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

    state_ = SessionState::kClosed;

    if (was_open) {
        try {
            log_session_event("close", nullptr);
        } catch (const std::exception& e) {
            // close() 는 실패를 전파하지 않는다. 로그 기록만 건너뛴다.
            (void)e;
        }
    }
}

// ---------------------------------------------------------------------------
// 패킷 송수신
// ---------------------------------------------------------------------------
auto RconSession::send_packet(RequestKind kind, std::string body)
    -> boost::asio::awaitable<std::expected<void, RconError>>
{
    const auto id = next_request_id();
    if (!id) {
        co_return std::unexpected(id.error());
    }

    const auto bytes = RconPacket::make(*id, kind, std::move(body)).serialize();
    if (!bytes) {
        co_return std::unexpected(bytes.error());
    }

    boost::system::error_code ec;
    co_await boost::asio::async_write(
        socket_,
        boost::asio::buffer(*bytes),
        boost::asio::redirect_error(boost::asio::use_awaitable, ec)
    );

    if (ec) {
        co_return std::unexpected(socket_error(ec, "sending packet"));
    }

    co_return std::expected<void, RconError>{};
}

auto RconSession::read_packet() -> boost::asio::awaitable<std::expected<RconPacket, RconError>> {
    std::array<std::uint8_t, kLengthPrefixSize> prefix{};
    boost::system::error_code ec;

    // async_read 는 요청한 바이트 수가 찰 때까지 부분 수신을 반복한다
    co_await boost::asio::async_read(
        socket_,
        boost::asio::buffer(prefix),
        boost::asio::redirect_error(boost::asio::use_awaitable, ec)
    );

    if (ec) {
        co_return std::unexpected(socket_error(ec, "reading packet length"));
    }

    const std::int32_t length = decode_length_prefix(prefix);
    if (auto ok = check_packet_length(length); !ok) {
        co_return std::unexpected(ok.error());
    }

    std::vector<std::uint8_t> payload(static_cast<std::size_t>(length));
    co_await boost::asio::async_read(
        socket_,
        boost::asio::buffer(payload),
        boost::asio::redirect_error(boost::asio::use_awaitable, ec)
    );

    if (ec) {
        co_return std::unexpected(socket_error(ec, "reading packet body"));
    }

    co_return RconPacket::parse_payload(payload);
}

auto RconSession::next_request_id() -> std::expected<std::int32_t, RconError> {
    if (request_id_ == std::numeric_limits<std::int32_t>::max()) {
        return std::unexpected(RconError{
            RconErrorCode::kProtocolState, "request id space exhausted", {}
        });
    }
    return ++request_id_;
}

auto RconSession::require_state(SessionState expected, std::string_view operation) const
    -> std::expected<void, RconError>
{
    if (state_ == expected) {
        return {};
    }
    return std::unexpected(RconError{
        RconErrorCode::kProtocolState,
        fmt::format("{}() requires a {} session", operation, to_string(expected)),
        fmt::format("current state: {}", to_string(state_))
    });
}

void RconSession::close_if_stream_broken(const RconError& error) noexcept {
    if (is_stream_fatal(error.code)) {
        close();
    }
}

void RconSession::log_session_event(std::string_view event, const RconError* error) {
    if (!logger_) {
        return;
    }

    SessionLog entry;
    entry.event     = std::string{event};
    entry.host      = params_.host;
    entry.port      = params_.port;
    entry.outcome   = error == nullptr ? "ok" : std::string{to_string(error->code)};
    entry.timestamp = std::chrono::system_clock::now();
    logger_->log_session(entry);

    if (error != nullptr) {
        logger_->debug(fmt::format("{} failed: {} ({})", event, error->message, error->context));
    }
}
