#include "cli/cli.hpp"

#include "client/rcon_session.hpp"
#include "logger/structured_logger.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <CLI/CLI.hpp>

#include <csignal>
#include <iterator>
#include <memory>
#include <ostream>
#include <stdexcept>

// ---------------------------------------------------------------------------
// srcon CLI 구현
//
// run_cli() 흐름:
//   1. parse_cli()            : CLI11 로 플래그/위치 인자 파싱
//   2. load_client_config()   : 플래그 > 환경변수 > YAML > 기본값
//   3. read_command_text()    : 위치 인자 또는 stdin
//   4. StructuredLogger 생성  : stderr (+ 선택 파일)
//   5. SIGINT 감시 등록 → connect → authenticate → command
//   6. 응답 출력 (비어 있으면 출력 없음)
// ---------------------------------------------------------------------------

namespace {

void report(std::ostream& err, const RconError& error) {
    err << "error: " << error.message;
    if (!error.context.empty()) {
        err << " (" << error.context << ')';
    }
    err << '\n';
}

auto trim(std::string_view text) -> std::string {
    constexpr std::string_view kSpace = " \t\r\n\v\f";
    const auto first = text.find_first_not_of(kSpace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(kSpace);
    return std::string{text.substr(first, last - first + 1)};
}

}  // namespace

auto parse_cli(int argc, const char* const* argv,
               std::ostream& out, std::ostream& err) -> CliParseResult
{
    CliOptions opts;

    CLI::App app{"Send a command to a Source RCON server and print the response", "srcon"};

    app.add_option("-H,--host", opts.flags.host, "Server host (env RCON_HOST, default localhost)");
    app.add_option("-P,--port", opts.flags.port, "Server port (env RCON_PORT, default 25575)");
    app.add_option("-p,--password", opts.flags.password,
                   "RCON password (env RCON_PASSWORD, default test)");
    app.add_option("-t,--timeout", opts.flags.timeout_sec,
                   "Seconds per blocking call (env RCON_TIMEOUT, default 10.0)");
    app.add_option("-c,--config", opts.flags.config_path, "YAML config file (env RCON_CONFIG)");
    app.add_option("--log-level", opts.flags.log_level,
                   "debug|info|warn|error (env RCON_LOG_LEVEL, default warn)");
    app.add_option("--log-file", opts.flags.log_file, "Also write logs to this file (env RCON_LOG_FILE)");
    app.add_option("command", opts.words, "Command words; read from stdin when omitted");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return CliParseResult{std::nullopt, app.exit(e, out, err)};
    }

    return CliParseResult{std::move(opts), kExitSuccess};
}

auto read_command_text(const std::vector<std::string>& words,
                       std::istream&                   in,
                       bool                            stdin_is_tty) -> std::string
{
    if (!words.empty()) {
        std::string joined;
        for (const auto& word : words) {
            if (!joined.empty()) {
                joined += ' ';
            }
            joined += word;
        }
        return joined;
    }

    if (stdin_is_tty) {
        return {};
    }

    const std::string content{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    return trim(content);
}

auto run_cli(int argc, const char* const* argv,
             std::istream& in, std::ostream& out, std::ostream& err,
             const EnvLookup& env, bool stdin_is_tty) -> int
{
    // ── 1. 플래그 파싱 ──────────────────────────────────────────────────
    auto parsed = parse_cli(argc, argv, out, err);
    if (!parsed.options) {
        return parsed.exit_code;
    }

    // ── 2. 설정 해석 ────────────────────────────────────────────────────
    auto config = load_client_config(parsed.options->flags, env);
    if (!config) {
        err << "error: " << config.error().message << '\n';
        return kExitFailure;
    }

    // ── 3. 커맨드 획득 ──────────────────────────────────────────────────
    const std::string command = read_command_text(parsed.options->words, in, stdin_is_tty);
    if (command.empty()) {
        err << "error: no command given\n";
        return kExitFailure;
    }

    // ── 4. 로거 ─────────────────────────────────────────────────────────
    std::shared_ptr<StructuredLogger> logger;
    try {
        logger = std::make_shared<StructuredLogger>(config->log_level, config->log_file);
    } catch (const std::runtime_error& e) {
        err << "error: " << e.what() << '\n';
        return kExitFailure;
    }

    // ── 5. 세션 ─────────────────────────────────────────────────────────
    boost::asio::io_context ioc;
    RconSession             session{ioc, config->connection, logger};

    // SIGINT: 진행 중인 blocking 호출을 소켓 해제로 중단시킨다
    bool interrupted = false;
    boost::asio::signal_set signals{ioc, SIGINT};
    signals.async_wait([&](const boost::system::error_code& ec, int /*signo*/) {
        if (!ec) {
            interrupted = true;
            logger->info("interrupted");
            session.close();
        }
    });

    auto fail = [&](const RconError& error) -> int {
        if (interrupted) {
            err << "interrupted\n";
            return kExitInterrupted;
        }
        report(err, error);
        return kExitFailure;
    };

    if (auto connected = session.connect(); !connected) {
        return fail(connected.error());
    }
    if (auto authed = session.authenticate(); !authed) {
        return fail(authed.error());
    }

    auto response = session.command(command);
    if (!response) {
        return fail(response.error());
    }

    // ── 6. 출력 ─────────────────────────────────────────────────────────
    if (!response->empty()) {
        out << *response << '\n';
    }

    session.close();
    return kExitSuccess;
}
