// ---------------------------------------------------------------------------
// test_cli.cpp
//
// srcon CLI 흐름 테스트. run_cli 를 프로세스 없이 직접 호출한다.
//
// [테스트 범위]
// - 정상 커맨드 → 응답 + 개행, 종료 코드 0
// - 위치 인자 여러 개 → 공백으로 이어붙인 커맨드
// - stdin 커맨드 (앞뒤 공백 제거)
// - 커맨드 없음 / 인증 실패 / 연결 거부 / 잘못된 설정 → 종료 코드 1
// - 진행 중 SIGINT → 종료 코드 130
// - 빈 응답 → 출력 없음
// ---------------------------------------------------------------------------

#include "cli/cli.hpp"
#include "mock_rcon_server.hpp"

#include <gtest/gtest.h>

#include <signal.h>
#include <unistd.h>

#include <map>
#include <sstream>
#include <string>
#include <vector>

namespace {

EnvLookup no_env() {
    return [](const char*) -> std::optional<std::string> { return std::nullopt; };
}

EnvLookup env_of(std::map<std::string, std::string> vars) {
    return [vars = std::move(vars)](const char* name) -> std::optional<std::string> {
        const auto it = vars.find(name);
        if (it == vars.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

// 인자 목록 → argv 로 run_cli 실행
struct CliRun {
    int         exit_code{-1};
    std::string out;
    std::string err;
};

CliRun run(const std::vector<std::string>& args,
           const EnvLookup&                env   = no_env(),
           const std::string&              input = "",
           bool                            tty   = true) {
    std::vector<const char*> argv{"srcon"};
    for (const auto& a : args) {
        argv.push_back(a.c_str());
    }

    std::istringstream in{input};
    std::ostringstream out;
    std::ostringstream err;

    CliRun result;
    result.exit_code = run_cli(static_cast<int>(argv.size()), argv.data(), in, out, err, env, tty);
    result.out       = out.str();
    result.err       = err.str();
    return result;
}

// 인증 후 받은 커맨드를 "OK: <body>" 로 되돌려주는 서버 handler
void echo_server(MockConnection& conn) {
    if (auto auth = conn.read()) {
        if (auth->body() != "test") {
            conn.send(kAuthFailureId, kServerdataAuthResponse, "");
            conn.drain();
            return;
        }
        conn.send(auth->request_id(), kServerdataResponseValue, "");
        conn.send(auth->request_id(), kServerdataAuthResponse, "");
    }
    while (auto req = conn.read()) {
        conn.send(req->request_id(), kServerdataResponseValue, "OK: " + req->body());
    }
}

} // namespace

TEST(CliTest, CommandPrintedWithNewline) {
    MockRconServer server{echo_server};

    const auto r = run({"-H", "127.0.0.1", "-P", std::to_string(server.port()), "list"});
    EXPECT_EQ(r.exit_code, kExitSuccess) << r.err;
    EXPECT_EQ(r.out, "OK: list\n");
}

TEST(CliTest, WordsJoinedWithSpaces) {
    MockRconServer server{echo_server};

    const auto r = run({"--host", "127.0.0.1", "--port", std::to_string(server.port()),
                        "say", "hello", "world"});
    EXPECT_EQ(r.exit_code, kExitSuccess) << r.err;
    EXPECT_EQ(r.out, "OK: say hello world\n");
}

TEST(CliTest, CommandFromStdin) {
    MockRconServer server{echo_server};

    const auto r = run({"-H", "127.0.0.1", "-P", std::to_string(server.port())},
                       no_env(), "  status\n", /*tty=*/false);
    EXPECT_EQ(r.exit_code, kExitSuccess) << r.err;
    EXPECT_EQ(r.out, "OK: status\n");
}

TEST(CliTest, HostAndPortFromEnvironment) {
    MockRconServer server{echo_server};

    const auto r = run({"list"}, env_of({
        {"RCON_HOST", "127.0.0.1"},
        {"RCON_PORT", std::to_string(server.port())},
    }));
    EXPECT_EQ(r.exit_code, kExitSuccess) << r.err;
    EXPECT_EQ(r.out, "OK: list\n");
}

TEST(CliTest, EmptyResponsePrintsNothing) {
    MockRconServer server{[](MockConnection& conn) {
        if (auto auth = conn.read()) {
            conn.send(auth->request_id(), kServerdataAuthResponse, "");
        }
        if (auto req = conn.read()) {
            conn.send(req->request_id(), kServerdataResponseValue, "");
        }
        conn.drain();
    }};

    const auto r = run({"-H", "127.0.0.1", "-P", std::to_string(server.port()), "noop"});
    EXPECT_EQ(r.exit_code, kExitSuccess) << r.err;
    EXPECT_TRUE(r.out.empty());
}

TEST(CliTest, MissingCommandFails) {
    const auto r = run({"-H", "127.0.0.1"});
    EXPECT_EQ(r.exit_code, kExitFailure);
    EXPECT_NE(r.err.find("no command"), std::string::npos);
    EXPECT_TRUE(r.out.empty());
}

TEST(CliTest, WrongPasswordFails) {
    MockRconServer server{echo_server};

    const auto r = run({"-H", "127.0.0.1", "-P", std::to_string(server.port()),
                        "-p", "wrong", "list"});
    EXPECT_EQ(r.exit_code, kExitFailure);
    EXPECT_NE(r.err.find("invalid password"), std::string::npos);
    EXPECT_EQ(r.err.find("wrong"), std::string::npos);
    EXPECT_TRUE(r.out.empty());
}

TEST(CliTest, ConnectionRefusedFails) {
    const auto r = run({"-H", "127.0.0.1", "-P", std::to_string(unused_local_port()), "list"});
    EXPECT_EQ(r.exit_code, kExitFailure);
    EXPECT_NE(r.err.find("error:"), std::string::npos);
}

TEST(CliTest, InvalidPortEnvironmentFails) {
    const auto r = run({"list"}, env_of({{"RCON_PORT", "notaport"}}));
    EXPECT_EQ(r.exit_code, kExitFailure);
    EXPECT_NE(r.err.find("RCON_PORT"), std::string::npos);
}

TEST(CliTest, UnknownFlagIsParseError) {
    const auto r = run({"--bogus", "list"});
    EXPECT_NE(r.exit_code, kExitSuccess);
}

TEST(CliTest, HelpExitsSuccessfully) {
    const auto r = run({"--help"});
    EXPECT_EQ(r.exit_code, kExitSuccess);
    EXPECT_NE(r.out.find("--host"), std::string::npos);
}

// 인증 응답을 기다리는 중 SIGINT 가 오면 진행 중인 호출을 끊고 130 으로 끝난다
TEST(CliTest, InterruptReturns130) {
    MockRconServer server{[](MockConnection& conn) {
        if (conn.read()) {
            ::kill(::getpid(), SIGINT);
        }
        conn.drain();
    }};

    const auto r = run({"-H", "127.0.0.1", "-P", std::to_string(server.port()), "list"});
    EXPECT_EQ(r.exit_code, kExitInterrupted) << r.err;
    EXPECT_NE(r.err.find("interrupted"), std::string::npos);
    EXPECT_TRUE(r.out.empty());
}

TEST(ReadCommandText, PrefersWordsOverStdin) {
    std::istringstream in{"ignored"};
    EXPECT_EQ(read_command_text({"a", "b"}, in, false), "a b");
}

TEST(ReadCommandText, TerminalStdinGivesNothing) {
    std::istringstream in{"status"};
    EXPECT_TRUE(read_command_text({}, in, true).empty());
}
