#pragma once

// ---------------------------------------------------------------------------
// cli.hpp
//
// srcon 명령행 셸. core(RconSession) 를 호출하는 얇은 계층이다.
//
//   srcon [flags] [command words...]
//
// 오류를 복구하지 않는다. 오류 종류별 메시지를 stderr 에 쓰고
// 종료 코드로 변환할 뿐이다.
// ---------------------------------------------------------------------------

#include "config/client_config.hpp"

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

inline constexpr int kExitSuccess     = 0;
inline constexpr int kExitFailure     = 1;
inline constexpr int kExitInterrupted = 130;

// ---------------------------------------------------------------------------
// CliOptions
//   flags : 명시적으로 지정된 플래그만 채워진다 (미지정 = nullopt)
//   words : 위치 인자 (커맨드 단어들)
// ---------------------------------------------------------------------------
struct CliOptions {
    ConfigLayer              flags{};
    std::vector<std::string> words{};
};

// ---------------------------------------------------------------------------
// CliParseResult
//   options 가 없으면 즉시 exit_code 로 종료해야 한다 (--help, 파싱 오류).
// ---------------------------------------------------------------------------
struct CliParseResult {
    std::optional<CliOptions> options{};
    int                       exit_code{kExitSuccess};
};

[[nodiscard]] auto parse_cli(int argc, const char* const* argv,
                             std::ostream& out, std::ostream& err) -> CliParseResult;

// ---------------------------------------------------------------------------
// read_command_text
//   words 를 공백 하나로 이어붙인다. words 가 비어 있고 stdin 이 터미널이
//   아니면 in 의 전체 내용을 앞뒤 공백을 제거해 사용한다.
// ---------------------------------------------------------------------------
[[nodiscard]] auto read_command_text(const std::vector<std::string>& words,
                                     std::istream&                   in,
                                     bool                            stdin_is_tty) -> std::string;

// ---------------------------------------------------------------------------
// run_cli
//   파싱 → 설정 해석 → 커맨드 획득 → connect/authenticate/command → 출력.
//   반환값은 프로세스 종료 코드.
// ---------------------------------------------------------------------------
[[nodiscard]] auto run_cli(int argc, const char* const* argv,
                           std::istream& in, std::ostream& out, std::ostream& err,
                           const EnvLookup& env, bool stdin_is_tty) -> int;
