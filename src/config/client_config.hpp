#pragma once

// ---------------------------------------------------------------------------
// client_config.hpp
//
// srcon 설정 해석.
//
// [우선순위]
//   명시적 플래그 > 환경변수 > YAML 설정 파일 > 내장 기본값
//
// [설계 원칙]
// - 전역 상태 금지: 환경변수는 EnvLookup 으로 주입받는다 (테스트 대체 가능).
// - 잘못된 값은 기본값으로 조용히 대체하지 않고 ConfigError 로 반환한다.
// - 비밀번호는 오류 메시지에 포함하지 않는다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "logger/log_types.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

inline constexpr std::string_view kDefaultHost        = "localhost";
inline constexpr std::uint16_t    kDefaultPort        = 25575;
inline constexpr std::string_view kDefaultPassword    = "test";
inline constexpr double           kDefaultTimeoutSec  = 10.0;
inline constexpr LogLevel         kDefaultLogLevel    = LogLevel::kWarn;

inline constexpr const char* kEnvHost     = "RCON_HOST";
inline constexpr const char* kEnvPort     = "RCON_PORT";
inline constexpr const char* kEnvPassword = "RCON_PASSWORD";
inline constexpr const char* kEnvTimeout  = "RCON_TIMEOUT";
inline constexpr const char* kEnvConfig   = "RCON_CONFIG";
inline constexpr const char* kEnvLogLevel = "RCON_LOG_LEVEL";
inline constexpr const char* kEnvLogFile  = "RCON_LOG_FILE";

// ---------------------------------------------------------------------------
// ConfigError
//   설정 해석 실패. message 는 사용자에게 그대로 출력된다.
// ---------------------------------------------------------------------------
struct ConfigError {
    std::string message{};
};

// ---------------------------------------------------------------------------
// ConfigLayer
//   한 계층(플래그 또는 YAML 파일)에서 지정된 값. 미지정 필드는 nullopt.
//   port/timeout 은 검증 전 원시 값이다.
// ---------------------------------------------------------------------------
struct ConfigLayer {
    std::optional<std::string>  host{};
    std::optional<std::int64_t> port{};
    std::optional<std::string>  password{};
    std::optional<double>       timeout_sec{};
    std::optional<std::string>  log_level{};
    std::optional<std::string>  log_file{};
    std::optional<std::string>  config_path{};  // 플래그 계층에서만 사용
};

// ---------------------------------------------------------------------------
// ClientConfig
//   해석이 끝난 최종 설정.
// ---------------------------------------------------------------------------
struct ClientConfig {
    ConnectionParams                      connection{};
    LogLevel                              log_level{kDefaultLogLevel};
    std::optional<std::filesystem::path>  log_file{};
};

// 환경변수 조회 함수. 비어 있는 값은 미설정으로 취급해야 한다.
using EnvLookup = std::function<std::optional<std::string>(const char* name)>;

// std::getenv 기반 EnvLookup
[[nodiscard]] auto process_env() -> EnvLookup;

// ---------------------------------------------------------------------------
// load_config_file
//   YAML 파일을 ConfigLayer 로 읽는다. config_path 는 채우지 않는다.
//
//   실패: 파일 없음, YAML 문법 오류, 최상위가 map 이 아님, 타입 불일치
// ---------------------------------------------------------------------------
[[nodiscard]] auto load_config_file(const std::filesystem::path& path)
    -> std::expected<ConfigLayer, ConfigError>;

// ---------------------------------------------------------------------------
// resolve_client_config
//   세 계층을 우선순위대로 합치고 검증한다.
//     port    : 1~65535
//     timeout : 유한한 양수 (초)
//     log     : "debug" | "info" | "warn" | "error"
// ---------------------------------------------------------------------------
[[nodiscard]] auto resolve_client_config(const ConfigLayer& flags,
                                         const EnvLookup&   env,
                                         const ConfigLayer& file)
    -> std::expected<ClientConfig, ConfigError>;

// ---------------------------------------------------------------------------
// load_client_config
//   설정 파일 경로(플래그 > RCON_CONFIG)를 결정해 필요하면 읽은 뒤
//   resolve_client_config 를 호출한다.
// ---------------------------------------------------------------------------
[[nodiscard]] auto load_client_config(const ConfigLayer& flags, const EnvLookup& env)
    -> std::expected<ClientConfig, ConfigError>;
