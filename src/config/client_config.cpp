// ---------------------------------------------------------------------------
// client_config.cpp
//
// 플래그 / 환경변수 / YAML 파일 / 기본값 계층을 합쳐 ClientConfig 를 만든다.
//
// [알려진 한계]
// - YAML 의 timeout 은 초 단위 숫자만 받는다 ("5s" 같은 단위 문자열 불가).
// - 1ms 미만 timeout 은 1ms 로 올림한다.
// ---------------------------------------------------------------------------

#include "config/client_config.hpp"
#include "logger/structured_logger.hpp"

#include <charconv>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <system_error>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

namespace {

// 하루. 이보다 긴 blocking 호출은 설정 실수로 본다.
constexpr double kMaxTimeoutSec = 86400.0;

// ---------------------------------------------------------------------------
// 내부 헬퍼: 문자열 전체가 정수/실수일 때만 값을 돌려준다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::optional<std::int64_t> parse_int(std::string_view raw) {
    std::int64_t value{0};
    const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), value);
    if (ec != std::errc{} || ptr != raw.data() + raw.size()) {
        return std::nullopt;
    }
    return value;
}

[[nodiscard]] std::optional<double> parse_double(std::string_view raw) {
    double value{0.0};
    const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), value);
    if (ec != std::errc{} || ptr != raw.data() + raw.size()) {
        return std::nullopt;
    }
    return value;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 스칼라 → T. 키가 없으면 nullopt, 타입이 틀리면 ConfigError.
// ---------------------------------------------------------------------------
template <typename T>
[[nodiscard]] auto read_scalar(const YAML::Node& root, const char* key)
    -> std::expected<std::optional<T>, ConfigError>
{
    const YAML::Node node = root[key];
    if (!node || node.IsNull()) {
        return std::optional<T>{};
    }
    if (!node.IsScalar()) {
        return std::unexpected(ConfigError{fmt::format("config: '{}' must be a scalar", key)});
    }
    try {
        return std::optional<T>{node.as<T>()};
    } catch (const YAML::Exception&) {
        return std::unexpected(ConfigError{
            fmt::format("config: '{}' has invalid value '{}'", key, node.Scalar())});
    }
}

// 플래그 → 환경변수 → 파일 순으로 첫 번째 값을 고른다.
template <typename T>
[[nodiscard]] std::optional<T> first_of(const std::optional<T>& flag,
                                        const std::optional<T>& env,
                                        const std::optional<T>& file) {
    if (flag) { return flag; }
    if (env)  { return env;  }
    return file;
}

[[nodiscard]] auto to_timeout(double seconds) -> std::chrono::milliseconds {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::duration<double>(seconds));
    return ms.count() < 1 ? std::chrono::milliseconds{1} : ms;
}

}  // namespace

auto process_env() -> EnvLookup {
    return [](const char* name) -> std::optional<std::string> {
        const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
        if (val == nullptr || val[0] == '\0') {
            return std::nullopt;
        }
        return std::string{val};
    };
}

auto load_config_file(const std::filesystem::path& path)
    -> std::expected<ConfigLayer, ConfigError>
{
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::BadFile&) {
        return std::unexpected(ConfigError{
            fmt::format("config: cannot open '{}'", path.string())});
    } catch (const YAML::ParserException& e) {
        // 파일 내용은 출력하지 않는다 (비밀번호 포함 가능)
        return std::unexpected(ConfigError{
            fmt::format("config: '{}' is not valid YAML (line {})", path.string(), e.mark.line + 1)});
    } catch (const YAML::Exception& e) {
        return std::unexpected(ConfigError{
            fmt::format("config: cannot load '{}': {}", path.string(), e.msg)});
    }

    if (root.IsNull()) {
        return ConfigLayer{};
    }
    if (!root.IsMap()) {
        return std::unexpected(ConfigError{
            fmt::format("config: '{}' must contain a mapping", path.string())});
    }

    ConfigLayer layer;

    auto host = read_scalar<std::string>(root, "host");
    if (!host) { return std::unexpected(host.error()); }
    layer.host = std::move(*host);

    auto port = read_scalar<std::int64_t>(root, "port");
    if (!port) { return std::unexpected(port.error()); }
    layer.port = *port;

    auto password = read_scalar<std::string>(root, "password");
    if (!password) { return std::unexpected(password.error()); }
    layer.password = std::move(*password);

    auto timeout = read_scalar<double>(root, "timeout");
    if (!timeout) { return std::unexpected(timeout.error()); }
    layer.timeout_sec = *timeout;

    auto log_level = read_scalar<std::string>(root, "log_level");
    if (!log_level) { return std::unexpected(log_level.error()); }
    layer.log_level = std::move(*log_level);

    auto log_file = read_scalar<std::string>(root, "log_file");
    if (!log_file) { return std::unexpected(log_file.error()); }
    layer.log_file = std::move(*log_file);

    return layer;
}

auto resolve_client_config(const ConfigLayer& flags,
                           const EnvLookup&   env,
                           const ConfigLayer& file)
    -> std::expected<ClientConfig, ConfigError>
{
    // ── 환경변수 계층 (숫자 형식 오류는 즉시 실패) ─────────────────────
    ConfigLayer env_layer;
    env_layer.host      = env(kEnvHost);
    env_layer.password  = env(kEnvPassword);
    env_layer.log_level = env(kEnvLogLevel);
    env_layer.log_file  = env(kEnvLogFile);

    if (const auto raw = env(kEnvPort)) {
        env_layer.port = parse_int(*raw);
        if (!env_layer.port) {
            return std::unexpected(ConfigError{
                fmt::format("{}: invalid port '{}'", kEnvPort, *raw)});
        }
    }
    if (const auto raw = env(kEnvTimeout)) {
        env_layer.timeout_sec = parse_double(*raw);
        if (!env_layer.timeout_sec) {
            return std::unexpected(ConfigError{
                fmt::format("{}: invalid timeout '{}'", kEnvTimeout, *raw)});
        }
    }

    // ── 계층 병합 ───────────────────────────────────────────────────────
    ClientConfig cfg;

    cfg.connection.host = first_of(flags.host, env_layer.host, file.host)
                              .value_or(std::string{kDefaultHost});
    cfg.connection.password = first_of(flags.password, env_layer.password, file.password)
                                  .value_or(std::string{kDefaultPassword});

    const std::int64_t port = first_of(flags.port, env_layer.port, file.port)
                                  .value_or(kDefaultPort);
    if (port < 1 || port > 65535) {
        return std::unexpected(ConfigError{
            fmt::format("port {} out of range (1-65535)", port)});
    }
    cfg.connection.port = static_cast<std::uint16_t>(port);

    const double timeout = first_of(flags.timeout_sec, env_layer.timeout_sec, file.timeout_sec)
                               .value_or(kDefaultTimeoutSec);
    if (!std::isfinite(timeout) || timeout <= 0.0 || timeout > kMaxTimeoutSec) {
        return std::unexpected(ConfigError{
            fmt::format("timeout must be in (0, {}] seconds, got {}", kMaxTimeoutSec, timeout)});
    }
    cfg.connection.timeout = to_timeout(timeout);

    if (const auto level_text = first_of(flags.log_level, env_layer.log_level, file.log_level)) {
        const auto level = parse_log_level(*level_text);
        if (!level) {
            return std::unexpected(ConfigError{
                fmt::format("unknown log level '{}' (debug|info|warn|error)", *level_text)});
        }
        cfg.log_level = *level;
    }

    if (const auto log_file = first_of(flags.log_file, env_layer.log_file, file.log_file)) {
        if (!log_file->empty()) {
            cfg.log_file = std::filesystem::path{*log_file};
        }
    }

    return cfg;
}

auto load_client_config(const ConfigLayer& flags, const EnvLookup& env)
    -> std::expected<ClientConfig, ConfigError>
{
    std::optional<std::string> config_path = flags.config_path;
    if (!config_path) {
        config_path = env(kEnvConfig);
    }

    ConfigLayer file_layer;
    if (config_path) {
        auto loaded = load_config_file(*config_path);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        file_layer = std::move(*loaded);
    }

    return resolve_client_config(flags, env, file_layer);
}
