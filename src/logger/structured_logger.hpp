#pragma once

// ---------------------------------------------------------------------------
// structured_logger.hpp
//
// spdlog 기반 구조화 JSON 로거 인터페이스.
//
// [설계 원칙]
// - 싱글턴 금지: 세션/CLI 에 생성자 주입 방식으로 전달한다.
// - stdout 은 커맨드 응답 출력 전용이므로 로그는 stderr 와
//   (선택) rotating 파일로만 보낸다.
// - 모든 구조체 필드를 snake_case JSON 키로 직렬화한다.
// ---------------------------------------------------------------------------

#include "log_types.hpp"

#include <spdlog/logger.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>

// ---------------------------------------------------------------------------
// StructuredLogger
//   SessionLog / CommandLog 를 JSON 포맷으로 기록한다.
//   내부 진단용 debug/info/warn/error 메서드도 제공한다.
// ---------------------------------------------------------------------------
class StructuredLogger {
public:
    // 생성자
    //   min_level : 이 레벨 미만의 로그는 기록하지 않는다.
    //   log_path  : 지정 시 rotating 파일 sink 를 추가한다.
    //
    //   sink 생성 실패 시 std::runtime_error.
    explicit StructuredLogger(LogLevel min_level,
                              const std::optional<std::filesystem::path>& log_path = std::nullopt);

    ~StructuredLogger();

    // 복사 금지 (spdlog 인스턴스 소유권 명확화)
    StructuredLogger(const StructuredLogger&)            = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    StructuredLogger(StructuredLogger&&)            = default;
    StructuredLogger& operator=(StructuredLogger&&) = default;

    // log_session
    //   connect / authenticate / close 이벤트를 JSON 으로 기록한다.
    void log_session(const SessionLog& entry);

    // log_command
    //   command() 결과를 JSON 으로 기록한다. 본문은 기록하지 않는다.
    void log_command(const CommandLog& entry);

    // 내부 진단용 spdlog 래퍼
    //   비밀번호를 직접 전달하지 말 것.
    void debug(std::string_view msg);
    void info(std::string_view msg);
    void warn(std::string_view msg);
    void error(std::string_view msg);

    // 버퍼된 로그를 sink 로 밀어낸다 (테스트/종료 시)
    void flush();

private:
    LogLevel                        min_level_;
    std::shared_ptr<spdlog::logger> logger_{};

    [[nodiscard]] auto enabled(LogLevel level) const noexcept -> bool;
};

// "debug" | "info" | "warn" | "error" → LogLevel. 모르는 값이면 std::nullopt.
[[nodiscard]] auto parse_log_level(std::string_view text) -> std::optional<LogLevel>;
