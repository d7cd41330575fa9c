// ---------------------------------------------------------------------------
// structured_logger.cpp
//
// spdlog 기반 구조화 JSON 로거 구현.
// ---------------------------------------------------------------------------

#include "logger/structured_logger.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/common.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

// ---------------------------------------------------------------------------
// Helper: ISO8601 timestamp 포맷
// ---------------------------------------------------------------------------
static std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    const auto duration = tp.time_since_epoch();
    const auto seconds  = std::chrono::duration_cast<std::chrono::seconds>(duration);
    const auto millis   = std::chrono::duration_cast<std::chrono::milliseconds>(duration) - seconds;

    const std::time_t time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm           tm_val{};
    gmtime_r(&time_t_val, &tm_val);

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis.count() << 'Z';
    return oss.str();
}

// ---------------------------------------------------------------------------
// Helper: JSON 문자열 이스케이프 (기본적인 구현)
// ---------------------------------------------------------------------------
static std::string escape_json_string(const std::string& str) {
    std::string result;
    result.reserve(str.size() + 16);

    for (unsigned char ch : str) {
        switch (ch) {
            case '"':
                result += "\\\"";
                break;
            case '\\':
                result += "\\\\";
                break;
            case '\n':
                result += "\\n";
                break;
            case '\r':
                result += "\\r";
                break;
            case '\t':
                result += "\\t";
                break;
            default:
                if (ch < 0x20) {
                    char buf[8]{};
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(ch));
                    result += buf;
                } else {
                    result += static_cast<char>(ch);
                }
                break;
        }
    }

    return result;
}

static spdlog::level::level_enum to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return spdlog::level::debug;
        case LogLevel::kInfo:  return spdlog::level::info;
        case LogLevel::kWarn:  return spdlog::level::warn;
        case LogLevel::kError: return spdlog::level::err;
    }
    return spdlog::level::info;
}

auto parse_log_level(std::string_view text) -> std::optional<LogLevel> {
    if (text == "debug") { return LogLevel::kDebug; }
    if (text == "info")  { return LogLevel::kInfo;  }
    if (text == "warn")  { return LogLevel::kWarn;  }
    if (text == "error") { return LogLevel::kError; }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// StructuredLogger 생성자
// ---------------------------------------------------------------------------
StructuredLogger::StructuredLogger(LogLevel min_level,
                                   const std::optional<std::filesystem::path>& log_path)
    : min_level_(min_level)
{
    try {
        std::vector<spdlog::sink_ptr> sinks;

        // stdout 은 커맨드 응답 전용 → 진단 로그는 stderr
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_sink_mt>());

        if (log_path.has_value()) {
            if (log_path->has_parent_path()) {
                std::filesystem::create_directories(log_path->parent_path());
            }

            // Rotating file sink (5MB, 3개 파일 유지)
            const std::size_t max_file_size = 5 * 1024 * 1024;
            const std::size_t max_files     = 3;
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_path->string(), max_file_size, max_files));
        }

        logger_ = std::make_shared<spdlog::logger>("srcon", sinks.begin(), sinks.end());
        logger_->set_level(to_spdlog_level(min_level));
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        logger_->flush_on(spdlog::level::warn);

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    }
}

StructuredLogger::~StructuredLogger() {
    try {
        if (logger_) {
            logger_->flush();
        }
    } catch (const std::exception& ex) {
        std::fprintf(stderr, "srcon: log flush failed: %s\n", ex.what());
    }
}

auto StructuredLogger::enabled(LogLevel level) const noexcept -> bool {
    return logger_ && static_cast<int>(level) >= static_cast<int>(min_level_);
}

// ---------------------------------------------------------------------------
// log_session: JSON 직렬화
//   실패 outcome 은 warn, 성공은 info 레벨로 기록한다.
// ---------------------------------------------------------------------------
void StructuredLogger::log_session(const SessionLog& entry) {
    const bool ok    = entry.outcome == "ok";
    const auto level = ok ? LogLevel::kInfo : LogLevel::kWarn;
    if (!enabled(level)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":")" << escape_json_string(entry.event) << R"(","host":")"
         << escape_json_string(entry.host) << R"(","port":)" << entry.port
         << R"(,"outcome":")" << escape_json_string(entry.outcome) << R"(","timestamp":")"
         << format_iso8601(entry.timestamp) << R"("})";

    if (ok) {
        logger_->info(json.str());
    } else {
        logger_->warn(json.str());
    }
}

// ---------------------------------------------------------------------------
// log_command: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_command(const CommandLog& entry) {
    const bool ok    = entry.outcome == "ok";
    const auto level = ok ? LogLevel::kInfo : LogLevel::kWarn;
    if (!enabled(level)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"command","request_id":)" << entry.request_id
         << R"(,"response_id":)" << entry.response_id
         << R"(,"command_bytes":)" << entry.command_bytes
         << R"(,"response_bytes":)" << entry.response_bytes
         << R"(,"outcome":")" << escape_json_string(entry.outcome)
         << R"(","timestamp":")" << format_iso8601(entry.timestamp)
         << R"(","duration_us":)" << entry.duration.count() << R"(})";

    if (ok) {
        logger_->info(json.str());
    } else {
        logger_->warn(json.str());
    }
}

// ---------------------------------------------------------------------------
// 내부 진단용 spdlog 래퍼
// ---------------------------------------------------------------------------
void StructuredLogger::debug(std::string_view msg) {
    if (logger_) {
        logger_->debug(msg);
    }
}

void StructuredLogger::info(std::string_view msg) {
    if (logger_) {
        logger_->info(msg);
    }
}

void StructuredLogger::warn(std::string_view msg) {
    if (logger_) {
        logger_->warn(msg);
    }
}

void StructuredLogger::error(std::string_view msg) {
    if (logger_) {
        logger_->error(msg);
    }
}

void StructuredLogger::flush() {
    if (logger_) {
        logger_->flush();
    }
}
