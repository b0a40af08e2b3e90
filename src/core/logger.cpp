/**
 * @file logger.cpp
 * @brief Logger implementation with ISO 8601 timestamps.
 * @author Dimitris Kafetzis
 */

#include "core/logger.hpp"
#include "core/params.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace cluster_pilot {

std::optional<LogLevel> parse_log_level(std::string_view name) noexcept {
    if (name == "debug")    return LogLevel::Debug;
    if (name == "info")     return LogLevel::Info;
    if (name == "warn")     return LogLevel::Warn;
    if (name == "error")    return LogLevel::Error;
    if (name == "critical") return LogLevel::Critical;
    return std::nullopt;
}

Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

void Logger::debug(std::string_view component, std::string_view message) {
    log(LogLevel::Debug, component, message);
}
void Logger::info(std::string_view component, std::string_view message) {
    log(LogLevel::Info, component, message);
}
void Logger::warn(std::string_view component, std::string_view message) {
    log(LogLevel::Warn, component, message);
}
void Logger::error(std::string_view component, std::string_view message) {
    log(LogLevel::Error, component, message);
}
void Logger::critical(std::string_view component, std::string_view message) {
    log(LogLevel::Critical, component, message);
}

void Logger::log(LogLevel level, std::string_view component, std::string_view message) {
    if (level < min_level_) return;

    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&time_t_now, &utc);

    std::ostringstream oss;
    oss << R"({"level":")" << to_string(level) << R"(",)"
        << R"("ts":")"
        << std::put_time(&utc, "%FT%T")
        << '.' << std::setfill('0') << std::setw(3) << ms.count()
        << R"(Z",)"
        << R"("component":")" << json_escape(component) << R"(",)"
        << R"("msg":")" << json_escape(message) << R"("})";

    std::lock_guard lock(mutex_);
    ++counts_[static_cast<size_t>(level)];
    if (sink_) sink_->write(oss.str());
}

void Logger::flush() {
    std::lock_guard lock(mutex_);
    if (sink_) sink_->flush();
}

void Logger::set_level(LogLevel level) noexcept { min_level_ = level; }
LogLevel Logger::level() const noexcept { return min_level_; }

uint64_t Logger::count_at_least(LogLevel level) const noexcept {
    std::lock_guard lock(mutex_);
    uint64_t total = 0;
    for (size_t i = static_cast<size_t>(level); i < 5; ++i) total += counts_[i];
    return total;
}

}  // namespace cluster_pilot
