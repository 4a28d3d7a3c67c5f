#pragma once

/// @file csikit/logging/log.hpp
/// @brief Logging helpers and LOG_* macros

#include <iterator>
#include <memory>

#include <fmt/format.h>

#include <csikit/logging/level.hpp>

namespace spdlog {
class logger;
}  // namespace spdlog

CSIKIT_NAMESPACE_BEGIN

namespace logging {

using LoggerPtr = std::shared_ptr<spdlog::logger>;

/// Returns the logger all the LOG_* macros write to. By default it writes to stderr.
LoggerPtr GetDefaultLogger();

/// Replaces the default logger; the current default level is applied to the new logger.
void SetDefaultLogger(LoggerPtr logger);

void SetDefaultLoggerLevel(Level level);

Level GetDefaultLoggerLevel() noexcept;

/// Returns true if a message of @a level would reach the default logger
bool ShouldLog(Level level) noexcept;

namespace impl {

/// Collects a single log record and hands it over to the default logger on destruction
class LogHelper final {
public:
    LogHelper(Level level, const char* path, int line, const char* func) noexcept;
    ~LogHelper();

    LogHelper(const LogHelper&) = delete;
    LogHelper& operator=(const LogHelper&) = delete;

    LogHelper& AsLvalue() noexcept { return *this; }

    template <typename T>
    LogHelper& operator<<(const T& value) {
        fmt::format_to(std::back_inserter(buffer_), "{}", value);
        return *this;
    }

private:
    const Level level_;
    const char* const path_;
    const int line_;
    const char* const func_;
    fmt::memory_buffer buffer_;
};

}  // namespace impl

}  // namespace logging

CSIKIT_NAMESPACE_END

/// @brief If lvl matches the verbosity then builds a stream and evaluates a message for the default logger.
#define LOG(lvl)                                                                                            \
    for (bool csikit_impl_log_pending = ::CSIKIT_NAMESPACE::logging::ShouldLog(lvl); csikit_impl_log_pending; \
         csikit_impl_log_pending = false)                                                                   \
    ::CSIKIT_NAMESPACE::logging::impl::LogHelper(lvl, __FILE__, __LINE__, __func__).AsLvalue()

#define LOG_TRACE() LOG(::CSIKIT_NAMESPACE::logging::Level::kTrace)
#define LOG_DEBUG() LOG(::CSIKIT_NAMESPACE::logging::Level::kDebug)
#define LOG_INFO() LOG(::CSIKIT_NAMESPACE::logging::Level::kInfo)
#define LOG_WARNING() LOG(::CSIKIT_NAMESPACE::logging::Level::kWarning)
#define LOG_ERROR() LOG(::CSIKIT_NAMESPACE::logging::Level::kError)
#define LOG_CRITICAL() LOG(::CSIKIT_NAMESPACE::logging::Level::kCritical)
