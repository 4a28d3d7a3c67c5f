#pragma once

/// @file csikit/utest/log_capture.hpp
/// @brief Captures everything written through the LOG_* macros in tests

#include <memory>
#include <sstream>
#include <string>

#include <gtest/gtest.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/ostream_sink.h>

#include <csikit/logging/log.hpp>

CSIKIT_NAMESPACE_BEGIN

namespace utest {

/// @brief Replaces the default logger with an in-memory one for the lifetime of the object.
///
/// Records are formatted as "<level> <message>", one per line.
class LogCapture final {
public:
    explicit LogCapture(logging::Level level = logging::Level::kTrace)
        : old_logger_(logging::GetDefaultLogger()), old_level_(logging::GetDefaultLoggerLevel()) {
        auto logger =
            std::make_shared<spdlog::logger>("csikit-test", std::make_shared<spdlog::sinks::ostream_sink_mt>(stream_));
        logger->set_pattern("%l %v");
        logging::SetDefaultLogger(std::move(logger));
        logging::SetDefaultLoggerLevel(level);
    }

    ~LogCapture() {
        logging::SetDefaultLogger(old_logger_);
        logging::SetDefaultLoggerLevel(old_level_);
    }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    std::string GetText() const {
        logging::GetDefaultLogger()->flush();
        return stream_.str();
    }

private:
    std::ostringstream stream_;
    logging::LoggerPtr old_logger_;
    logging::Level old_level_;
};

}  // namespace utest

CSIKIT_NAMESPACE_END
