#include <csikit/logging/log.hpp>

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <string_view>
#include <utility>

#include <spdlog/logger.h>
#include <spdlog/sinks/stdout_color_sinks.h>

CSIKIT_NAMESPACE_BEGIN

namespace logging {

namespace {

constexpr std::string_view kDefaultLoggerName = "csikit";

spdlog::level::level_enum ToSpdlogLevel(Level level) noexcept {
    switch (level) {
        case Level::kTrace:
            return spdlog::level::trace;
        case Level::kDebug:
            return spdlog::level::debug;
        case Level::kInfo:
            return spdlog::level::info;
        case Level::kWarning:
            return spdlog::level::warn;
        case Level::kError:
            return spdlog::level::err;
        case Level::kCritical:
            return spdlog::level::critical;
        case Level::kNone:
            return spdlog::level::off;
    }
    return spdlog::level::off;
}

class DefaultLoggerHolder final {
public:
    DefaultLoggerHolder()
        : logger_(std::make_shared<spdlog::logger>(
              std::string{kDefaultLoggerName}, std::make_shared<spdlog::sinks::stderr_color_sink_mt>()
          )) {
        logger_->set_level(ToSpdlogLevel(level_.load()));
    }

    LoggerPtr Get() const {
        const std::lock_guard lock{mutex_};
        return logger_;
    }

    void Set(LoggerPtr logger) {
        logger->set_level(ToSpdlogLevel(level_.load()));
        const std::lock_guard lock{mutex_};
        logger_ = std::move(logger);
    }

    Level GetLevel() const noexcept { return level_.load(std::memory_order_relaxed); }

    void SetLevel(Level level) {
        level_.store(level);
        Get()->set_level(ToSpdlogLevel(level));
    }

private:
    mutable std::mutex mutex_;
    LoggerPtr logger_;
    std::atomic<Level> level_{Level::kInfo};
};

DefaultLoggerHolder& Holder() {
    static DefaultLoggerHolder holder;
    return holder;
}

}  // namespace

LoggerPtr GetDefaultLogger() { return Holder().Get(); }

void SetDefaultLogger(LoggerPtr logger) {
    if (!logger) {
        throw std::invalid_argument("SetDefaultLogger requires a non-null logger");
    }
    Holder().Set(std::move(logger));
}

void SetDefaultLoggerLevel(Level level) { Holder().SetLevel(level); }

Level GetDefaultLoggerLevel() noexcept { return Holder().GetLevel(); }

bool ShouldLog(Level level) noexcept {
    return level != Level::kNone && static_cast<int>(level) >= static_cast<int>(GetDefaultLoggerLevel());
}

namespace impl {

LogHelper::LogHelper(Level level, const char* path, int line, const char* func) noexcept
    : level_(level), path_(path), line_(line), func_(func) {}

LogHelper::~LogHelper() {
    const auto logger = GetDefaultLogger();
    logger->log(
        spdlog::source_loc{path_, line_, func_},
        ToSpdlogLevel(level_),
        spdlog::string_view_t{buffer_.data(), buffer_.size()}
    );
}

}  // namespace impl

}  // namespace logging

CSIKIT_NAMESPACE_END
