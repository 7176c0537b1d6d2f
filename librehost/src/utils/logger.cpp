#include "../../include/logger.hpp"
#include <algorithm>
#include <cctype>
#include <string>

std::shared_ptr<const Logger::SinkList> Logger::sinks_ = std::make_shared<const SinkList>();
std::mutex Logger::mtx_;
std::atomic<LogLevel> Logger::level_{LogLevel::Debug};

void Logger::add_sink(std::unique_ptr<ILogSink> sink) {
    if (!sink) return;
    std::lock_guard lock(mtx_);
    auto next = std::make_shared<SinkList>(*sinks_);
    next->push_back(std::move(sink));
    sinks_ = std::move(next);
}

void Logger::clear_sinks() {
    std::lock_guard lock(mtx_);
    sinks_ = std::make_shared<const SinkList>();
}

void Logger::set_level(const LogLevel level) noexcept {
    level_.store(level, std::memory_order_relaxed);
}

bool Logger::enabled(const LogLevel level) noexcept {
    return level >= level_.load(std::memory_order_relaxed);
}

void Logger::log(const LogLevel level,
                 const std::string_view msg,
                 const std::string_view tag) {
    if (!enabled(level)) return;

    std::shared_ptr<const SinkList> sinks;
    {
        std::lock_guard lock(mtx_);
        sinks = sinks_;
    }
    for (const auto& sink : *sinks) {
        sink->log(level, msg, tag);
    }
}

std::optional<LogLevel> Logger::string_to_level(const std::string_view level) {
    std::string upper(level);
    std::ranges::transform(upper, upper.begin(), [](const unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    if (upper == "DEBUG") return LogLevel::Debug;
    if (upper == "INFO") return LogLevel::Info;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::Warning;
    if (upper == "ERROR") return LogLevel::Error;
    return std::nullopt;
}
