#ifndef REHOST_CONSOLE_LOG_SINK_HPP
#define REHOST_CONSOLE_LOG_SINK_HPP

#include "../../librehost/include/log_sink.hpp"
#include "../../librehost/include/logger.hpp"
#include <iomanip>
#include <iostream>
#include <mutex>

/**
 * @brief Writes log lines to stderr; stdout is reserved for JSON output.
 */
class ConsoleLogSink final : public ILogSink {
public:
    explicit ConsoleLogSink(const LogLevel threshold) : threshold_(threshold) {}

    [[nodiscard]] LogLevel threshold() const noexcept { return threshold_; }

    void log(const LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (level < threshold_) return;

        std::lock_guard lock(mtx_);
        std::cerr << "rehost: " << std::left << std::setw(5) << Logger::level_to_string(level)
                  << ' ' << tag << ": " << message << '\n';
    }

private:
    LogLevel threshold_;
    std::mutex mtx_;
};

#endif // REHOST_CONSOLE_LOG_SINK_HPP
