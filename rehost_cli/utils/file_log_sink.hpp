#ifndef REHOST_FILE_LOG_SINK_HPP
#define REHOST_FILE_LOG_SINK_HPP

#include "../../librehost/include/log_sink.hpp"
#include "../../librehost/include/logger.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <mutex>

/**
 * @brief Appends every message to a file, one UTC-timestamped line each.
 */
class FileLogSink final : public ILogSink {
public:
    explicit FileLogSink(const std::filesystem::path& path)
        : out_(path, std::ios::app) {}

    [[nodiscard]] bool is_open() const { return out_.is_open(); }

    void log(const LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        const auto now = std::chrono::system_clock::now();
        const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()).count() % 1000;
        std::tm utc{};
        gmtime_r(&seconds, &utc);

        std::lock_guard lock(mtx_);
        if (!out_.is_open()) return;
        out_ << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << millis
             << "Z " << Logger::level_to_string(level) << " [" << tag << "] " << message << '\n';
        out_.flush();
    }

private:
    std::ofstream out_;
    std::mutex mtx_;
};

#endif // REHOST_FILE_LOG_SINK_HPP
