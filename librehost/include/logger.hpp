/**
 * @file logger.hpp
 * @brief Static, thread-safe logging facade shared by every component.
 */

#ifndef REHOST_LOGGER_HPP
#define REHOST_LOGGER_HPP

#include "log_sink.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

/**
 * @brief Static logging facade for rehost.
 *
 * Messages at or above the global level are delivered to every registered
 * ILogSink. Sinks are called outside the registry lock, so image workers
 * logging concurrently only contend inside the sinks themselves. With no
 * sinks installed logging is a no-op.
 */
class Logger {
public:
    /**
     * @brief Register a sink. The Logger takes ownership of it.
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /**
     * @brief Remove all sinks. Messages being delivered finish on the old set.
     */
    static void clear_sinks();

    /**
     * @brief Drop messages below @p level before they reach any sink.
     */
    static void set_level(LogLevel level) noexcept;

    /**
     * @return true if a message at @p level would be delivered. Use it to skip
     * building expensive Debug messages.
     */
    [[nodiscard]] static bool enabled(LogLevel level) noexcept;

    /**
     * @param tag Component that emits the message (default: "rehost").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "rehost");

    static const char* level_to_string(const LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
        }
        return "";
    }

    /**
     * @brief Parse a level name, ignoring case. "WARN" and "WARNING" both
     * map to Warning.
     * @return std::nullopt for an unknown name.
     */
    static std::optional<LogLevel> string_to_level(std::string_view level);

private:
    using SinkList = std::vector<std::shared_ptr<ILogSink>>;

    static std::shared_ptr<const SinkList> sinks_; ///< Replaced, never mutated in place
    static std::mutex mtx_;                        ///< Guards replacement of sinks_
    static std::atomic<LogLevel> level_;
};

#endif // REHOST_LOGGER_HPP
