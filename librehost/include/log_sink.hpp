#ifndef REHOST_LOG_SINK_HPP
#define REHOST_LOG_SINK_HPP

#include <string_view>

/**
 * @brief Severity levels for log messages.
 */
enum class LogLevel {
    Debug,   ///< Per-pixel, per-chunk and per-hop diagnostics
    Info,    ///< Pipeline decisions: resize, format, dedup, upload
    Warning, ///< Fallbacks taken and degraded results
    Error    ///< Failures surfaced to the caller
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations decide where a message ends up (console, file, test
 * capture). The Logger facade fans each message out to every installed sink.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Component that emitted the message.
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

#endif // REHOST_LOG_SINK_HPP
