#ifndef ANVIL_LOG_SINK_HPP
#define ANVIL_LOG_SINK_HPP

#include <string_view>

/**
 * @brief Severity levels for log messages.
 *
 * Sinks use the level to filter and colour their output.
 */
enum class LogLevel {
    Debug,   ///< Per-candidate and per-frame diagnostics
    Info,    ///< Pipeline milestones (metadata ready, winner chosen)
    Warning, ///< Recovered failures (a candidate skipped, a frame undecodable)
    Error    ///< Failures that end an optimization run
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations decide where a message goes (console, file, a
 * library observer). The Logger fans every message out to all
 * installed sinks.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Component that produced the message (e.g. "optimizer").
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

#endif // ANVIL_LOG_SINK_HPP
