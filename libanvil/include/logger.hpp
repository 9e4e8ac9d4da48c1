/**
 * @file logger.hpp
 * @brief Static, thread-safe logging facade used by every anvil component.
 */

#ifndef ANVIL_LOGGER_HPP
#define ANVIL_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Static logging facade for anvil.
 *
 * Messages are delivered to every registered ILogSink. With no sink
 * installed, logging is a no-op, which is what library users and the
 * unit tests get by default.
 */
class Logger {
public:
    /**
     * @brief Add a new log sink. The Logger takes ownership of the sink.
     * @param sink Unique pointer to a sink implementation.
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /**
     * @brief Remove a previously added sink.
     * @param sink Raw pointer identifying the sink to drop.
     */
    static void remove_sink(const ILogSink* sink);

    /**
     * @brief Remove all configured sinks.
     */
    static void clear_sinks();

    /**
     * @brief Log a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Component tag (default: "anvil").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "anvil");

    /**
     * @brief Converts a LogLevel enum to its string representation.
     */
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
     * @brief Parses a level name as accepted by the CLI.
     * Case-insensitive; "WARN" and "WARNING" are both accepted.
     * @return The level, or std::nullopt for "NONE" and unknown names.
     */
    static std::optional<LogLevel> string_to_level(std::string level);

private:
    static std::vector<std::unique_ptr<ILogSink>> sinks_; ///< All registered sinks.
    static std::mutex mtx_;                               ///< Protects sinks_.
};

#endif // ANVIL_LOGGER_HPP
