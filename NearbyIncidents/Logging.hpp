// File: Logging.hpp
#ifndef LOGGING_HPP
#define LOGGING_HPP

#include <string>

namespace IncidentFetching {

    enum class LogLevel { Debug, Info, Warning, Error };

    /** @brief Enables or disables Debug-level output (off by default). */
    void setDebugLogging(bool enabled);
    bool debugLoggingEnabled();

    /**
     * @brief Writes one prefixed line. Info/Debug go to stdout, Warning/Error to stderr.
     *        Calls from different threads never interleave within a line.
     */
    void logMessage(LogLevel level, const std::string& message);

    inline void logDebug(const std::string& message) { logMessage(LogLevel::Debug, message); }
    inline void logInfo(const std::string& message) { logMessage(LogLevel::Info, message); }
    inline void logWarning(const std::string& message) { logMessage(LogLevel::Warning, message); }
    inline void logError(const std::string& message) { logMessage(LogLevel::Error, message); }

} // namespace IncidentFetching

#endif // LOGGING_HPP
