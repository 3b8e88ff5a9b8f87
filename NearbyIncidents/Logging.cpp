// File: Logging.cpp

#include "Logging.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace IncidentFetching {

    namespace {
        std::mutex g_log_mutex;
        std::atomic<bool> g_debug_enabled{ false };

        const char* prefixFor(LogLevel level) {
            switch (level) {
            case LogLevel::Debug:   return "Debug: ";
            case LogLevel::Info:    return "Info: ";
            case LogLevel::Warning: return "Warning: ";
            case LogLevel::Error:   return "Error: ";
            }
            return "";
        }
    }

    void setDebugLogging(bool enabled) {
        g_debug_enabled.store(enabled);
    }

    bool debugLoggingEnabled() {
        return g_debug_enabled.load();
    }

    void logMessage(LogLevel level, const std::string& message) {
        if (level == LogLevel::Debug && !g_debug_enabled.load()) {
            return;
        }
        std::lock_guard<std::mutex> lock(g_log_mutex);
        if (level == LogLevel::Warning || level == LogLevel::Error) {
            std::cerr << prefixFor(level) << message << std::endl;
        }
        else {
            std::cout << prefixFor(level) << message << std::endl;
        }
    }

} // namespace IncidentFetching
