/**
 * @file logger.hpp
 * @brief Thread-safe logging for the AirVol daemon.
 *
 * Lines are written as
 * "[YYYY-MM-DD HH:MM:SS.mmm] [LEVEL] [Component] message" to stderr
 * or to a stream installed with Logger::setStream(). Messages use "{}"
 * placeholders that are filled in argument order.
 *
 * @copyright Copyright (c) 2025 AirVol Contributors
 * @license MIT License
 */

#pragma once

#include "airvol/utils/export.hpp"

#include <atomic>
#include <iosfwd>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>

namespace airvol {
namespace utils {

/**
 * @enum LogLevel
 * @brief Logging severity levels. OFF disables output entirely.
 */
enum class LogLevel : int {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5,
    OFF = 6
};

/**
 * @brief Fixed-width (5 character) name of a level, as printed in log lines.
 */
AIRVOL_UTILS_API const char* logLevelToString(LogLevel level);

/**
 * @class Logger
 * @brief Process-wide logger shared by every AirVol component.
 *
 * @code
 * Logger::instance().setLevel(LogLevel::DEBUG);
 * LOG_INFO("Discovery", "Target selected: {}", target.label());
 * @endcode
 */
class AIRVOL_UTILS_API Logger {
public:
    static Logger& instance();

    void setLevel(LogLevel level) {
        level_.store(static_cast<int>(level), std::memory_order_relaxed);
    }

    LogLevel getLevel() const {
        return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
    }

    bool isEnabled(LogLevel level) const {
        return static_cast<int>(level) >= level_.load(std::memory_order_relaxed);
    }

    void setColorEnabled(bool enabled) {
        colorEnabled_.store(enabled, std::memory_order_relaxed);
    }

    /**
     * @brief Redirect output. Passing nullptr restores stderr.
     *
     * The stream must outlive every subsequent log call.
     */
    void setStream(std::ostream* stream);

    /**
     * @brief Substitute each "{}" in @p format with the next argument.
     *
     * Surplus placeholders are kept verbatim, surplus arguments dropped.
     */
    template<typename... Args>
    static std::string format(const char* format, Args&&... args) {
        std::ostringstream oss;
        append(oss, format, std::forward<Args>(args)...);
        return oss.str();
    }

    template<typename... Args>
    void log(LogLevel level, const char* component, const char* format, Args&&... args) {
        if (!isEnabled(level)) {
            return;
        }
        write(level, component, Logger::format(format, std::forward<Args>(args)...));
    }

    /**
     * @brief Emit an already formatted message. FATAL aborts after writing.
     */
    void write(LogLevel level, const char* component, const std::string& message);

private:
    Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static void append(std::ostringstream& oss, const char* format) {
        oss << format;
    }

    template<typename T, typename... Args>
    static void append(std::ostringstream& oss, const char* format, T&& value, Args&&... args) {
        for (; *format; ++format) {
            if (format[0] == '{' && format[1] == '}') {
                oss << value;
                append(oss, format + 2, std::forward<Args>(args)...);
                return;
            }
            oss << *format;
        }
    }

    std::atomic<int> level_;
    std::atomic<bool> colorEnabled_;
    std::ostream* stream_;
    std::mutex mutex_;
};

/**
 * @brief Describe an errno-style code as "<code> (<text>)".
 */
AIRVOL_UTILS_API std::string describeError(int code);

}  // namespace utils
}  // namespace airvol

// =============================================================================
// Convenience Macros
// =============================================================================

#define AIRVOL_LOG(level, component, ...) \
    ::airvol::utils::Logger::instance().log(level, component, __VA_ARGS__)

#define LOG_TRACE(component, ...) AIRVOL_LOG(::airvol::utils::LogLevel::TRACE, component, __VA_ARGS__)
#define LOG_DEBUG(component, ...) AIRVOL_LOG(::airvol::utils::LogLevel::DEBUG, component, __VA_ARGS__)
#define LOG_INFO(component, ...)  AIRVOL_LOG(::airvol::utils::LogLevel::INFO, component, __VA_ARGS__)
#define LOG_WARN(component, ...)  AIRVOL_LOG(::airvol::utils::LogLevel::WARN, component, __VA_ARGS__)
#define LOG_ERROR(component, ...) AIRVOL_LOG(::airvol::utils::LogLevel::ERROR, component, __VA_ARGS__)
#define LOG_FATAL(component, ...) AIRVOL_LOG(::airvol::utils::LogLevel::FATAL, component, __VA_ARGS__)

// Arguments are not evaluated unless the condition holds and the level is on
#define LOG_IF(level, component, condition, ...) \
    do { \
        if ((condition) && ::airvol::utils::Logger::instance().isEnabled(level)) { \
            AIRVOL_LOG(level, component, __VA_ARGS__); \
        } \
    } while (0)
