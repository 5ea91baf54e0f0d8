/**
 * @file logger.cpp
 * @brief Logger line assembly and error text helpers.
 *
 * @copyright Copyright (c) 2025 AirVol Contributors
 * @license MIT License
 */

#include "airvol/utils/logger.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace airvol {
namespace utils {

namespace {

struct LevelStyle {
    const char* name;
    const char* color;
};

// Indexed by LogLevel
constexpr LevelStyle kLevelStyles[] = {
    {"TRACE", "\033[90m"},
    {"DEBUG", "\033[36m"},
    {"INFO ", "\033[32m"},
    {"WARN ", "\033[33m"},
    {"ERROR", "\033[31m"},
    {"FATAL", "\033[35;1m"},
    {"OFF  ", ""},
};

const LevelStyle* styleFor(LogLevel level) {
    int index = static_cast<int>(level);
    if (index < 0 || index > static_cast<int>(LogLevel::OFF)) {
        return nullptr;
    }
    return &kLevelStyles[index];
}

void writeTimestamp(std::ostream& out) {
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &seconds);
#else
    localtime_r(&seconds, &local);
#endif
    out << '[' << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << millis << "] ";
}

}  // namespace

const char* logLevelToString(LogLevel level) {
    const LevelStyle* style = styleFor(level);
    return style ? style->name : "?????";
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger()
    : level_(static_cast<int>(LogLevel::INFO))
    , colorEnabled_(true)
    , stream_(&std::cerr)
{}

void Logger::setStream(std::ostream* stream) {
    std::lock_guard<std::mutex> lock(mutex_);
    stream_ = stream ? stream : &std::cerr;
}

void Logger::write(LogLevel level, const char* component, const std::string& message) {
    std::ostringstream line;
    writeTimestamp(line);

    const LevelStyle* style = styleFor(level);
    bool color = style && colorEnabled_.load(std::memory_order_relaxed) && *style->color;
    if (color) {
        line << style->color;
    }
    line << '[' << logLevelToString(level) << ']';
    if (color) {
        line << "\033[0m";
    }
    line << " [" << component << "] " << message << '\n';

    {
        std::lock_guard<std::mutex> lock(mutex_);
        *stream_ << line.str() << std::flush;
    }

    if (level == LogLevel::FATAL) {
        std::abort();
    }
}

std::string describeError(int code) {
    char buffer[256] = {0};
    const char* text = buffer;
#if defined(_WIN32)
    strerror_s(buffer, sizeof(buffer), code);
#elif (_POSIX_C_SOURCE >= 200112L) && !defined(_GNU_SOURCE)
    if (strerror_r(code, buffer, sizeof(buffer)) != 0) {
        std::snprintf(buffer, sizeof(buffer), "unknown error");
    }
#else
    // GNU strerror_r may return a static string instead of filling buffer
    text = strerror_r(code, buffer, sizeof(buffer));
#endif
    return std::to_string(code) + " (" + text + ")";
}

}  // namespace utils
}  // namespace airvol
