/**
 * @file event_history.cpp
 * @brief EventHistory implementation.
 *
 * @copyright Copyright (c) 2025 AirVol Contributors
 * @license MIT License
 */

#include "airvol/core/event_history.hpp"

#include "airvol/utils/logger.hpp"

#include <cerrno>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace airvol {
namespace core {

std::string LogEntry::toString() const {
    auto time_t_ts = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_ts);
#else
    localtime_r(&time_t_ts, &tm_buf);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S") << " " << message;
    return oss.str();
}

EventHistory::EventHistory(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity)
{}

void EventHistory::onLog(std::chrono::system_clock::time_point timestamp,
                         const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(LogEntry{timestamp, message});
    while (entries_.size() > capacity_) {
        entries_.pop_front();
    }
}

void EventHistory::onStateChanged(const ConnectionState& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    lastState_ = state;
    ++transitions_;
}

std::vector<LogEntry> EventHistory::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<LogEntry>(entries_.begin(), entries_.end());
}

ConnectionState EventHistory::lastState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastState_;
}

size_t EventHistory::transitionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transitions_;
}

std::string EventHistory::dump() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string out;
    for (const auto& entry : entries_) {
        if (!out.empty()) {
            out += '\n';
        }
        out += entry.toString();
    }
    return out;
}

bool EventHistory::exportTo(const std::string& path, std::string& error) const {
    std::string text = dump();

    errno = 0;
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) {
        error = "Cannot open " + path + ": " + utils::describeError(errno);
        return false;
    }
    out << text;
    if (!text.empty()) {
        out << '\n';
    }
    out.flush();
    if (!out) {
        error = "Write to " + path + " failed";
        return false;
    }
    return true;
}

}  // namespace core
}  // namespace airvol
