/**
 * @file event_history.hpp
 * @brief EventSink that keeps the most recent log lines in memory.
 *
 * @copyright Copyright (c) 2025 AirVol Contributors
 * @license MIT License
 */

#pragma once

#include "airvol/core/connection_state.hpp"
#include "airvol/core/export.hpp"

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace airvol {
namespace core {

/**
 * @struct LogEntry
 * @brief One timestamped line as delivered to an EventSink.
 */
struct AIRVOL_CORE_API LogEntry {
    std::chrono::system_clock::time_point timestamp;
    std::string message;

    /// "HH:MM:SS message", local time.
    std::string toString() const;
};

/**
 * @class EventHistory
 * @brief Bounded, thread-safe record of log lines and the latest state.
 *
 * Oldest lines are dropped once @c capacity is reached.
 */
class AIRVOL_CORE_API EventHistory : public EventSink {
public:
    static constexpr size_t kDefaultCapacity = 200;

    explicit EventHistory(size_t capacity = kDefaultCapacity);

    void onLog(std::chrono::system_clock::time_point timestamp,
               const std::string& message) override;

    void onStateChanged(const ConnectionState& state) override;

    std::vector<LogEntry> entries() const;
    ConnectionState lastState() const;
    size_t transitionCount() const;

    /// All lines joined with '\n', oldest first.
    std::string dump() const;

    /**
     * @brief Replace the file at @p path with dump() and a trailing newline.
     * @return false with @p error set when the file cannot be written.
     */
    bool exportTo(const std::string& path, std::string& error) const;

private:
    size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<LogEntry> entries_;
    ConnectionState lastState_;
    size_t transitions_ = 0;
};

}  // namespace core
}  // namespace airvol
