/**
 * @file event_report.hpp
 * @brief Log a line and mirror it to an EventSink.
 *
 * @copyright Copyright (c) 2025 AirVol Contributors
 * @license MIT License
 */

#pragma once

#include "airvol/core/connection_state.hpp"
#include "airvol/utils/logger.hpp"

#include <chrono>
#include <string>
#include <utility>

namespace airvol {
namespace core {

/**
 * @brief Format once, write to the Logger and forward to @p sink.
 *
 * TRACE lines stay in the log; everything else reaches the sink even when
 * the Logger filters it, so a UI can show debug detail on demand.
 */
template<typename... Args>
void report(EventSink* sink, utils::LogLevel level, const char* component,
            const char* format, Args&&... args) {
    std::string message = utils::Logger::format(format, std::forward<Args>(args)...);
    utils::Logger::instance().log(level, component, "{}", message);
    if (sink && level != utils::LogLevel::TRACE) {
        sink->onLog(std::chrono::system_clock::now(),
                    std::string("[") + component + "] " + message);
    }
}

}  // namespace core
}  // namespace airvol
