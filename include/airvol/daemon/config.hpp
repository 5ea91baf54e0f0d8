/**
 * @file config.hpp
 * @brief airvold configuration, CLI parsing and environment overrides
 */

#pragma once

#include <airvol/core/connection_supervisor.hpp>
#include <airvol/core/discovery_listener.hpp>
#include <airvol/core/target.hpp>
#include <airvol/core/volume_gate.hpp>
#include <airvol/utils/logger.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace airvol {
namespace daemon {

/**
 * @brief Daemon configuration structure
 */
struct Config {
    // Discovery
    std::string service = "airvol";
    uint16_t discovery_port = 4210;
    std::string broadcast_addr = "255.255.255.255";
    int64_t discover_interval_ms = 7000;

    // Session timing
    int64_t heartbeat_ms = 5000;
    int64_t watchdog_ms = 12000;
    int64_t stale_ttl_ms = 20000;
    int64_t retry_min_ms = 50;
    int64_t retry_max_ms = 1000;
    int64_t connect_timeout_ms = 15000;

    // Volume
    double threshold = core::kDefaultChangeThreshold;
    std::string volume_command = core::CommandVolumeSink::kDefaultCommand;  ///< Empty = dry run

    // Forced target (AIRVOL_IP / AIRVOL_WS_PORT / AIRVOL_NAME or CLI)
    std::optional<std::string> forced_ip;
    std::optional<uint16_t> forced_port;
    std::optional<std::string> forced_name;

    std::string log_level = "INFO";
    bool color = true;
    std::string history_file;  ///< Event history target on SIGUSR1 and exit; empty = stderr on SIGUSR1 only
    bool help = false;

    std::string error;                  ///< Set when parsing failed
    std::vector<std::string> warnings;  ///< Ignored environment values
};

/// getenv-compatible lookup, replaceable in tests.
using EnvLookup = std::function<const char*(const char*)>;

/**
 * @brief Parse a TCP/UDP port number.
 * @return nullopt unless @p text is all digits and within 1..65535.
 */
inline std::optional<uint16_t> parsePortValue(const std::string& text) {
    if (text.empty() || text.size() > 5) {
        return std::nullopt;
    }
    if (!std::all_of(text.begin(), text.end(),
                     [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; })) {
        return std::nullopt;
    }
    long value = std::stol(text);
    if (value < 1 || value > 65535) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(value);
}

/**
 * @brief Apply AIRVOL_IP, AIRVOL_WS_PORT and AIRVOL_NAME to @p config.
 *
 * Empty values count as unset; an unusable port is ignored with a warning.
 */
inline void applyEnvironment(Config& config, const EnvLookup& lookup) {
    auto read = [&lookup](const char* name) -> std::optional<std::string> {
        const char* value = lookup ? lookup(name) : nullptr;
        if (value == nullptr || *value == '\0') {
            return std::nullopt;
        }
        return std::string(value);
    };

    if (auto ip = read("AIRVOL_IP")) {
        config.forced_ip = *ip;
    }
    if (auto port = read("AIRVOL_WS_PORT")) {
        if (auto parsed = parsePortValue(*port)) {
            config.forced_port = *parsed;
        } else {
            config.warnings.push_back("Ignoring AIRVOL_WS_PORT='" + *port + "': not a port number");
        }
    }
    if (auto name = read("AIRVOL_NAME")) {
        config.forced_name = *name;
    }
}

/**
 * @brief Print usage information
 * @param program_name Name of the executable
 */
inline void printUsage(const char* program_name) {
    std::cout << "airvold - network volume receiver\n\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Discovery Options:\n"
              << "  --service <name>            Service name in probes and announces (default: airvol)\n"
              << "  --discovery-port <port>     UDP discovery port (default: 4210)\n"
              << "  --broadcast-addr <addr>     Probe destination (default: 255.255.255.255)\n"
              << "  --discover-interval-ms <ms> Probe interval, +/-300ms jitter (default: 7000)\n"
              << "\nSession Options:\n"
              << "  --heartbeat-ms <ms>         Heartbeat interval (default: 5000)\n"
              << "  --watchdog-ms <ms>          Max silence before reconnecting (default: 12000)\n"
              << "  --stale-ttl-ms <ms>         Forget targets not seen for this long (default: 20000)\n"
              << "  --retry-min-ms <ms>         Initial retry delay (default: 50)\n"
              << "  --retry-max-ms <ms>         Maximum retry delay (default: 1000)\n"
              << "  --connect-timeout-ms <ms>   Connect and handshake timeout (default: 15000)\n"
              << "\nVolume Options:\n"
              << "  --threshold <points>        Minimum change applied (default: 0.5)\n"
              << "  --volume-command <cmd>      Command run per change, {} = percent\n"
              << "                              (default: amixer -q sset Master {}%, empty = dry run)\n"
              << "\nForced Target Options (override AIRVOL_IP, AIRVOL_WS_PORT, AIRVOL_NAME):\n"
              << "  --ip <addr>                 Connect to this address, skip discovery selection\n"
              << "  --ws-port <port>            WebSocket port to try first\n"
              << "  --name <name>               Only accept devices announcing this name\n"
              << "\n  --log-level <level>         TRACE, DEBUG, INFO, WARN, ERROR, FATAL, OFF (default: INFO)\n"
              << "  --no-color                  Disable colored log output\n"
              << "  --history-file <path>       Write the last 200 event lines here on SIGUSR1 and at exit\n"
              << "  --help                      Show this help message\n\n"
              << "Example:\n"
              << "  " << program_name << " --name Studio --log-level DEBUG\n"
              << "  " << program_name << " --ip 192.168.1.40 --ws-port 81 --volume-command ''\n";
}

/**
 * @brief Parse command line arguments
 * @param argc Argument count
 * @param argv Argument values
 * @param base Starting point, typically the environment-derived configuration
 * @return Parsed configuration; on error, help is set and error describes it
 */
inline Config parseArgs(int argc, char* argv[], Config base = Config()) {
    Config config = std::move(base);

    auto fail = [&config](const std::string& message) {
        config.error = message;
        config.help = true;
        return config;
    };

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            config.help = true;
            return config;
        }
        if (std::strcmp(arg, "--no-color") == 0) {
            config.color = false;
            continue;
        }

        // Options that require a value
        if (i + 1 >= argc) {
            return fail(std::string("Option ") + arg + " requires a value");
        }

        const std::string value = argv[++i];

        // Durations and intervals; zero would spin or time out at once
        auto millis = [&](int64_t& out) {
            size_t used = 0;
            long long parsed = std::stoll(value, &used);
            if (used != value.size() || parsed <= 0) {
                return false;
            }
            out = parsed;
            return true;
        };

        try {
            if (std::strcmp(arg, "--service") == 0) {
                config.service = value;
            } else if (std::strcmp(arg, "--discovery-port") == 0) {
                auto port = parsePortValue(value);
                if (!port) return fail("Invalid port for --discovery-port: " + value);
                config.discovery_port = *port;
            } else if (std::strcmp(arg, "--broadcast-addr") == 0) {
                config.broadcast_addr = value;
            } else if (std::strcmp(arg, "--discover-interval-ms") == 0) {
                if (!millis(config.discover_interval_ms)) return fail("Invalid value for " + std::string(arg) + ": " + value + " (must be a positive number of ms)");
            } else if (std::strcmp(arg, "--heartbeat-ms") == 0) {
                if (!millis(config.heartbeat_ms)) return fail("Invalid value for " + std::string(arg) + ": " + value + " (must be a positive number of ms)");
            } else if (std::strcmp(arg, "--watchdog-ms") == 0) {
                if (!millis(config.watchdog_ms)) return fail("Invalid value for " + std::string(arg) + ": " + value + " (must be a positive number of ms)");
            } else if (std::strcmp(arg, "--stale-ttl-ms") == 0) {
                if (!millis(config.stale_ttl_ms)) return fail("Invalid value for " + std::string(arg) + ": " + value + " (must be a positive number of ms)");
            } else if (std::strcmp(arg, "--retry-min-ms") == 0) {
                if (!millis(config.retry_min_ms)) return fail("Invalid value for " + std::string(arg) + ": " + value + " (must be a positive number of ms)");
            } else if (std::strcmp(arg, "--retry-max-ms") == 0) {
                if (!millis(config.retry_max_ms)) return fail("Invalid value for " + std::string(arg) + ": " + value + " (must be a positive number of ms)");
            } else if (std::strcmp(arg, "--connect-timeout-ms") == 0) {
                if (!millis(config.connect_timeout_ms)) return fail("Invalid value for " + std::string(arg) + ": " + value + " (must be a positive number of ms)");
            } else if (std::strcmp(arg, "--threshold") == 0) {
                size_t used = 0;
                double parsed = std::stod(value, &used);
                if (used != value.size() || parsed < 0.0) return fail("Invalid value for --threshold: " + value);
                config.threshold = parsed;
            } else if (std::strcmp(arg, "--volume-command") == 0) {
                config.volume_command = value;
            } else if (std::strcmp(arg, "--ip") == 0) {
                config.forced_ip = value.empty() ? std::nullopt : std::optional<std::string>(value);
            } else if (std::strcmp(arg, "--ws-port") == 0) {
                auto port = parsePortValue(value);
                if (!port) return fail("Invalid port for --ws-port: " + value);
                config.forced_port = *port;
            } else if (std::strcmp(arg, "--name") == 0) {
                config.forced_name = value.empty() ? std::nullopt : std::optional<std::string>(value);
            } else if (std::strcmp(arg, "--log-level") == 0) {
                config.log_level = value;
            } else if (std::strcmp(arg, "--history-file") == 0) {
                config.history_file = value;
            } else {
                return fail(std::string("Unknown option ") + arg);
            }
        } catch (const std::exception&) {
            return fail("Invalid value for " + std::string(arg) + ": " + value);
        }
    }

    if (config.retry_max_ms < config.retry_min_ms) {
        return fail("--retry-max-ms must not be below --retry-min-ms");
    }

    return config;
}

/**
 * @brief Convert log level string to LogLevel enum
 * @param level_str Log level string, case-insensitive
 * @return LogLevel value (defaults to INFO if invalid)
 */
inline utils::LogLevel parseLogLevel(std::string level_str) {
    std::transform(level_str.begin(), level_str.end(), level_str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (level_str == "TRACE") return utils::LogLevel::TRACE;
    if (level_str == "DEBUG") return utils::LogLevel::DEBUG;
    if (level_str == "INFO") return utils::LogLevel::INFO;
    if (level_str == "WARN") return utils::LogLevel::WARN;
    if (level_str == "ERROR") return utils::LogLevel::ERROR;
    if (level_str == "FATAL") return utils::LogLevel::FATAL;
    if (level_str == "OFF") return utils::LogLevel::OFF;
    return utils::LogLevel::INFO;
}

inline core::ForcedConfig toForcedConfig(const Config& config) {
    core::ForcedConfig forced;
    forced.forced_ip = config.forced_ip;
    forced.forced_port = config.forced_port;
    forced.forced_name = config.forced_name;
    return forced;
}

inline core::DiscoveryConfig toDiscoveryConfig(const Config& config) {
    core::DiscoveryConfig discovery;
    discovery.service_name = config.service;
    discovery.listen_port = config.discovery_port;
    discovery.probe_addr = config.broadcast_addr;
    discovery.probe_port = config.discovery_port;
    discovery.discover_interval = std::chrono::milliseconds(config.discover_interval_ms);
    return discovery;
}

inline core::SupervisorConfig toSupervisorConfig(const Config& config) {
    core::SupervisorConfig supervisor;
    supervisor.stale_ttl = std::chrono::milliseconds(config.stale_ttl_ms);
    supervisor.connect_timeout = std::chrono::milliseconds(config.connect_timeout_ms);
    supervisor.heartbeat_interval = std::chrono::milliseconds(config.heartbeat_ms);
    supervisor.watchdog_timeout = std::chrono::milliseconds(config.watchdog_ms);
    supervisor.retry.min_delay = std::chrono::milliseconds(config.retry_min_ms);
    supervisor.retry.max_delay = std::chrono::milliseconds(config.retry_max_ms);
    return supervisor;
}

} // namespace daemon
} // namespace airvol
