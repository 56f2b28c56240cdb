/**
 * @file driver_config.hpp
 * @brief Runtime configuration for the ublox driver
 * @version 1.0
 * @date 2025-11-18
 *
 * Supports multiple configuration sources:
 * 1. JSON file parsing (config/driver_config.json) - Recommended
 * 2. Environment variables (UBLOX_*)
 * 3. Programmatic defaults
 *
 * Priority: Environment variables > JSON file > Defaults
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <string>
#include <cstdint>
#include <optional>
#include <map>

#include <nlohmann/json.hpp>

#include "../enums/protocol.hpp"
#include "../io/clock.hpp"

namespace ublox {

    /**
     * @brief Configuration for UbloxDriver
     *
     * Environment Variables:
     *
     * - UBLOX_DEVICE: serial device path (default: "/dev/ttyUSB0")
     *
     * - UBLOX_SERIAL_BAUD: serial baud rate in bps (default: 115200)
     *
     * - UBLOX_FLOW_CONTROL: RTS/CTS flow control (true/false, default: true)
     *
     * - UBLOX_COMMAND_TIMEOUT: default AT command timeout in ms (default: 1000)
     *
     * - UBLOX_BOOT_PROBE_TIMEOUT: timeout of one boot liveness probe in ms (default: 500)
     *
     * - UBLOX_BOOT_ATTEMPTS: liveness probes before boot is fatal (default: 5)
     *
     * - UBLOX_BOOT_BACKOFF: first backoff between probes in ms, doubled per attempt (default: 100)
     *
     * - UBLOX_EDM_SETTLE: delay after ATO2 in ms (default: 50)
     *
     * - UBLOX_JOIN_TIMEOUT: WiFi join / AP start budget in ms (default: 20000)
     *
     * - UBLOX_CONNECT_TIMEOUT: socket open budget in ms (default: 10000)
     *
     * - UBLOX_CLOSE_TIMEOUT: socket close budget in ms (default: 5000)
     *
     * - UBLOX_DNS_TIMEOUT: host name resolution budget in ms (default: 70000)
     *
     * - UBLOX_COMMAND_RETRIES: attempts for Busy/Timeout command failures (default: 3)
     *
     * - UBLOX_POLL_INTERVAL: sleep between polls of blocking calls in ms (default: 5)
     *
     * - UBLOX_URC_QUEUE: capacity of each URC subscription (default: 16)
     *
     * - UBLOX_TRACE: dump serial traffic (true/false, default: false)
     */
    struct DriverConfig {
        // === Transport ===
        std::string device_path = "/dev/ttyUSB0";
        SerialBaud serial_baud = DEFAULT_SERIAL_BAUD;
        bool flow_control = true;

        // === Timeouts (milliseconds) ===
        std::uint32_t command_timeout_ms = 1000;
        std::uint32_t boot_probe_timeout_ms = 500;
        std::uint32_t boot_attempts = 5;
        std::uint32_t boot_backoff_ms = 100;
        std::uint32_t edm_settle_ms = 50;
        std::uint32_t join_timeout_ms = 20000;
        std::uint32_t connect_timeout_ms = 10000;
        std::uint32_t close_timeout_ms = 5000;
        std::uint32_t dns_timeout_ms = 70000;

        // === Scheduling ===
        std::uint32_t command_retries = 3;
        std::uint32_t poll_interval_ms = 5;
        std::uint32_t urc_queue_capacity = 16;

        // === Diagnostics ===
        bool trace_traffic = false;

        Millis command_timeout() const { return Millis(command_timeout_ms); }
        Millis boot_probe_timeout() const { return Millis(boot_probe_timeout_ms); }
        Millis boot_backoff() const { return Millis(boot_backoff_ms); }
        Millis edm_settle() const { return Millis(edm_settle_ms); }
        Millis join_timeout() const { return Millis(join_timeout_ms); }
        Millis connect_timeout() const { return Millis(connect_timeout_ms); }
        Millis close_timeout() const { return Millis(close_timeout_ms); }
        Millis dns_timeout() const { return Millis(dns_timeout_ms); }
        Millis poll_interval() const { return Millis(poll_interval_ms); }

        /**
         * @brief Validate configuration
         * @throws std::invalid_argument if config is invalid
         */
        void validate() const;

        /**
         * @brief Create default configuration
         */
        static DriverConfig create_default();

        /**
         * @brief Load configuration from JSON file
         * @param filepath Path to JSON file (e.g., driver_config.json)
         * @param use_defaults If true, merge with defaults; if false, only use JSON values
         * @throws std::runtime_error if file cannot be read or parsed
         */
        static DriverConfig from_file(const std::string& filepath, bool use_defaults = true);

        /**
         * @brief Load configuration from JSON object
         * @param j JSON object containing driver_config
         * @throws std::invalid_argument if a value is out of its domain
         */
        static DriverConfig from_json(const nlohmann::json& j);

        /**
         * @brief Load configuration with priority: env vars > JSON file > defaults
         * @param config_file_path Optional path to JSON config file
         */
        static DriverConfig load(const std::optional<std::string>& config_file_path = std::nullopt);

        private:
            static void apply_config_map(DriverConfig& config,
                const std::map<std::string, std::string>& vars);

            static std::string get_env(const std::string& name,
                const std::string& default_val = "");
    };

} // namespace ublox
