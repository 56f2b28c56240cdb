/**
 * @file driver_config.cpp
 * @brief Configuration structure implementation
 * @version 1.0
 * @date 2025-11-18
 */

#include <cstdlib>
#include <fstream>
#include <algorithm>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "../include/pattern/driver_config.hpp"

using json = nlohmann::json;

namespace ublox {

    namespace {

        // JSON key -> environment variable carrying the same setting
        const std::map<std::string, std::string>& json_to_env() {
            static const std::map<std::string, std::string> table = {
                {"device_path", "UBLOX_DEVICE"},
                {"serial_baud", "UBLOX_SERIAL_BAUD"},
                {"flow_control", "UBLOX_FLOW_CONTROL"},
                {"command_timeout_ms", "UBLOX_COMMAND_TIMEOUT"},
                {"boot_probe_timeout_ms", "UBLOX_BOOT_PROBE_TIMEOUT"},
                {"boot_attempts", "UBLOX_BOOT_ATTEMPTS"},
                {"boot_backoff_ms", "UBLOX_BOOT_BACKOFF"},
                {"edm_settle_ms", "UBLOX_EDM_SETTLE"},
                {"join_timeout_ms", "UBLOX_JOIN_TIMEOUT"},
                {"connect_timeout_ms", "UBLOX_CONNECT_TIMEOUT"},
                {"close_timeout_ms", "UBLOX_CLOSE_TIMEOUT"},
                {"dns_timeout_ms", "UBLOX_DNS_TIMEOUT"},
                {"command_retries", "UBLOX_COMMAND_RETRIES"},
                {"poll_interval_ms", "UBLOX_POLL_INTERVAL"},
                {"urc_queue_capacity", "UBLOX_URC_QUEUE"},
                {"trace_traffic", "UBLOX_TRACE"},
            };
            return table;
        }

        bool parse_bool(std::string text) {
            std::transform(text.begin(), text.end(), text.begin(), ::tolower);
            return text == "true" || text == "1" || text == "yes";
        }

        std::uint32_t parse_u32(const std::string& key, const std::string& text) {
            try {
                std::size_t used = 0;
                unsigned long value = std::stoul(text, &used);
                if (used != text.size() || value > 0xFFFFFFFFul) {
                    throw std::invalid_argument(text);
                }
                return static_cast<std::uint32_t>(value);
            } catch (const std::logic_error&) {
                throw std::invalid_argument("Invalid value for " + key + ": " + text);
            }
        }

    } // namespace

    // === Configuration Validation ===

    void DriverConfig::validate() const {
        if (device_path.empty()) {
            throw std::invalid_argument("Serial device path cannot be empty");
        }

        if (command_timeout_ms == 0 || boot_probe_timeout_ms == 0) {
            throw std::invalid_argument("Command timeouts must be > 0");
        }
        if (command_timeout_ms > 600000) {
            throw std::invalid_argument("Command timeout too large (max 600000ms)");
        }
        if (join_timeout_ms == 0 || connect_timeout_ms == 0 || close_timeout_ms == 0
            || dns_timeout_ms == 0) {
            throw std::invalid_argument("Operation timeouts must be > 0");
        }

        if (boot_attempts == 0) {
            throw std::invalid_argument("Boot attempts must be > 0");
        }
        if (boot_attempts > 20) {
            throw std::invalid_argument("Boot attempts too large (max 20)");
        }
        if (command_retries == 0 || command_retries > 10) {
            throw std::invalid_argument("Command retries must be between 1 and 10");
        }

        if (poll_interval_ms == 0 || poll_interval_ms > 1000) {
            throw std::invalid_argument("Poll interval must be between 1 and 1000ms");
        }
        if (urc_queue_capacity == 0) {
            throw std::invalid_argument("URC queue capacity must be > 0");
        }
    }

    // === Factory Methods ===

    DriverConfig DriverConfig::create_default() {
        return DriverConfig{};
    }

    // === Environment Variable Helpers ===

    std::string DriverConfig::get_env(const std::string& name, const std::string& default_val) {
        const char* val = std::getenv(name.c_str());
        return val ? std::string(val) : default_val;
    }

    // === JSON File Parsing ===

    DriverConfig DriverConfig::from_json(const json& j) {
        DriverConfig config = create_default();

        // Convert JSON to string map to reuse apply_config_map logic
        std::map<std::string, std::string> config_map;

        if (j.contains("driver_config")) {
            const auto& dc = j["driver_config"];
            for (const auto& entry : json_to_env()) {
                if (!dc.contains(entry.first)) {
                    continue;
                }
                const auto& value = dc[entry.first];
                if (value.is_string()) {
                    config_map[entry.second] = value.get<std::string>();
                } else if (value.is_boolean()) {
                    config_map[entry.second] = value.get<bool>() ? "true" : "false";
                } else if (value.is_number_unsigned()) {
                    config_map[entry.second] = std::to_string(value.get<std::uint64_t>());
                } else {
                    throw std::invalid_argument("Invalid JSON value for " + entry.first);
                }
            }
        }

        apply_config_map(config, config_map);

        return config;
    }

    // === Configuration Application ===

    void DriverConfig::apply_config_map(DriverConfig& config,
        const std::map<std::string, std::string>& vars) {
        auto get_val = [&vars](const std::string& key) -> std::optional<std::string> {
                auto it = vars.find(key);
                if (it != vars.end()) {
                    return it->second;
                }
                return std::nullopt;
            };

        if (auto val = get_val("UBLOX_DEVICE")) {
            config.device_path = *val;
        }

        if (auto val = get_val("UBLOX_SERIAL_BAUD")) {
            bool use_default = false;
            config.serial_baud = serialbaud_from_int(parse_u32("serial baud", *val), use_default);
            if (use_default) {
                throw std::invalid_argument("Invalid serial baud rate: " + *val);
            }
        }

        if (auto val = get_val("UBLOX_FLOW_CONTROL")) {
            config.flow_control = parse_bool(*val);
        }
        if (auto val = get_val("UBLOX_TRACE")) {
            config.trace_traffic = parse_bool(*val);
        }

        const std::pair<const char*, std::uint32_t DriverConfig::*> numeric[] = {
            {"UBLOX_COMMAND_TIMEOUT", &DriverConfig::command_timeout_ms},
            {"UBLOX_BOOT_PROBE_TIMEOUT", &DriverConfig::boot_probe_timeout_ms},
            {"UBLOX_BOOT_ATTEMPTS", &DriverConfig::boot_attempts},
            {"UBLOX_BOOT_BACKOFF", &DriverConfig::boot_backoff_ms},
            {"UBLOX_EDM_SETTLE", &DriverConfig::edm_settle_ms},
            {"UBLOX_JOIN_TIMEOUT", &DriverConfig::join_timeout_ms},
            {"UBLOX_CONNECT_TIMEOUT", &DriverConfig::connect_timeout_ms},
            {"UBLOX_CLOSE_TIMEOUT", &DriverConfig::close_timeout_ms},
            {"UBLOX_DNS_TIMEOUT", &DriverConfig::dns_timeout_ms},
            {"UBLOX_COMMAND_RETRIES", &DriverConfig::command_retries},
            {"UBLOX_POLL_INTERVAL", &DriverConfig::poll_interval_ms},
            {"UBLOX_URC_QUEUE", &DriverConfig::urc_queue_capacity},
        };
        for (const auto& field : numeric) {
            if (auto val = get_val(field.first)) {
                config.*(field.second) = parse_u32(field.first, *val);
            }
        }
    }

    // === Load Methods ===

    DriverConfig DriverConfig::from_file(const std::string& filepath, bool use_defaults) {
        DriverConfig config = use_defaults ? create_default() : DriverConfig{};

        std::ifstream file(filepath);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open JSON config file: " + filepath);
        }

        try {
            json j;
            file >> j;
            config = from_json(j);
        } catch (const json::exception& e) {
            throw std::runtime_error("JSON parse error in " + filepath + ": " + e.what());
        }

        return config;
    }

    DriverConfig DriverConfig::load(const std::optional<std::string>& config_file_path) {
        DriverConfig config = create_default();

        // A missing file falls back to defaults, a malformed one is an error
        if (config_file_path.has_value()) {
            std::ifstream file(*config_file_path);
            if (file.is_open()) {
                try {
                    json j;
                    file >> j;
                    config = from_json(j);
                } catch (const json::exception& e) {
                    throw std::runtime_error("JSON parse error in " + *config_file_path + ": " +
                        e.what());
                }
            }
        }

        // Apply environment variables (highest priority)
        std::map<std::string, std::string> env_vars;
        for (const auto& entry : json_to_env()) {
            std::string value = get_env(entry.second);
            if (!value.empty()) {
                env_vars[entry.second] = value;
            }
        }

        if (!env_vars.empty()) {
            apply_config_map(config, env_vars);
        }

        return config;
    }

} // namespace ublox
