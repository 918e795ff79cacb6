/**
 * @file port_config.cpp
 * @brief Port configuration implementation
 * @version 1.0
 * @date 2025-10-14
 */

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "../include/pattern/port_config.hpp"

using json = nlohmann::json;

namespace serialio {

    namespace {

        // Environment variable names, also the keys of the intermediate config map
        constexpr const char* ENV_DEVICE = "SERIALIO_DEVICE";
        constexpr const char* ENV_BAUD = "SERIALIO_BAUD";
        constexpr const char* ENV_READ_TIMEOUT = "SERIALIO_READ_TIMEOUT_MS";
        constexpr const char* ENV_STOP_BITS = "SERIALIO_STOP_BITS";
        constexpr const char* ENV_LOG_FILE = "SERIALIO_LOG_FILE";
        constexpr const char* ENV_TRACE_CAPACITY = "SERIALIO_TRACE_CAPACITY";

        constexpr const char* ALL_ENV[] = {
            ENV_DEVICE, ENV_BAUD, ENV_READ_TIMEOUT, ENV_STOP_BITS, ENV_LOG_FILE,
            ENV_TRACE_CAPACITY
        };

        // Decimal only: a leading zero is not an octal prefix here
        long long parse_decimal(const std::string& key, const std::string& value,
            long long min, long long max) {
            long long parsed = 0;
            try {
                std::size_t used = 0;
                parsed = std::stoll(value, &used, 10);
                if (used != value.size()) {
                    throw std::invalid_argument(value);
                }
            } catch (const std::logic_error&) {
                throw std::invalid_argument("Invalid integer for " + key + ": " + value);
            }
            if (parsed < min || parsed > max) {
                throw std::invalid_argument("Out of range for " + key + ": " + value);
            }
            return parsed;
        }

        // JSON numbers go through the same text path as environment values
        std::string json_integer(const json& pc, const char* key) {
            const json& value = pc[key];
            if (value.is_number_unsigned()) {
                return std::to_string(value.get<std::uint64_t>());
            }
            if (value.is_number_integer()) {
                return std::to_string(value.get<std::int64_t>());
            }
            throw std::invalid_argument(std::string("Malformed port_config: ") + key +
                " must be an integer, not " + value.type_name());
        }

        int parse_int(const std::string& key, const std::string& value) {
            return static_cast<int>(parse_decimal(key, value,
                std::numeric_limits<int>::min(), std::numeric_limits<int>::max()));
        }

    } // namespace

    // === Configuration Validation ===

    void PortConfig::validate() const {
        if (name.empty()) {
            throw std::invalid_argument("Device name cannot be empty");
        }
        if (baud <= 0) {
            throw std::invalid_argument("Baud rate must be > 0");
        }
        if (read_timeout.count() < 0) {
            throw std::invalid_argument("Read timeout cannot be negative");
        }
        if (trace_capacity != TRACE_CAPACITY_SMALL && trace_capacity != TRACE_CAPACITY_LARGE) {
            throw std::invalid_argument("Trace capacity must be 64 or 128");
        }
        if (log_file.has_value() && log_file->empty()) {
            throw std::invalid_argument("Trace log path cannot be empty (leave unset to disable)");
        }
    }

    // === Factory Methods ===

    PortConfig PortConfig::create_default() {
        PortConfig config;
        config.name = DEFAULT_DEVICE;
        config.baud = 9600;
        config.read_timeout = std::chrono::milliseconds(0);
        config.stop_bits = DEFAULT_STOP_BITS;
        config.log_file.reset();
        config.trace_capacity = TRACE_CAPACITY_SMALL;
        return config;
    }

    // === JSON Parsing ===

    PortConfig PortConfig::from_json(const json& j) {
        PortConfig config = create_default();
        std::map<std::string, std::string> config_map;

        if (j.contains("port_config")) {
            const auto& pc = j["port_config"];

            try {
                if (pc.contains("name")) {
                    config_map[ENV_DEVICE] = pc["name"].get<std::string>();
                }
                if (pc.contains("baud")) {
                    config_map[ENV_BAUD] = json_integer(pc, "baud");
                }
                if (pc.contains("read_timeout_ms")) {
                    config_map[ENV_READ_TIMEOUT] = json_integer(pc, "read_timeout_ms");
                }
                if (pc.contains("stop_bits")) {
                    config_map[ENV_STOP_BITS] = json_integer(pc, "stop_bits");
                }
                if (pc.contains("log_file") && !pc["log_file"].is_null()) {
                    config_map[ENV_LOG_FILE] = pc["log_file"].get<std::string>();
                }
                if (pc.contains("trace_capacity")) {
                    config_map[ENV_TRACE_CAPACITY] = json_integer(pc, "trace_capacity");
                }
            } catch (const json::type_error& e) {
                throw std::invalid_argument(std::string("Malformed port_config: ") + e.what());
            }
        }

        apply_config_map(config, config_map);
        return config;
    }

    // === Configuration Application ===

    void PortConfig::apply_config_map(PortConfig& config,
        const std::map<std::string, std::string>& vars) {
        auto get_val = [&vars](const std::string& key) -> std::optional<std::string> {
                auto it = vars.find(key);
                if (it != vars.end()) {
                    return it->second;
                }
                return std::nullopt;
            };

        if (auto val = get_val(ENV_DEVICE)) {
            config.name = *val;
        }
        if (auto val = get_val(ENV_BAUD)) {
            config.baud = parse_int(ENV_BAUD, *val);
        }
        if (auto val = get_val(ENV_READ_TIMEOUT)) {
            config.read_timeout = std::chrono::milliseconds(parse_decimal(ENV_READ_TIMEOUT, *val,
                std::numeric_limits<long long>::min(), std::numeric_limits<long long>::max()));
        }
        if (auto val = get_val(ENV_STOP_BITS)) {
            bool use_default = false;
            config.stop_bits = stopbits_from_int(parse_int(ENV_STOP_BITS, *val), use_default);
            if (use_default) {
                throw std::invalid_argument("Invalid stop bits: " + *val);
            }
        }
        if (auto val = get_val(ENV_LOG_FILE)) {
            // An empty path explicitly disables tracing
            if (val->empty()) {
                config.log_file.reset();
            } else {
                config.log_file = *val;
            }
        }
        if (auto val = get_val(ENV_TRACE_CAPACITY)) {
            config.trace_capacity = static_cast<std::size_t>(parse_decimal(ENV_TRACE_CAPACITY,
                *val, 0, std::numeric_limits<int>::max()));
        }
    }

    // === Load Methods ===

    PortConfig PortConfig::from_file(const std::string& filepath) {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open JSON config file: " + filepath);
        }

        try {
            json j;
            file >> j;
            return from_json(j);
        } catch (const json::exception& e) {
            throw std::runtime_error("JSON parse error in " + filepath + ": " + e.what());
        }
    }

    PortConfig PortConfig::load(const std::optional<std::string>& config_file_path) {
        PortConfig config = create_default();

        // A missing file is not an error here, only a malformed one
        if (config_file_path.has_value()) {
            std::ifstream probe(*config_file_path);
            if (probe.is_open()) {
                config = from_file(*config_file_path);
            }
        }

        // Environment variables that are actually set override the file
        std::map<std::string, std::string> env_vars;
        for (const char* name : ALL_ENV) {
            if (const char* val = std::getenv(name)) {
                env_vars[name] = val;
            }
        }
        if (!env_vars.empty()) {
            apply_config_map(config, env_vars);
        }

        return config;
    }

} // namespace serialio
