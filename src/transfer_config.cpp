/**
 * @file transfer_config.cpp
 * @brief Transfer configuration implementation
 * @version 0.1
 * @date 2025-11-02
 */

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "../include/pattern/transfer_config.hpp"
#include "../include/exception/txmodem_exception.hpp"

using json = nlohmann::json;

namespace txmodem {

    namespace {

        const char* const CONFIG_KEYS[] = {
            "TXMODEM_DEVICE",
            "TXMODEM_BAUD",
            "TXMODEM_BYTE_SIZE",
            "TXMODEM_PARITY",
            "TXMODEM_STOP_BITS",
            "TXMODEM_TIMEOUT_MS",
            "TXMODEM_HANDSHAKE_RETRIES",
            "TXMODEM_BLOCK_RETRIES"
        };

        std::uint32_t parse_unsigned(const std::string& key, const std::string& value) {
            std::size_t pos = 0;
            unsigned long parsed = 0;
            try {
                parsed = std::stoul(value, &pos, 10);
            } catch (const std::logic_error&) {
                throw ConfigurationException(Status::CINVALID_VALUE,
                    "TransferConfig: " + key + "='" + value + "' is not a number");
            }
            if (pos != value.size() || value[0] == '-' || parsed > 0xFFFFFFFFul) {
                throw ConfigurationException(Status::CINVALID_VALUE,
                    "TransferConfig: " + key + "='" + value + "' is not a valid number");
            }
            return static_cast<std::uint32_t>(parsed);
        }

    } // namespace

    // === Configuration Validation ===

    void TransferConfig::validate() const {
        if (device.empty()) {
            throw ConfigurationException(Status::CNO_DEVICE,
                "TransferConfig::validate: no serial port device specified");
        }
        validate_timing();
    }

    void TransferConfig::validate_timing() const {
        if (timeout_ms == 0) {
            throw ConfigurationException(Status::CINVALID_VALUE,
                "TransferConfig::validate: timeout must be > 0");
        }
        if (timeout_ms > MAX_TIMEOUT_MS) {
            throw ConfigurationException(Status::CINVALID_VALUE,
                "TransferConfig::validate: timeout too large (max " +
                std::to_string(MAX_TIMEOUT_MS) + "ms)");
        }
        if (handshake_retries == 0) {
            throw ConfigurationException(Status::CINVALID_VALUE,
                "TransferConfig::validate: handshake retries must be > 0");
        }
        if (block_retries == 0) {
            throw ConfigurationException(Status::CINVALID_VALUE,
                "TransferConfig::validate: block retries must be > 0");
        }
    }

    std::string TransferConfig::to_string() const {
        std::ostringstream oss;
        oss << "TransferConfig(";
        oss << "Device: " << (device.empty() ? "<none>" : device) << ", ";
        oss << "Baud: " << static_cast<std::uint32_t>(baud_rate) << ", ";
        oss << "Line: " << static_cast<int>(byte_size)
            << static_cast<char>(std::toupper(parity_to_string(parity)[0]))
            << static_cast<int>(stop_bits) << ", ";
        oss << "Timeout: " << timeout_ms << "ms, ";
        oss << "Retries: " << handshake_retries << "/" << block_retries;
        oss << ")";
        return oss.str();
    }

    // === Factory Methods ===

    TransferConfig TransferConfig::create_default() {
        TransferConfig config;
        config.device.clear();
        config.baud_rate = DEFAULT_SERIAL_BAUD;
        config.byte_size = ByteSize::EIGHT;
        config.parity = Parity::NONE;
        config.stop_bits = StopBits::ONE;
        config.timeout_ms = DEFAULT_TIMEOUT_MS;
        config.handshake_retries = DEFAULT_RETRY_COUNT;
        config.block_retries = DEFAULT_RETRY_COUNT;
        return config;
    }

    // === JSON Parsing ===

    TransferConfig TransferConfig::from_json(const json& j) {
        TransferConfig config = create_default();

        // Convert JSON to string map to reuse apply_config_map logic
        std::map<std::string, std::string> config_map;

        if (!j.contains("transfer_config")) {
            return config;
        }

        try {
            const auto& tc = j.at("transfer_config");

            if (tc.contains("device")) {
                config_map["TXMODEM_DEVICE"] = tc["device"].get<std::string>();
            }
            if (tc.contains("baud_rate")) {
                config_map["TXMODEM_BAUD"] = std::to_string(tc["baud_rate"].get<std::uint32_t>());
            }
            if (tc.contains("byte_size")) {
                config_map["TXMODEM_BYTE_SIZE"] = std::to_string(tc["byte_size"].get<int>());
            }
            if (tc.contains("parity")) {
                config_map["TXMODEM_PARITY"] = tc["parity"].get<std::string>();
            }
            if (tc.contains("stop_bits")) {
                config_map["TXMODEM_STOP_BITS"] = std::to_string(tc["stop_bits"].get<int>());
            }
            if (tc.contains("timeout_ms")) {
                config_map["TXMODEM_TIMEOUT_MS"] =
                    std::to_string(tc["timeout_ms"].get<std::uint32_t>());
            }
            if (tc.contains("handshake_retries")) {
                config_map["TXMODEM_HANDSHAKE_RETRIES"] =
                    std::to_string(tc["handshake_retries"].get<std::uint32_t>());
            }
            if (tc.contains("block_retries")) {
                config_map["TXMODEM_BLOCK_RETRIES"] =
                    std::to_string(tc["block_retries"].get<std::uint32_t>());
            }
        } catch (const json::exception& e) {
            throw ConfigurationException(Status::CINVALID_VALUE,
                std::string("TransferConfig::from_json: ") + e.what());
        }

        apply_config_map(config, config_map);

        return config;
    }

    // === Configuration Application ===

    void TransferConfig::apply_config_map(TransferConfig& config,
        const std::map<std::string, std::string>& vars) {
        auto get_val = [&vars](const std::string& key) -> std::optional<std::string> {
                auto it = vars.find(key);
                if (it != vars.end()) {
                    return it->second;
                }
                return std::nullopt;
            };

        if (auto val = get_val("TXMODEM_DEVICE")) {
            config.device = *val;
        }

        if (auto val = get_val("TXMODEM_BAUD")) {
            bool use_default = false;
            config.baud_rate = serialbaud_from_int(
                static_cast<int>(parse_unsigned("TXMODEM_BAUD", *val)), use_default);
            if (use_default) {
                throw ConfigurationException(Status::CINVALID_VALUE,
                    "TransferConfig: unsupported baud rate " + *val);
            }
        }

        if (auto val = get_val("TXMODEM_BYTE_SIZE")) {
            bool use_default = false;
            config.byte_size = bytesize_from_int(
                static_cast<int>(parse_unsigned("TXMODEM_BYTE_SIZE", *val)), use_default);
            if (use_default) {
                throw ConfigurationException(Status::CINVALID_VALUE,
                    "TransferConfig: unsupported byte size " + *val);
            }
        }

        if (auto val = get_val("TXMODEM_PARITY")) {
            std::string parity = *val;
            std::transform(parity.begin(), parity.end(), parity.begin(), ::tolower);

            bool use_default = false;
            config.parity = parity_from_string(parity, use_default);
            if (use_default) {
                throw ConfigurationException(Status::CINVALID_VALUE,
                    "TransferConfig: unsupported parity " + *val);
            }
        }

        if (auto val = get_val("TXMODEM_STOP_BITS")) {
            bool use_default = false;
            config.stop_bits = stopbits_from_int(
                static_cast<int>(parse_unsigned("TXMODEM_STOP_BITS", *val)), use_default);
            if (use_default) {
                throw ConfigurationException(Status::CINVALID_VALUE,
                    "TransferConfig: unsupported stop bits " + *val);
            }
        }

        if (auto val = get_val("TXMODEM_TIMEOUT_MS")) {
            config.timeout_ms = parse_unsigned("TXMODEM_TIMEOUT_MS", *val);
        }
        if (auto val = get_val("TXMODEM_HANDSHAKE_RETRIES")) {
            config.handshake_retries = parse_unsigned("TXMODEM_HANDSHAKE_RETRIES", *val);
        }
        if (auto val = get_val("TXMODEM_BLOCK_RETRIES")) {
            config.block_retries = parse_unsigned("TXMODEM_BLOCK_RETRIES", *val);
        }
    }

    // === Load Methods ===

    TransferConfig TransferConfig::from_file(const std::string& filepath) {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            throw ConfigurationException(Status::CNO_FILE,
                "TransferConfig::from_file: cannot open JSON config file " + filepath);
        }

        json j;
        try {
            file >> j;
        } catch (const json::exception& e) {
            throw ConfigurationException(Status::CINVALID_VALUE,
                "TransferConfig::from_file: JSON parse error in " + filepath + ": " + e.what());
        }

        return from_json(j);
    }

    TransferConfig TransferConfig::load(const std::optional<std::string>& config_file_path) {
        TransferConfig config = create_default();

        if (config_file_path.has_value()) {
            config = from_file(*config_file_path);
        }

        // Environment variables have the highest priority
        std::map<std::string, std::string> env_vars;
        for (const char* key : CONFIG_KEYS) {
            if (const char* val = std::getenv(key)) {
                env_vars[key] = val;
            }
        }

        if (!env_vars.empty()) {
            apply_config_map(config, env_vars);
        }

        return config;
    }

} // namespace txmodem
