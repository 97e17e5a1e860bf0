/**
 * @file transfer_config.hpp
 * @brief Configuration record for an XMODEM transfer
 * @version 0.1
 * @date 2025-11-02
 *
 * Supports multiple configuration sources:
 * 1. JSON file parsing (e.g. config/txmodem.json)
 * 2. Environment variables (TXMODEM_*)
 * 3. Programmatic defaults
 * 4. Direct construction
 *
 * Priority: Environment variables > JSON file > Defaults
 */

#pragma once

#include <string>
#include <cstdint>
#include <optional>
#include <map>

#include <nlohmann/json.hpp>

#include "../enums/protocol.hpp"

namespace txmodem {

    /**
     * @brief Serial line and protocol settings of a transfer
     *
     * Environment Variables:
     *
     * - TXMODEM_DEVICE: Serial device path (no default)
     *
     * - TXMODEM_BAUD: Baud rate in bps (default: 115200)
     *
     * - TXMODEM_BYTE_SIZE: Data bits 5-8 (default: 8)
     *
     * - TXMODEM_PARITY: none/even/odd (default: none)
     *
     * - TXMODEM_STOP_BITS: 1 or 2 (default: 1)
     *
     * - TXMODEM_TIMEOUT_MS: Read timeout in ms (default: 10000)
     *
     * - TXMODEM_HANDSHAKE_RETRIES: Reads waiting for NAK/C (default: 10)
     *
     * - TXMODEM_BLOCK_RETRIES: Transmissions per block and per EOT (default: 10)
     *
     * JSON layout:
     * @code{.json}
     * {
     *   "transfer_config": {
     *     "device": "/dev/ttyUSB0",
     *     "baud_rate": 115200,
     *     "byte_size": 8,
     *     "parity": "none",
     *     "stop_bits": 1,
     *     "timeout_ms": 10000,
     *     "handshake_retries": 10,
     *     "block_retries": 10
     *   }
     * }
     * @endcode
     */
    struct TransferConfig {
        // === Device ===
        std::string device;

        // === Line Parameters ===
        SerialBaud baud_rate = DEFAULT_SERIAL_BAUD;
        ByteSize byte_size = ByteSize::EIGHT;
        Parity parity = Parity::NONE;
        StopBits stop_bits = StopBits::ONE;

        // === Protocol Timing ===
        std::uint32_t timeout_ms = DEFAULT_TIMEOUT_MS;
        std::uint32_t handshake_retries = DEFAULT_RETRY_COUNT;
        std::uint32_t block_retries = DEFAULT_RETRY_COUNT;

        /**
         * @brief Validate the whole configuration
         * @throws ConfigurationException (CNO_DEVICE) if no device is set
         * @throws ConfigurationException (CINVALID_VALUE) on invalid timing values
         */
        void validate() const;

        /**
         * @brief Validate only timeout and retry limits
         *
         * Used when the channel is supplied by the caller and the device
         * fields are irrelevant.
         * @throws ConfigurationException (CINVALID_VALUE)
         */
        void validate_timing() const;

        std::string to_string() const;

        /**
         * @brief Create default configuration (no device set)
         */
        static TransferConfig create_default();

        /**
         * @brief Load configuration from JSON file
         * @param filepath Path to JSON file
         * @return TransferConfig defaults overridden by the file
         * @throws ConfigurationException if the file cannot be read or parsed
         */
        static TransferConfig from_file(const std::string& filepath);

        /**
         * @brief Load configuration from JSON object
         * @param j JSON object containing "transfer_config"
         * @throws ConfigurationException (CINVALID_VALUE) if a field is malformed
         */
        static TransferConfig from_json(const nlohmann::json& j);

        /**
         * @brief Load configuration with priority: env vars > JSON file > defaults
         * @param config_file_path Optional path to JSON config file
         */
        static TransferConfig load(const std::optional<std::string>& config_file_path = std::nullopt);

        /**
         * @brief Apply TXMODEM_* key-value pairs on top of a configuration
         * @param config Configuration to update
         * @param vars Key-value pairs
         * @throws ConfigurationException (CINVALID_VALUE) on unparsable values
         */
        static void apply_config_map(TransferConfig& config,
            const std::map<std::string, std::string>& vars);
    };

} // namespace txmodem
