/**
 * @file protocol.hpp
 * @brief XMODEM protocol constants and serial line enumerations.
 * @version 0.1
 * @date 2025-11-02
 *
 * Control bytes, block geometry, transfer modes and the serial line
 * parameters (baud rate, character size, parity, stop bits) together with
 * their string/integer conversion helpers.
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <sstream>
#include <iomanip>
#include <boost/core/span.hpp>

/**
 * @namespace txmodem
 * @brief Namespace containing the XMODEM sender and its collaborators.
 */
namespace txmodem {

    using boost::span;

    // === Control Bytes ===

    /**
     * @brief Single-byte signals exchanged between sender and receiver.
     *
     * @note The receiver starts a transfer with NAK (checksum mode) or
     * CRC16 ('C', CRC mode). Every block and the final EOT are answered
     * with ACK, NAK or CAN.
     */
    enum class Signal : std::uint8_t {
        SOH = 0x01,     // Start of header (128-byte block)
        EOT = 0x04,     // End of transmission
        ACK = 0x06,     // Block accepted
        NAK = 0x15,     // Block rejected / checksum mode request
        CAN = 0x18,     // Cancel
        CRC16 = 0x43    // 'C', CRC mode request
    };

    // === Block Geometry ===
    static constexpr std::size_t BLOCK_SIZE = 128;
    static constexpr std::uint8_t PAD_BYTE = 0x1A;     // CP/M EOF filler

    // === Protocol Defaults ===
    static constexpr std::uint32_t DEFAULT_RETRY_COUNT = 10;
    static constexpr std::uint32_t DEFAULT_TIMEOUT_MS = 10000;
    static constexpr std::uint32_t MAX_TIMEOUT_MS = 600000;

    /**
     * @brief Integrity check used by the blocks of a transfer.
     *
     * - CHECKSUM: 1-byte arithmetic sum (original XMODEM)
     *
     * - CRC16: 2-byte CRC-16/XMODEM, MSB first (XMODEM-CRC)
     */
    enum class Mode : std::uint8_t {
        CHECKSUM = 0,
        CRC16 = 1
    };

    // === Serial Line Parameters ===

    /**
     * @brief Supported serial baud rates.
     * @note The port is configured with BOTHER, so the enum value is the
     * literal bit rate handed to the driver.
     */
    enum class SerialBaud : std::uint32_t {
        BAUD_1200 = 1200,
        BAUD_2400 = 2400,
        BAUD_4800 = 4800,
        BAUD_9600 = 9600,
        BAUD_19200 = 19200,
        BAUD_38400 = 38400,
        BAUD_57600 = 57600,
        BAUD_115200 = 115200,  // <<< Default
        BAUD_230400 = 230400,
        BAUD_460800 = 460800,
        BAUD_921600 = 921600
    };
    static constexpr SerialBaud DEFAULT_SERIAL_BAUD = SerialBaud::BAUD_115200;

    /**
     * @brief Character size in data bits.
     */
    enum class ByteSize : std::uint8_t {
        FIVE = 5,
        SIX = 6,
        SEVEN = 7,
        EIGHT = 8
    };

    /**
     * @brief Parity setting.
     */
    enum class Parity : std::uint8_t {
        NONE = 0,
        EVEN = 1,
        ODD = 2
    };

    /**
     * @brief Number of stop bits.
     */
    enum class StopBits : std::uint8_t {
        ONE = 1,
        TWO = 2
    };

    // === Helpers ===

    /**
     * @brief Convert a Signal to its raw byte.
     */
    constexpr std::uint8_t to_byte(Signal s) {
        return static_cast<std::uint8_t>(s);
    }

    /**
     * @brief Number of trailer bytes a block carries in the given mode.
     */
    constexpr std::size_t trailer_size(Mode mode) {
        return mode == Mode::CRC16 ? 2 : 1;
    }

    inline std::string mode_to_string(Mode mode) {
        return mode == Mode::CRC16 ? "XMODEM-CRC" : "XMODEM";
    }

    /**
     * @brief Human-readable name of a received byte, for logging.
     * @param byte The raw byte
     * @return std::string Signal name or hex value (e.g. "ACK", "0x7F")
     */
    inline std::string signal_to_string(std::uint8_t byte) {
        switch (byte) {
        case to_byte(Signal::SOH):   return "SOH";
        case to_byte(Signal::EOT):   return "EOT";
        case to_byte(Signal::ACK):   return "ACK";
        case to_byte(Signal::NAK):   return "NAK";
        case to_byte(Signal::CAN):   return "CAN";
        case to_byte(Signal::CRC16): return "C";
        default:
            break;
        }
        std::ostringstream oss;
        oss << "0x" << std::hex << std::uppercase << std::setw(2) << std::setfill('0')
            << static_cast<int>(byte);
        return oss.str();
    }

    /**
     * @brief Get the SerialBaud enum from an integer value.
     * @param baud The baud rate as an integer
     * @param use_default Set to true if the value is not supported
     * @return SerialBaud The corresponding enum, or DEFAULT_SERIAL_BAUD
     */
    inline SerialBaud serialbaud_from_int(int baud, bool& use_default) {
        use_default = false;
        switch (baud) {
        case 1200:   return SerialBaud::BAUD_1200;
        case 2400:   return SerialBaud::BAUD_2400;
        case 4800:   return SerialBaud::BAUD_4800;
        case 9600:   return SerialBaud::BAUD_9600;
        case 19200:  return SerialBaud::BAUD_19200;
        case 38400:  return SerialBaud::BAUD_38400;
        case 57600:  return SerialBaud::BAUD_57600;
        case 115200: return SerialBaud::BAUD_115200;
        case 230400: return SerialBaud::BAUD_230400;
        case 460800: return SerialBaud::BAUD_460800;
        case 921600: return SerialBaud::BAUD_921600;
        default:
            use_default = true;
            return DEFAULT_SERIAL_BAUD;
        }
    }

    /**
     * @brief Get the ByteSize enum from the number of data bits.
     * @param bits Data bits (5-8)
     * @param use_default Set to true if the value is not supported
     */
    inline ByteSize bytesize_from_int(int bits, bool& use_default) {
        use_default = false;
        switch (bits) {
        case 5: return ByteSize::FIVE;
        case 6: return ByteSize::SIX;
        case 7: return ByteSize::SEVEN;
        case 8: return ByteSize::EIGHT;
        default:
            use_default = true;
            return ByteSize::EIGHT;
        }
    }

    /**
     * @brief Get the Parity enum from a string ("none"/"even"/"odd", or N/E/O).
     * @param parity_str Lowercase or uppercase parity name
     * @param use_default Set to true if the value is not supported
     */
    inline Parity parity_from_string(const std::string& parity_str, bool& use_default) {
        use_default = false;
        if (parity_str == "none" || parity_str == "N" || parity_str == "n") {
            return Parity::NONE;
        } else if (parity_str == "even" || parity_str == "E" || parity_str == "e") {
            return Parity::EVEN;
        } else if (parity_str == "odd" || parity_str == "O" || parity_str == "o") {
            return Parity::ODD;
        }
        use_default = true;
        return Parity::NONE;
    }

    inline std::string parity_to_string(Parity parity) {
        switch (parity) {
        case Parity::EVEN: return "even";
        case Parity::ODD:  return "odd";
        default:           return "none";
        }
    }

    /**
     * @brief Get the StopBits enum from an integer value (1 or 2).
     * @param bits Number of stop bits
     * @param use_default Set to true if the value is not supported
     */
    inline StopBits stopbits_from_int(int bits, bool& use_default) {
        use_default = false;
        switch (bits) {
        case 1: return StopBits::ONE;
        case 2: return StopBits::TWO;
        default:
            use_default = true;
            return StopBits::ONE;
        }
    }

} // namespace txmodem
