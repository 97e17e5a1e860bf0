/**
 * @file error.hpp
 * @brief Status codes for txmodem operations and their std::error_category.
 * @version 0.1
 * @date 2025-11-02
 */

#pragma once
#include <string>
#include <system_error>
#include <type_traits>

namespace txmodem {

/**
 * @enum Status
 * @brief Enumeration of error codes for txmodem operations.
 * These codes can be converted to std::error_code for integration with
 * standard error handling mechanisms.
 * @note SUCCESS (0) indicates no error.
 * If starts with 'C' it is a configuration error (raised before any traffic).
 * If starts with 'X' it is an XMODEM protocol error.
 * If starts with 'D' it is a device-related error.
 * If starts with 'W' it is a recoverable warning.
 * @see std::error_code
 */
    enum class Status : int {
        SUCCESS = 0,            /**< No error */
        CNO_DEVICE = 1,         /**< No serial device specified */
        CNO_FILE = 2,           /**< Input file missing or unreadable */
        CINVALID_VALUE = 3,     /**< Invalid configuration value */
        CPORT_OPEN = 4,         /**< Serial device cannot be opened with the given parameters */
        XNO_HANDSHAKE = 5,      /**< No NAK/C received from the receiver */
        XCANCELLED = 6,         /**< CAN received from the receiver */
        XUNEXPECTED = 7,        /**< Unexpected response byte */
        XRETRIES_EXCEEDED = 8,  /**< Block retransmission limit reached */
        XTERMINATION_FAILED = 9, /**< EOT never acknowledged */
        XIO_ERROR = 10,         /**< Unexpected I/O error while streaming the source */
        WBAD_LENGTH = 11,       /**< Bad payload length */
        WTIMEOUT = 12,          /**< Timeout */
        DNOT_FOUND = 13,        /**< Device not found */
        DNOT_OPEN = 14,         /**< Device not open */
        DREAD_ERROR = 15,       /**< Device read error */
        DWRITE_ERROR = 16,      /**< Device write error */
        DCONFIG_ERROR = 17,     /**< Device configuration error */
        UNKNOWN = 255           /**< Unknown error */
    };

/**
 * @class TxmodemErrorCategory
 * @brief Custom error category for txmodem errors.
 */
    class TxmodemErrorCategory : public std::error_category {
        public:
            const char*name() const noexcept override {
                return "txmodem::Status";
            }

            std::string message(int ev) const override {
                switch (static_cast<Status>(ev)) {
                case Status::SUCCESS:
                    return "Success";
                case Status::CNO_DEVICE:
                    return "No serial port device specified";
                case Status::CNO_FILE:
                    return "Input file not accessible";
                case Status::CINVALID_VALUE:
                    return "Invalid configuration value";
                case Status::CPORT_OPEN:
                    return "Unable to open serial device";
                case Status::XNO_HANDSHAKE:
                    return "No transfer request from receiver";
                case Status::XCANCELLED:
                    return "Transfer cancelled by receiver";
                case Status::XUNEXPECTED:
                    return "Unexpected response";
                case Status::XRETRIES_EXCEEDED:
                    return "Maximum number of transmission retries exceeded";
                case Status::XTERMINATION_FAILED:
                    return "Maximum number of termination retries exceeded";
                case Status::XIO_ERROR:
                    return "Unexpected IO error";
                case Status::WBAD_LENGTH:
                    return "Bad payload length";
                case Status::WTIMEOUT:
                    return "Timeout";
                case Status::DNOT_FOUND:
                    return "Device not found";
                case Status::DNOT_OPEN:
                    return "Device not open";
                case Status::DREAD_ERROR:
                    return "Device read error";
                case Status::DWRITE_ERROR:
                    return "Device write error";
                case Status::DCONFIG_ERROR:
                    return "Device configuration error";
                case Status::UNKNOWN:
                    return "Unknown error";
                default:
                    return "Unrecognized error";
                }
            }
    };

// Get the error category instance
    inline const std::error_category &txmodem_category() {
        static TxmodemErrorCategory instance;
        return instance;
    }

// Make error_code from Status
    inline std::error_code make_error_code(Status e) {
        return {static_cast<int>(e), txmodem_category()};
    }

} // namespace txmodem

// Register the enum for use with std::error_code
namespace std {
    template<> struct is_error_code_enum<txmodem::Status> : true_type {};
} // namespace std
