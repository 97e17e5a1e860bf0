/**
 * @file txmodem_exception.hpp
 * @brief Exception hierarchy for the txmodem library
 * @version 0.1
 * @date 2025-11-02
 *
 * Two exception kinds reach the caller of XmodemSender::send():
 * ConfigurationException and CommunicationException. TimeoutException and
 * DeviceException describe channel conditions that the sender retries and
 * never lets escape a transfer.
 */

#pragma once

#include <stdexcept>
#include <string>
#include "../enums/error.hpp"

namespace txmodem {

    /**
     * @class TxmodemException
     * @brief Base exception class for all txmodem errors
     *
     * Stores the original Status code for programmatic error handling
     * while providing a descriptive error message via what().
     */
    class TxmodemException : public std::runtime_error {
        protected:
            Status status_;     ///< Original error status code
            std::string context_; ///< Operation context (function name, detail)

        public:
            /**
             * @brief Construct exception with status code and context
             * @param status The error status code
             * @param context Description of where the error occurred
             */
            TxmodemException(Status status, const std::string& context)
                : std::runtime_error(format_message(status, context)),
                status_(status),
                context_(context) {}

            Status status() const noexcept { return status_; }

            const std::string& context() const noexcept { return context_; }

            std::error_code code() const noexcept { return make_error_code(status_); }

        private:
            static std::string format_message(Status status, const std::string& context) {
                TxmodemErrorCategory category;
                return "[" + category.message(static_cast<int>(status)) + "] in " + context;
            }
    };

    // === Derived Exception Classes ===

    /**
     * @class ConfigurationException
     * @brief Invalid or missing configuration prevents establishing a session
     *
     * Raised before any protocol traffic: missing device or file, invalid
     * parameter values, device that cannot be opened. Corresponds to C* codes.
     */
    class ConfigurationException : public TxmodemException {
        public:
            using TxmodemException::TxmodemException;
    };

    /**
     * @class CommunicationException
     * @brief Unrecoverable error during negotiation or transfer
     *
     * Handshake exhaustion, retry exhaustion, receiver cancel or an
     * unexpected response. Corresponds to X* codes and WBAD_LENGTH.
     */
    class CommunicationException : public TxmodemException {
        public:
            using TxmodemException::TxmodemException;
    };

    /**
     * @class TimeoutException
     * @brief No byte arrived within the read timeout (WTIMEOUT)
     */
    class TimeoutException : public TxmodemException {
        public:
            using TxmodemException::TxmodemException;
    };

    /**
     * @class DeviceException
     * @brief Serial device I/O and setup errors (D* codes)
     */
    class DeviceException : public TxmodemException {
        public:
            using TxmodemException::TxmodemException;
    };

    // === Exception Factory Helpers ===

    /**
     * @brief Throw appropriate exception based on status code
     * @param status The error status code
     * @param context Description of where the error occurred
     * @throws ConfigurationException for C* codes
     * @throws CommunicationException for X* codes and WBAD_LENGTH
     * @throws TimeoutException for WTIMEOUT
     * @throws DeviceException for D* codes
     * @throws TxmodemException for other codes
     */
    [[noreturn]] inline void throw_error(Status status, const std::string& context) {
        switch (status) {
        case Status::CNO_DEVICE:
        case Status::CNO_FILE:
        case Status::CINVALID_VALUE:
        case Status::CPORT_OPEN:
            throw ConfigurationException(status, context);

        case Status::XNO_HANDSHAKE:
        case Status::XCANCELLED:
        case Status::XUNEXPECTED:
        case Status::XRETRIES_EXCEEDED:
        case Status::XTERMINATION_FAILED:
        case Status::XIO_ERROR:
        case Status::WBAD_LENGTH:
            throw CommunicationException(status, context);

        case Status::WTIMEOUT:
            throw TimeoutException(status, context);

        case Status::DNOT_FOUND:
        case Status::DNOT_OPEN:
        case Status::DREAD_ERROR:
        case Status::DWRITE_ERROR:
        case Status::DCONFIG_ERROR:
            throw DeviceException(status, context);

        default:
            throw TxmodemException(status, context);
        }
    }

} // namespace txmodem
