/**
 * @file xmodem_sender.hpp
 * @brief XMODEM / XMODEM-CRC sender state machine
 * @version 0.1
 * @date 2025-11-02
 *
 * The sender waits for the receiver to request a transfer (NAK for the
 * 1-byte checksum, 'C' for CRC-16), streams the source in 128-byte blocks
 * and finishes with EOT. Every block and the EOT are retransmitted on NAK
 * or timeout up to the configured limit.
 */

#pragma once

#include "../enums/protocol.hpp"
#include "../exception/txmodem_exception.hpp"
#include "../template/result.hpp"
#include "../io/serial_port.hpp"
#include "../io/byte_source.hpp"
#include "transfer_config.hpp"
#include "transfer_listener.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iomanip>
#include <memory>
#include <sstream>
#include <string>

namespace txmodem {

    /**
     * @brief Lifecycle of a transfer
     *
     * IDLE -> NEGOTIATING -> SENDING -> TERMINATING -> CLOSED, or FAILED
     * from any of them.
     */
    enum class TransferState : std::uint8_t {
        IDLE,
        NEGOTIATING,
        SENDING,
        TERMINATING,
        CLOSED,
        FAILED
    };

    inline std::string state_to_string(TransferState state) {
        switch (state) {
        case TransferState::IDLE:        return "IDLE";
        case TransferState::NEGOTIATING: return "NEGOTIATING";
        case TransferState::SENDING:     return "SENDING";
        case TransferState::TERMINATING: return "TERMINATING";
        case TransferState::CLOSED:      return "CLOSED";
        case TransferState::FAILED:      return "FAILED";
        }
        return "UNKNOWN";
    }

    /**
     * @brief Who is responsible for closing the channel
     *
     * - OWNED: opened by the sender for each send() and closed before it returns
     *
     * - BORROWED: supplied by the caller and never closed by the sender
     */
    enum class ChannelOwnership : std::uint8_t {
        OWNED,
        BORROWED
    };

    /**
     * @brief Counters of the last (or current) transfer
     */
    struct TransferStatistics {
        Mode mode = Mode::CHECKSUM;
        std::size_t blocks_sent = 0;        ///< Acknowledged data blocks
        std::size_t bytes_sent = 0;         ///< Source bytes acknowledged, padding excluded
        std::size_t bytes_total = 0;        ///< Size of the source
        std::size_t retransmissions = 0;    ///< Repeated writes of a block or EOT
        std::size_t handshake_attempts = 0; ///< Reads made while negotiating

        std::string to_string() const {
            std::ostringstream oss;
            oss << "Transfer Statistics:\n"
                << "  Mode:            " << std::setw(10) << mode_to_string(mode) << "\n"
                << "  Blocks:          " << std::setw(10) << blocks_sent << "\n"
                << "  Bytes:           " << std::setw(10) << bytes_sent << " / " << bytes_total << "\n"
                << "  Retransmissions: " << std::setw(10) << retransmissions << "\n"
                << "  Handshake reads: " << std::setw(10) << handshake_attempts;
            return oss.str();
        }
    };

    /**
     * @brief XMODEM sender bound to a configuration or to an open channel
     *
     * Construction with a TransferConfig makes the sender open (through the
     * PortFactory) and close the channel around every send(). Construction
     * with an ISerialPort reference borrows it for the sender's lifetime.
     *
     * Errors reaching the caller:
     * - ConfigurationException: invalid configuration, unreadable file,
     *   channel that cannot be opened. No protocol traffic, no events.
     * - CommunicationException: handshake failure, cancel, unexpected
     *   response, exhausted retries. The listener sees on_termination(false)
     *   first.
     *
     * @note Not thread-safe: one send() at a time per sender.
     */
    class XmodemSender {
        public:
            using PortFactory = std::function<std::unique_ptr<ISerialPort>(const TransferConfig&)>;

            /**
             * @brief Create a sender owning its channel
             * @param config Device and protocol settings, validated here
             * @param factory Opens the channel; defaults to RealSerialPort
             * @param listener Event sink; NullTransferListener if null
             * @throws ConfigurationException if config is invalid
             */
            explicit XmodemSender(TransferConfig config, PortFactory factory = {},
                std::shared_ptr<ITransferListener> listener = nullptr);

            /**
             * @brief Create a sender over a caller-owned channel
             *
             * Only the timeout and retry settings of config are used.
             * @throws ConfigurationException if timeout or retry limits are invalid
             */
            XmodemSender(ISerialPort& port, TransferConfig config = TransferConfig::create_default(),
                std::shared_ptr<ITransferListener> listener = nullptr);

            XmodemSender(const XmodemSender&) = delete;
            XmodemSender& operator=(const XmodemSender&) = delete;

            /**
             * @brief Transfer the whole source
             * @throws ConfigurationException if the channel cannot be opened
             * @throws CommunicationException if the transfer fails
             */
            void send(IByteSource& source);

            /**
             * @brief Transfer the content of a file
             * @throws ConfigurationException (CNO_FILE) if the file cannot be opened
             * @throws CommunicationException if the transfer fails
             */
            void send_file(const std::string& path);

            /**
             * @brief Non-throwing variant of send()
             * @return Result<void> Status of the failure and the operation chain
             */
            Result<void> try_send(IByteSource& source);

            TransferState state() const { return state_; }
            Mode mode() const { return mode_; }
            ChannelOwnership ownership() const { return ownership_; }
            const TransferConfig& config() const { return config_; }
            TransferStatistics statistics() const;

            void set_verbose(bool verbose) { verbose_ = verbose; }
            void set_listener(std::shared_ptr<ITransferListener> listener);

        private:
            TransferConfig config_;
            ChannelOwnership ownership_;
            PortFactory factory_;
            ISerialPort* borrowed_port_ = nullptr;
            std::shared_ptr<ITransferListener> listener_;

            TransferState state_ = TransferState::IDLE;
            Mode mode_ = Mode::CHECKSUM;
            TransferStatistics stats_;
            bool verbose_ = true;

            /**
             * @brief Borrowed port, or a new port from the factory stored in owned
             * @throws ConfigurationException (CPORT_OPEN)
             */
            ISerialPort& acquire_channel(std::unique_ptr<ISerialPort>& owned);

            /**
             * @brief Wait for NAK or 'C' and select the mode
             *
             * Input still pending once the mode is chosen (repeated requests
             * queued by the receiver) is discarded before the first block.
             *
             * @note CAN is fatal here, unlike any other unknown byte, which
             * is skipped.
             * @throws CommunicationException (XNO_HANDSHAKE, XCANCELLED)
             */
            void negotiate(ISerialPort& port);

            void transmit_blocks(ISerialPort& port, IByteSource& source);

            void terminate(ISerialPort& port);

            /**
             * @brief Write a frame until it is acknowledged
             *
             * The frame is written at most block_retries times. NAK, timeout
             * and channel errors trigger a retransmission.
             *
             * @param exhausted Status raised when every attempt failed
             * @param what Frame description for logs and error context
             * @param request_is_nak Treat a late 'C' mode request as NAK (first block)
             * @throws CommunicationException (XCANCELLED, XUNEXPECTED, exhausted)
             */
            void deliver(ISerialPort& port, const std::uint8_t* frame, std::size_t len,
                Status exhausted, const std::string& what, bool request_is_nak = false);

            /**
             * @brief Read a single response byte
             * @throws TimeoutException (WTIMEOUT) if nothing arrives in time
             * @throws DeviceException (DREAD_ERROR) on channel failure
             */
            std::uint8_t await_signal(ISerialPort& port);

            /**
             * @brief Drop input already waiting on the channel
             */
            void discard_pending(ISerialPort& port);

            /**
             * @throws DeviceException (DWRITE_ERROR) on channel failure
             */
            void write_all(ISerialPort& port, const std::uint8_t* data, std::size_t len);

            void log(const std::string& message) const;
    };

} // namespace txmodem
