/**
 * @file xmodem_sender.cpp
 * @brief XMODEM sender implementation
 * @version 0.1
 * @date 2025-11-02
 */

#include "../include/pattern/xmodem_sender.hpp"
#include "../include/frame/xmodem_block.hpp"
#include "../include/io/real_serial_port.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <utility>
#include <vector>

namespace txmodem {

    namespace {

        /**
         * @brief Closes an owned channel when send() leaves, however it leaves
         */
        class ChannelGuard {
            public:
                explicit ChannelGuard(ISerialPort* port) : port_(port) {}
                ~ChannelGuard() {
                    if (port_ != nullptr && port_->is_open()) {
                        port_->close();
                    }
                }

                ChannelGuard(const ChannelGuard&) = delete;
                ChannelGuard& operator=(const ChannelGuard&) = delete;

            private:
                ISerialPort* port_;
        };

        // Upper bound on stale input discarded after the handshake
        constexpr std::size_t MAX_DISCARD = 4 * BLOCK_SIZE;

    } // namespace

    // ===================================================================
    // Constructors
    // ===================================================================

    XmodemSender::XmodemSender(TransferConfig config, PortFactory factory,
        std::shared_ptr<ITransferListener> listener)
        : config_(std::move(config)), ownership_(ChannelOwnership::OWNED),
        factory_(std::move(factory)) {
        config_.validate();

        if (!factory_) {
            factory_ = [](const TransferConfig& cfg) -> std::unique_ptr<ISerialPort> {
                    return std::make_unique<RealSerialPort>(cfg);
                };
        }
        set_listener(std::move(listener));
    }

    XmodemSender::XmodemSender(ISerialPort& port, TransferConfig config,
        std::shared_ptr<ITransferListener> listener)
        : config_(std::move(config)), ownership_(ChannelOwnership::BORROWED),
        borrowed_port_(&port) {
        config_.validate_timing();
        set_listener(std::move(listener));
    }

    void XmodemSender::set_listener(std::shared_ptr<ITransferListener> listener) {
        if (listener) {
            listener_ = std::move(listener);
        } else {
            listener_ = std::make_shared<NullTransferListener>();
        }
    }

    TransferStatistics XmodemSender::statistics() const {
        TransferStatistics snapshot = stats_;
        snapshot.mode = mode_;
        return snapshot;
    }

    // ===================================================================
    // Transfer
    // ===================================================================

    void XmodemSender::send(IByteSource& source) {
        state_ = TransferState::IDLE;
        mode_ = Mode::CHECKSUM;
        stats_ = TransferStatistics{};
        stats_.bytes_total = source.size();

        std::unique_ptr<ISerialPort> owned_port;
        ISerialPort* port = nullptr;
        try {
            port = &acquire_channel(owned_port);
        } catch (const ConfigurationException& e) {
            state_ = TransferState::FAILED;
            log(std::string("Cannot start transfer: ") + e.what());
            throw;
        }

        // Destroyed before owned_port, so the channel is closed first
        ChannelGuard guard(owned_port.get());

        try {
            state_ = TransferState::NEGOTIATING;
            negotiate(*port);
            listener_->on_initialization();

            state_ = TransferState::SENDING;
            transmit_blocks(*port, source);

            state_ = TransferState::TERMINATING;
            terminate(*port);

            state_ = TransferState::CLOSED;
            log("Transfer complete: " + std::to_string(stats_.blocks_sent) + " blocks, " +
                std::to_string(stats_.bytes_sent) + " bytes");
        } catch (const CommunicationException& e) {
            state_ = TransferState::FAILED;
            log(std::string("Transfer failed: ") + e.what());
            listener_->on_termination(false);
            throw;
        }

        listener_->on_termination(true);
    }

    void XmodemSender::send_file(const std::string& path) {
        FileSource source(path);
        send(source);
    }

    Result<void> XmodemSender::try_send(IByteSource& source) {
        try {
            send(source);
        } catch (const TxmodemException& e) {
            auto failed = Result<void>::error(e.status(), e.context());
            return Result<void>::error(failed, "XmodemSender::try_send");
        }
        return Result<void>::success();
    }

    // ===================================================================
    // Protocol phases
    // ===================================================================

    ISerialPort& XmodemSender::acquire_channel(std::unique_ptr<ISerialPort>& owned) {
        if (ownership_ == ChannelOwnership::BORROWED) {
            if (borrowed_port_ == nullptr || !borrowed_port_->is_open()) {
                throw ConfigurationException(Status::CPORT_OPEN,
                    "XmodemSender::send: supplied channel is not open");
            }
            return *borrowed_port_;
        }

        try {
            owned = factory_(config_);
        } catch (const DeviceException& e) {
            throw ConfigurationException(Status::CPORT_OPEN,
                "XmodemSender::send: " + e.context());
        }

        if (!owned || !owned->is_open()) {
            throw ConfigurationException(Status::CPORT_OPEN,
                "XmodemSender::send: unable to open " + config_.device);
        }
        return *owned;
    }

    void XmodemSender::negotiate(ISerialPort& port) {
        for (std::uint32_t attempt = 1; attempt <= config_.handshake_retries; ++attempt) {
            ++stats_.handshake_attempts;

            std::uint8_t byte = 0;
            try {
                byte = await_signal(port);
            } catch (const TimeoutException&) {
                log("Handshake: no request (" + std::to_string(attempt) + "/" +
                    std::to_string(config_.handshake_retries) + ")");
                continue;
            } catch (const DeviceException& e) {
                log(std::string("Handshake: ") + e.what());
                continue;
            }

            if (byte == to_byte(Signal::NAK)) {
                mode_ = Mode::CHECKSUM;
            } else if (byte == to_byte(Signal::CRC16)) {
                mode_ = Mode::CRC16;
            } else if (byte == to_byte(Signal::CAN)) {
                throw CommunicationException(Status::XCANCELLED,
                    "XmodemSender::negotiate: receiver sent CAN");
            } else {
                log("Handshake: ignoring " + signal_to_string(byte));
                continue;
            }

            log("Receiver requested " + mode_to_string(mode_));
            discard_pending(port);
            return;
        }

        throw CommunicationException(Status::XNO_HANDSHAKE,
            "XmodemSender::negotiate: no NAK or C after " +
            std::to_string(config_.handshake_retries) + " attempts");
    }

    void XmodemSender::transmit_blocks(ISerialPort& port, IByteSource& source) {
        std::array<std::uint8_t, BLOCK_SIZE> chunk{};
        std::size_t sequence = 1;

        for (;;) {
            std::size_t count = source.read_chunk(chunk.data(), chunk.size());
            if (count == 0) {
                break;
            }

            XmodemBlock block = XmodemBlock::encode(XmodemBlock::block_number_for(sequence),
                span<const std::uint8_t>(chunk.data(), count), mode_);
            std::vector<std::uint8_t> frame = block.serialize();

            deliver(port, frame.data(), frame.size(), Status::XRETRIES_EXCEEDED,
                "block " + std::to_string(sequence), sequence == 1);

            stats_.blocks_sent = sequence;
            stats_.bytes_sent += count;
            listener_->on_block_sent(sequence, stats_.bytes_sent, stats_.bytes_total);
            ++sequence;
        }
    }

    void XmodemSender::terminate(ISerialPort& port) {
        const std::uint8_t eot = to_byte(Signal::EOT);
        deliver(port, &eot, 1, Status::XTERMINATION_FAILED, "EOT");
    }

    void XmodemSender::deliver(ISerialPort& port, const std::uint8_t* frame, std::size_t len,
        Status exhausted, const std::string& what, bool request_is_nak) {
        for (std::uint32_t attempt = 1; attempt <= config_.block_retries; ++attempt) {
            if (attempt > 1) {
                ++stats_.retransmissions;
                log("Resending " + what + " (" + std::to_string(attempt) + "/" +
                    std::to_string(config_.block_retries) + ")");
            }

            std::uint8_t response = 0;
            try {
                write_all(port, frame, len);
                response = await_signal(port);
            } catch (const TimeoutException&) {
                log("No response to " + what);
                continue;
            } catch (const DeviceException& e) {
                log(what + ": " + e.what());
                continue;
            }

            if (response == to_byte(Signal::ACK)) {
                return;
            }
            if (response == to_byte(Signal::NAK)) {
                log("NAK for " + what);
                continue;
            }
            if (request_is_nak && response == to_byte(Signal::CRC16)) {
                log("Repeated mode request for " + what);
                continue;
            }
            if (response == to_byte(Signal::CAN)) {
                throw CommunicationException(Status::XCANCELLED,
                    "XmodemSender::deliver: receiver sent CAN for " + what);
            }
            throw CommunicationException(Status::XUNEXPECTED,
                "XmodemSender::deliver: " + signal_to_string(response) + " in response to " + what);
        }

        throw_error(exhausted, "XmodemSender::deliver: " + what + " not acknowledged after " +
            std::to_string(config_.block_retries) + " transmissions");
    }

    // ===================================================================
    // Channel helpers
    // ===================================================================

    std::uint8_t XmodemSender::await_signal(ISerialPort& port) {
        std::uint8_t byte = 0;
        ssize_t n = port.read(&byte, 1, static_cast<int>(config_.timeout_ms));
        if (n == 1) {
            return byte;
        }

        int err = errno;
        if (n == 0 || err == EAGAIN || err == EWOULDBLOCK || err == EINTR) {
            throw_error(Status::WTIMEOUT, "XmodemSender::await_signal: no response within " +
                std::to_string(config_.timeout_ms) + "ms");
        }
        throw_error(Status::DREAD_ERROR,
            "XmodemSender::await_signal: " + std::string(std::strerror(err)));
    }

    void XmodemSender::discard_pending(ISerialPort& port) {
        std::array<std::uint8_t, BLOCK_SIZE> scratch{};
        std::size_t discarded = 0;
        while (discarded < MAX_DISCARD) {
            ssize_t n = port.read(scratch.data(), scratch.size(), 0);
            if (n <= 0) {
                break;
            }
            discarded += static_cast<std::size_t>(n);
        }
        if (discarded > 0) {
            log("Discarded " + std::to_string(discarded) + " pending byte(s)");
        }
    }

    void XmodemSender::write_all(ISerialPort& port, const std::uint8_t* data, std::size_t len) {
        std::size_t written = 0;
        while (written < len) {
            ssize_t n = port.write(data + written, len - written);
            if (n <= 0) {
                int err = errno;
                throw_error(Status::DWRITE_ERROR, "XmodemSender::write_all: " +
                    std::string(n == 0 ? "no progress" : std::strerror(err)));
            }
            written += static_cast<std::size_t>(n);
        }
    }

    void XmodemSender::log(const std::string& message) const {
        if (verbose_) {
            std::cerr << "[XMODEM] " << message << std::endl;
        }
    }

} // namespace txmodem
