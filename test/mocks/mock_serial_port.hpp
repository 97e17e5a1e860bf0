/**
 * @file mock_serial_port.hpp
 * @brief Mock implementation of ISerialPort acting as a scripted XMODEM receiver
 * @version 1.0
 * @date 2025-11-02
 *
 * Provides queue-based simulation of the receiver side of a transfer for
 * testing XmodemSender without hardware.
 */

#pragma once

#include "../../include/io/serial_port.hpp"
#include "../../include/enums/protocol.hpp"
#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <optional>
#include <queue>
#include <string>
#include <vector>

namespace txmodem {
    namespace test {

        /**
         * @brief Lifetime record shared between a mock port and the test
         *
         * Outlives the port, so closing can be checked after a sender has
         * destroyed the mock it owned.
         */
        struct PortProbe {
            int close_calls = 0;
            bool destroyed = false;
        };

        /**
         * @brief Mock serial port for testing
         *
         * Features:
         * - Scripted responses: a blocking read() with nothing pending takes
         *   the next queued entry, an empty entry being a timeout. Bytes of
         *   an entry left unread stay pending; a zero timeout read only
         *   sees pending bytes
         * - Optional default response once the script is exhausted
         * - TX history tracking for verification
         * - Configurable error injection (timeout, I/O errors)
         * - Close tracking through a shared PortProbe
         *
         * @note The destructor does not call close(): only explicit closes
         * are recorded.
         */
        class MockSerialPort : public ISerialPort {
            public:
                /**
                 * @brief Construct mock serial port
                 * @param device_path Simulated device path (e.g., "/dev/mock")
                 */
                explicit MockSerialPort(const std::string& device_path = "/dev/mock")
                    : device_path_(device_path)
                    , is_open_(true)
                    , fd_(42)  // Mock FD
                    , probe_(std::make_shared<PortProbe>()) {}

                ~MockSerialPort() override {
                    probe_->destroyed = true;
                }

                // === ISerialPort Interface ===

                ssize_t write(const void* data, std::size_t len) override {
                    if (!is_open_) {
                        errno = EBADF;
                        return -1;
                    }

                    if (simulate_write_error_ || failing_writes_ > 0) {
                        if (failing_writes_ > 0) {
                            --failing_writes_;
                        }
                        errno = EIO;
                        return -1;
                    }

                    // Record transmitted data
                    const std::uint8_t* bytes = static_cast<const std::uint8_t*>(data);
                    tx_history_.emplace_back(bytes, bytes + len);

                    return static_cast<ssize_t>(len);
                }

                ssize_t read(void* data, std::size_t len, int timeout_ms) override {
                    last_timeout_ms_ = timeout_ms;
                    ++read_calls_;

                    if (!is_open_) {
                        errno = EBADF;
                        return -1;
                    }

                    if (simulate_read_error_) {
                        errno = EIO;
                        return -1;
                    }

                    // A zero timeout only sees bytes already on the line
                    if (line_.empty() && timeout_ms > 0 && !simulate_timeout_) {
                        if (!rx_queue_.empty()) {
                            line_ = rx_queue_.front();
                            rx_queue_.pop();
                        } else if (default_response_.has_value()) {
                            line_.push_back(*default_response_);
                        }
                    }

                    if (line_.empty() || len == 0) {
                        errno = EAGAIN;  // Timeout
                        return -1;
                    }

                    std::size_t bytes_to_copy = std::min(len, line_.size());
                    std::memcpy(data, line_.data(), bytes_to_copy);
                    line_.erase(line_.begin(),
                        line_.begin() + static_cast<std::ptrdiff_t>(bytes_to_copy));

                    return static_cast<ssize_t>(bytes_to_copy);
                }

                bool is_open() const override {
                    return is_open_;
                }

                void close() override {
                    ++probe_->close_calls;
                    is_open_ = false;
                    fd_ = -1;
                }

                std::string get_device_path() const override {
                    return device_path_;
                }

                int get_fd() const override {
                    return fd_;
                }

                // === Receiver Script ===

                /**
                 * @brief Queue a response byte
                 */
                void inject_response(Signal signal) {
                    rx_queue_.push({ to_byte(signal) });
                }

                void inject_response(std::uint8_t byte) {
                    rx_queue_.push({ byte });
                }

                /**
                 * @brief Queue bytes sent back to back by the receiver
                 *
                 * The first read takes what it asks for; the rest stays
                 * pending on the line.
                 */
                void inject_burst(const std::vector<std::uint8_t>& bytes) {
                    rx_queue_.push(bytes);
                }

                /**
                 * @brief Queue the same response several times
                 */
                void inject_responses(Signal signal, std::size_t count) {
                    for (std::size_t i = 0; i < count; ++i) {
                        inject_response(signal);
                    }
                }

                /**
                 * @brief Queue a read that times out
                 */
                void inject_timeout() {
                    rx_queue_.push({});
                }

                /**
                 * @brief Response returned once the queue is empty
                 *
                 * Without a default response an empty queue times out.
                 */
                void set_default_response(Signal signal) {
                    default_response_ = to_byte(signal);
                }

                void clear_default_response() {
                    default_response_.reset();
                }

                /**
                 * @brief Get history of all transmitted data, one entry per write()
                 */
                const std::vector<std::vector<std::uint8_t> >& get_tx_history() const {
                    return tx_history_;
                }

                /**
                 * @brief Number of successful writes whose first byte is `first_byte`
                 */
                std::size_t count_tx(std::uint8_t first_byte) const {
                    return static_cast<std::size_t>(std::count_if(tx_history_.begin(),
                        tx_history_.end(), [first_byte](const std::vector<std::uint8_t>& frame) {
                            return !frame.empty() && frame[0] == first_byte;
                        }));
                }

                void clear_tx_history() {
                    tx_history_.clear();
                }

                std::size_t get_pending_size() const {
                    return line_.size();
                }

                std::size_t get_rx_queue_size() const {
                    return rx_queue_.size();
                }

                std::size_t get_read_calls() const {
                    return read_calls_;
                }

                int get_last_timeout_ms() const {
                    return last_timeout_ms_;
                }

                std::shared_ptr<PortProbe> probe() const {
                    return probe_;
                }

                // === Error Injection ===

                /**
                 * @brief Enable/disable timeout simulation
                 * @param enable If true, read() will return EAGAIN
                 */
                void set_simulate_timeout(bool enable) {
                    simulate_timeout_ = enable;
                }

                /**
                 * @brief Enable/disable write error simulation
                 * @param enable If true, write() will return -1 with errno=EIO
                 */
                void set_simulate_write_error(bool enable) {
                    simulate_write_error_ = enable;
                }

                /**
                 * @brief Make the next `count` writes fail with EIO
                 */
                void fail_next_writes(std::size_t count) {
                    failing_writes_ = count;
                }

                /**
                 * @brief Enable/disable read error simulation
                 * @param enable If true, read() will return -1 with errno=EIO
                 */
                void set_simulate_read_error(bool enable) {
                    simulate_read_error_ = enable;
                }

            private:
                std::string device_path_;
                bool is_open_;
                int fd_;
                std::shared_ptr<PortProbe> probe_;

                // RX simulation
                std::queue<std::vector<std::uint8_t> > rx_queue_;
                std::vector<std::uint8_t> line_;
                std::optional<std::uint8_t> default_response_;
                std::size_t read_calls_ = 0;
                int last_timeout_ms_ = -1;

                // TX tracking
                std::vector<std::vector<std::uint8_t> > tx_history_;

                // Error injection
                bool simulate_timeout_ = false;
                bool simulate_write_error_ = false;
                bool simulate_read_error_ = false;
                std::size_t failing_writes_ = 0;
        };

    } // namespace test
} // namespace txmodem
