/**
 * @file real_serial_port.hpp
 * @brief Serial port implementation using Linux termios2/ioctl
 * @version 0.1
 * @date 2025-11-02
 */

#pragma once

#include "serial_port.hpp"
#include "../enums/protocol.hpp"
#include "../exception/txmodem_exception.hpp"
#include <string>
#include <vector>

namespace txmodem {

    struct TransferConfig;

    /**
     * @brief Real serial port on a Linux tty device
     *
     * Opens the device non-blocking and applies the line settings of a
     * TransferConfig (arbitrary baud rate via BOTHER, character size,
     * parity, stop bits, raw mode). read() waits with poll() for up to the
     * requested timeout.
     */
    class RealSerialPort : public ISerialPort {
        private:
            std::string device_path_;
            SerialBaud baud_rate_;
            ByteSize byte_size_;
            Parity parity_;
            StopBits stop_bits_;
            int fd_ = -1;
            bool is_open_ = false;

        public:
            /**
             * @brief Construct and open serial port
             * @param config Device path and line settings
             * @throws DeviceException if port cannot be opened or configured
             */
            explicit RealSerialPort(const TransferConfig& config);

            /**
             * @brief Destructor - closes port if open
             */
            ~RealSerialPort() override;

            // Disable copy
            RealSerialPort(const RealSerialPort&) = delete;
            RealSerialPort& operator=(const RealSerialPort&) = delete;

            // ISerialPort implementation
            ssize_t write(const void* data, std::size_t len) override;
            ssize_t read(void* data, std::size_t len, int timeout_ms) override;
            bool is_open() const override { return is_open_; }
            void close() override;
            std::string get_device_path() const override { return device_path_; }
            int get_fd() const override { return fd_; }

        private:
            /**
             * @brief Open the device node
             * @throws DeviceException on failure
             */
            void open_port();

            /**
             * @brief Apply line settings (baud, size, parity, stop bits, raw mode)
             * @throws DeviceException on failure
             */
            void configure_port();
    };

    /**
     * @brief Enumerate serial devices present on the system
     *
     * Looks for character devices named ttyUSB*, ttyACM*, ttyS* and ttyAMA*
     * under the given directory.
     *
     * @param dev_dir Directory to scan (default "/dev")
     * @return std::vector<std::string> Sorted device paths
     */
    std::vector<std::string> list_serial_ports(const std::string& dev_dir = "/dev");

} // namespace txmodem
