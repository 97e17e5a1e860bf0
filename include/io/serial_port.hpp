/**
 * @file serial_port.hpp
 * @brief Abstract duplex byte channel used by the XMODEM sender
 * @version 0.1
 * @date 2025-11-02
 *
 * The sender only needs to write bytes, read bytes with a timeout and
 * close the channel. Keeping this as an interface lets the protocol run
 * over a physical port, a pseudo-terminal or a scripted mock.
 */

#pragma once

#include <cstddef>
#include <string>
#include <sys/types.h>

namespace txmodem {

    /**
     * @brief Abstract interface for serial port I/O
     *
     * Implementations:
     * - RealSerialPort: termios2/ioctl on a Linux tty device
     * - MockSerialPort: scripted receiver for tests
     */
    class ISerialPort {
        public:
            virtual ~ISerialPort() = default;

            /**
             * @brief Write data to the channel
             * @param data Pointer to data buffer
             * @param len Number of bytes to write
             * @return ssize_t Bytes written, or -1 on error (sets errno)
             */
            virtual ssize_t write(const void* data, std::size_t len) = 0;

            /**
             * @brief Read data with timeout
             * @param data Pointer to buffer for received data
             * @param len Maximum number of bytes to read
             * @param timeout_ms Timeout in milliseconds (0 polls without waiting)
             * @return ssize_t Bytes read, or -1 on error/timeout (sets errno)
             *
             * On timeout, returns -1 with errno set to EAGAIN.
             */
            virtual ssize_t read(void* data, std::size_t len, int timeout_ms) = 0;

            virtual bool is_open() const = 0;

            /**
             * @brief Close the channel. Further I/O fails with ENOTCONN/EBADF.
             */
            virtual void close() = 0;

            /**
             * @brief Get the device path (e.g., "/dev/ttyUSB0")
             */
            virtual std::string get_device_path() const = 0;

            /**
             * @brief Get the file descriptor, or -1 if not open
             */
            virtual int get_fd() const = 0;
    };

} // namespace txmodem
