/**
 * @file real_serial_port.cpp
 * @brief Real serial port implementation
 * @version 0.1
 * @date 2025-11-02
 */

#include "../include/io/real_serial_port.hpp"
#include "../include/pattern/transfer_config.hpp"

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <asm/termbits.h>
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <regex>

namespace txmodem {

    // ===================================================================
    // Constructor / Destructor
    // ===================================================================

    RealSerialPort::RealSerialPort(const TransferConfig& config)
        : device_path_(config.device), baud_rate_(config.baud_rate),
        byte_size_(config.byte_size), parity_(config.parity), stop_bits_(config.stop_bits) {
        open_port();
        try {
            configure_port();
        } catch (const DeviceException&) {
            close();
            throw;
        }
    }

    RealSerialPort::~RealSerialPort() {
        if (is_open_ && fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
            is_open_ = false;
        }
    }

    // ===================================================================
    // ISerialPort Implementation
    // ===================================================================

    ssize_t RealSerialPort::write(const void* data, std::size_t len) {
        if (!is_open_ || fd_ < 0) {
            errno = ENOTCONN;
            return -1;
        }

        ssize_t bytes_written = ::write(fd_, data, len);
        if (bytes_written > 0 && ::ioctl(fd_, TCSBRK, 1) != 0) {
            // Block never left the UART: report like a failed write
            return -1;
        }
        return bytes_written;  // Returns -1 on error, errno set by write()
    }

    ssize_t RealSerialPort::read(void* data, std::size_t len, int timeout_ms) {
        if (!is_open_ || fd_ < 0) {
            errno = ENOTCONN;
            return -1;
        }

        struct pollfd pfd;
        pfd.fd = fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int poll_result = ::poll(&pfd, 1, timeout_ms);
        if (poll_result < 0) {
            if (errno == EINTR) {
                errno = EAGAIN;
            }
            return -1;
        }
        if (poll_result == 0) {
            errno = EAGAIN;  // Timeout
            return -1;
        }

        ssize_t bytes_read = ::read(fd_, data, len);
        if (bytes_read == 0) {
            errno = EAGAIN;
            return -1;
        }
        return bytes_read;  // Returns -1 on error, errno set by read()
    }

    void RealSerialPort::close() {
        if (is_open_ && fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
            is_open_ = false;
            std::fprintf(stdout, "[SERIAL] Port %s closed.\n", device_path_.c_str());
        }
    }

    // ===================================================================
    // Private Methods
    // ===================================================================

    void RealSerialPort::open_port() {
        fd_ = ::open(device_path_.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
        if (fd_ < 0) {
            throw DeviceException(Status::DNOT_FOUND,
                "RealSerialPort::open_port: " + device_path_ + ": " +
                std::string(std::strerror(errno)));
        }
        is_open_ = true;
        std::fprintf(stdout, "[SERIAL] Port %s opened.\n", device_path_.c_str());
    }

    void RealSerialPort::configure_port() {
        if (!is_open_ || fd_ < 0) {
            throw DeviceException(Status::DNOT_OPEN,
                "RealSerialPort::configure_port: port not open");
        }

        struct termios2 tty {};
        if (::ioctl(fd_, TCGETS2, &tty) != 0) {
            throw DeviceException(Status::DCONFIG_ERROR,
                "RealSerialPort::configure_port: ioctl TCGETS2 failed: " +
                std::string(std::strerror(errno)));
        }

        tcflag_t csize = CS8;
        switch (byte_size_) {
        case ByteSize::FIVE:  csize = CS5; break;
        case ByteSize::SIX:   csize = CS6; break;
        case ByteSize::SEVEN: csize = CS7; break;
        case ByteSize::EIGHT: csize = CS8; break;
        }

        tty.c_cflag = BOTHER     // Literal baud rate in c_ispeed/c_ospeed
            | csize
            | CREAD              // Enable receiver
            | CLOCAL;            // Ignore modem control lines
        if (stop_bits_ == StopBits::TWO) {
            tty.c_cflag |= CSTOPB;
        }
        if (parity_ != Parity::NONE) {
            tty.c_cflag |= PARENB;
            if (parity_ == Parity::ODD) {
                tty.c_cflag |= PARODD;
            }
        }
        tty.c_iflag = (parity_ == Parity::NONE) ? IGNPAR : INPCK;
        tty.c_oflag = 0;         // No output processing
        tty.c_lflag = 0;         // Non-canonical mode, no echo, no signals
        tty.c_ispeed = static_cast<speed_t>(baud_rate_);
        tty.c_ospeed = static_cast<speed_t>(baud_rate_);
        tty.c_cc[VTIME] = 0;     // Timeouts are handled by poll()
        tty.c_cc[VMIN] = 0;

        if (::ioctl(fd_, TCSETS2, &tty) != 0) {
            throw DeviceException(Status::DCONFIG_ERROR,
                "RealSerialPort::configure_port: ioctl TCSETS2 failed: " +
                std::string(std::strerror(errno)));
        }

        // Drop anything received before the transfer was set up
        if (::ioctl(fd_, TCFLSH, TCIOFLUSH) != 0) {
            throw DeviceException(Status::DCONFIG_ERROR,
                "RealSerialPort::configure_port: ioctl TCFLSH failed: " +
                std::string(std::strerror(errno)));
        }

        std::fprintf(stdout, "[SERIAL] Port %s configured at %u baud.\n",
            device_path_.c_str(), static_cast<unsigned>(baud_rate_));
    }

    // ===================================================================
    // Device enumeration
    // ===================================================================

    std::vector<std::string> list_serial_ports(const std::string& dev_dir) {
        namespace fs = std::filesystem;

        std::vector<std::string> devices;
        const std::vector<std::regex> patterns = {
            std::regex("ttyUSB[0-9]+"),
            std::regex("ttyACM[0-9]+"),
            std::regex("ttyS[0-9]+"),
            std::regex("ttyAMA[0-9]+")
        };

        std::error_code ec;
        fs::directory_iterator it(dev_dir, ec);
        if (ec) {
            return devices;  // Directory missing or not readable
        }

        for (const auto& entry : it) {
            std::error_code type_ec;
            if (!entry.is_character_file(type_ec)) {
                continue;
            }
            const std::string filename = entry.path().filename().string();
            for (const auto& pattern : patterns) {
                if (std::regex_match(filename, pattern)) {
                    devices.push_back(entry.path().string());
                    break;
                }
            }
        }

        std::sort(devices.begin(), devices.end());
        return devices;
    }

} // namespace txmodem
