/**
 * @file real_serial_port.cpp
 * @brief Linux tty implementation of ISerialPort
 * @version 1.0
 * @date 2025-11-18
 */

#include "../include/io/real_serial_port.hpp"
#include <cstdio>

namespace ublox {

    // ===================================================================
    // Constructor / Destructor
    // ===================================================================

    RealSerialPort::RealSerialPort(const std::string& device_path, SerialBaud baud_rate,
        bool flow_control)
        : device_path_(device_path), baud_rate_(baud_rate), flow_control_(flow_control) {
        open_port();
        try {
            configure_port();
        } catch (const DeviceException&) {
            close();
            throw;
        }
    }

    RealSerialPort::~RealSerialPort() {
        close();
    }

    // ===================================================================
    // ISerialPort Implementation
    // ===================================================================

    ssize_t RealSerialPort::write(const std::uint8_t* data, std::size_t len) {
        if (!is_open_ || fd_ < 0) {
            errno = ENOTCONN;
            return -1;
        }

        ssize_t bytes_written = ::write(fd_, data, len);
        if (bytes_written < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return 0;  // Output buffer full (flow control asserted)
        }
        return bytes_written;
    }

    ssize_t RealSerialPort::read(std::uint8_t* data, std::size_t len) {
        if (!is_open_ || fd_ < 0) {
            errno = ENOTCONN;
            return -1;
        }

        ssize_t bytes_read = ::read(fd_, data, len);
        if (bytes_read < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return 0;  // No data available
        }
        return bytes_read;
    }

    void RealSerialPort::close() {
        if (is_open_ && fd_ >= 0) {
            ::close(fd_);
            std::fprintf(stdout, "Serial port %s closed.\n", device_path_.c_str());
        }
        fd_ = -1;
        is_open_ = false;
    }

    // ===================================================================
    // Private Methods
    // ===================================================================

    void RealSerialPort::open_port() {
        fd_ = ::open(device_path_.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
        if (fd_ < 0) {
            throw DeviceException(Status::DNOT_FOUND,
                "RealSerialPort::open_port(" + device_path_ + "): " +
                std::string(std::strerror(errno)));
        }
        is_open_ = true;
        std::fprintf(stdout, "Serial port %s opened successfully.\n", device_path_.c_str());
    }

    void RealSerialPort::configure_port() {
        if (!is_open_ || fd_ < 0) {
            throw DeviceException(Status::DNOT_OPEN,
                "RealSerialPort::configure_port: port not open");
        }

        int result = ::ioctl(fd_, TCGETS2, &tty_);
        if (result != 0) {
            throw DeviceException(Status::DCONFIG_ERROR,
                "RealSerialPort::configure_port: ioctl TCGETS2 failed: " +
                std::string(std::strerror(errno)));
        }

        speed_t baud = to_baud_value(baud_rate_);

        // u-blox short-range UART: 8 data bits, no parity, 1 stop bit
        tty_.c_cflag = BOTHER    // Use custom baud rate
            | CS8                // 8 data bits
            | CREAD              // Enable receiver
            | CLOCAL;            // Ignore modem control lines
        if (flow_control_) {
            tty_.c_cflag |= CRTSCTS;
        }
        tty_.c_iflag = IGNPAR;   // Ignore framing and parity errors
        tty_.c_oflag = 0;        // No output processing
        tty_.c_lflag = 0;        // Non-canonical mode, no echo, no signals
        tty_.c_ispeed = baud;
        tty_.c_ospeed = baud;
        tty_.c_cc[VTIME] = 0;
        tty_.c_cc[VMIN] = 0;     // Never block, the driver polls

        result = ::ioctl(fd_, TCSETS2, &tty_);
        if (result != 0) {
            throw DeviceException(Status::DCONFIG_ERROR,
                "RealSerialPort::configure_port: ioctl TCSETS2 failed: " +
                std::string(std::strerror(errno)));
        }

        std::fprintf(stdout, "Serial port %s configured at %u baud (flow control %s).\n",
            device_path_.c_str(), static_cast<unsigned>(baud), flow_control_ ? "on" : "off");
    }

} // namespace ublox
