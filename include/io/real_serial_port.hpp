/**
 * @file real_serial_port.hpp
 * @brief Linux tty implementation of ISerialPort using termios2/ioctl
 * @version 1.0
 * @date 2025-11-18
 */

#pragma once

#include "serial_port.hpp"
#include "../enums/protocol.hpp"
#include "../exception/ublox_exception.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <asm/termbits.h>
#include <cstring>
#include <cerrno>

namespace ublox {

    /**
     * @brief Serial port talking to the module UART
     *
     * 8N1 framing at an arbitrary baud rate (BOTHER), optional RTS/CTS
     * flow control, opened non-blocking so the poll loop never stalls.
     */
    class RealSerialPort : public ISerialPort {
        private:
            std::string device_path_;
            SerialBaud baud_rate_;
            bool flow_control_;
            int fd_ = -1;
            struct termios2 tty_ {};
            bool is_open_ = false;

        public:
            /**
             * @brief Construct and open serial port
             * @param device_path Device path (e.g., "/dev/ttyUSB0")
             * @param baud_rate Serial baud rate
             * @param flow_control Enable RTS/CTS hardware flow control
             * @throws DeviceException if port cannot be opened or configured
             */
            RealSerialPort(const std::string& device_path, SerialBaud baud_rate,
                bool flow_control = true);

            ~RealSerialPort() override;

            // Disable copy
            RealSerialPort(const RealSerialPort&) = delete;
            RealSerialPort& operator=(const RealSerialPort&) = delete;

            // ISerialPort implementation
            ssize_t write(const std::uint8_t* data, std::size_t len) override;
            ssize_t read(std::uint8_t* data, std::size_t len) override;
            bool is_open() const override { return is_open_; }
            void close() override;
            std::string get_device_path() const override { return device_path_; }
            int get_fd() const override { return fd_; }

        private:
            /**
             * @throws DeviceException on failure
             */
            void open_port();

            /**
             * @brief Apply baud rate, 8N1 and flow control settings
             * @throws DeviceException on failure
             */
            void configure_port();
    };

} // namespace ublox
