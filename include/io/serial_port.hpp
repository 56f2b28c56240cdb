/**
 * @file serial_port.hpp
 * @brief Byte transport boundary between the driver and the UART
 * @version 1.0
 * @date 2025-11-18
 *
 * The driver imposes no framing on this interface: it only moves raw bytes.
 * Reads are non-blocking polls, writes may be accepted partially.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <sys/types.h>

namespace ublox {

    /**
     * @brief Abstract interface for the serial link to the module
     *
     * Implementations:
     * - RealSerialPort: termios2/ioctl on a Linux tty
     * - MockSerialPort: scripted queue-based simulation for tests
     */
    class ISerialPort {
        public:
            virtual ~ISerialPort() = default;

            /**
             * @brief Write bytes to the module
             * @param data Pointer to data buffer
             * @param len Number of bytes to write
             * @return ssize_t Bytes accepted (may be fewer than len), or -1 on error (sets errno)
             */
            virtual ssize_t write(const std::uint8_t* data, std::size_t len) = 0;

            /**
             * @brief Poll for inbound bytes without blocking
             * @param data Buffer for received bytes
             * @param len Buffer capacity
             * @return ssize_t Bytes read, 0 when nothing is pending, -1 on error (sets errno)
             */
            virtual ssize_t read(std::uint8_t* data, std::size_t len) = 0;

            virtual bool is_open() const = 0;

            virtual void close() = 0;

            /**
             * @brief Get the device path
             * @return std::string Device path (e.g., "/dev/ttyUSB0")
             */
            virtual std::string get_device_path() const = 0;

            /**
             * @brief Get the file descriptor (for select/poll operations)
             * @return int File descriptor, or -1 if not open
             */
            virtual int get_fd() const = 0;
    };

} // namespace ublox
