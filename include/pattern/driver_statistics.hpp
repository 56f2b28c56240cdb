/**
 * @file driver_statistics.hpp
 * @brief Counters for traffic and locally recovered conditions
 * @version 1.0
 * @date 2025-11-18
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

namespace ublox {

    /**
     * @brief Driver counters, updated from the single poll context
     */
    struct DriverStatistics {
        std::uint64_t bytes_rx = 0;          ///< Raw bytes read from the serial port
        std::uint64_t bytes_tx = 0;          ///< Raw bytes written to the serial port
        std::uint64_t frames_rx = 0;         ///< EDM frames decoded
        std::uint64_t frames_tx = 0;         ///< EDM frames written
        std::uint64_t frames_corrupt = 0;    ///< Frames dropped for bad framing
        std::uint64_t frames_unknown = 0;    ///< Frames dropped for unknown payload id
        std::uint64_t frames_stale = 0;      ///< Frames for channels no socket owns
        std::uint64_t urcs_rx = 0;           ///< URCs recognised
        std::uint64_t urcs_dropped = 0;      ///< URCs lost to full subscriber queues
        std::uint64_t lines_unmatched = 0;   ///< Lines neither response nor URC
        std::uint64_t commands_sent = 0;
        std::uint64_t command_timeouts = 0;
        std::uint64_t rx_overflow_bytes = 0; ///< Socket payload dropped on full rx buffers
        std::uint64_t serial_errors = 0;
        std::uint64_t resets = 0;            ///< Reset cascades run

        void reset() {
            *this = DriverStatistics{};
        }

        std::string to_string() const {
            std::ostringstream oss;
            oss << "Driver Statistics:\n"
                << "  Serial RX:        " << std::setw(10) << bytes_rx << " bytes\n"
                << "  Serial TX:        " << std::setw(10) << bytes_tx << " bytes\n"
                << "  EDM RX:           " << std::setw(10) << frames_rx << " frames\n"
                << "  EDM TX:           " << std::setw(10) << frames_tx << " frames\n"
                << "  Corrupt frames:   " << std::setw(10) << frames_corrupt << "\n"
                << "  Unknown frames:   " << std::setw(10) << frames_unknown << "\n"
                << "  Stale frames:     " << std::setw(10) << frames_stale << "\n"
                << "  URCs:             " << std::setw(10) << urcs_rx << "\n"
                << "  URCs dropped:     " << std::setw(10) << urcs_dropped << "\n"
                << "  Unmatched lines:  " << std::setw(10) << lines_unmatched << "\n"
                << "  Commands:         " << std::setw(10) << commands_sent << "\n"
                << "  Cmd timeouts:     " << std::setw(10) << command_timeouts << "\n"
                << "  RX overflow:      " << std::setw(10) << rx_overflow_bytes << " bytes\n"
                << "  Serial errors:    " << std::setw(10) << serial_errors << "\n"
                << "  Resets:           " << std::setw(10) << resets;
            return oss.str();
        }
    };

} // namespace ublox
