/**
 * @file ublox_driver.hpp
 * @brief Owner of the transport and every driver layer
 * @version 1.0
 * @date 2025-11-18
 *
 * All driver state is advanced from poll(). Blocking callers use wait(),
 * which pumps poll() until a Pending marker resolves; cooperative callers
 * hold on to the marker and call poll() from their own loop.
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <memory>

#include "../io/clock.hpp"
#include "../io/serial_port.hpp"
#include "command_channel.hpp"
#include "device_state_machine.hpp"
#include "driver_config.hpp"
#include "driver_statistics.hpp"
#include "socket_registry.hpp"

namespace ublox {

    class UbloxDriver {
        public:
            /**
             * @brief Construct with injected dependencies (for testing)
             * @param port Serial transport, must be open
             * @param clock Time source
             * @param config Runtime configuration, validated here
             * @throws std::invalid_argument if config is invalid or a dependency is missing
             * @throws DeviceException if the port is not open
             */
            UbloxDriver(std::unique_ptr<ISerialPort> port, std::unique_ptr<IClock> clock,
                const DriverConfig& config);

            /**
             * @brief Factory method to create a driver on real hardware
             * @throws DeviceException if the serial device cannot be opened
             */
            static std::unique_ptr<UbloxDriver> create(const DriverConfig& config);

            UbloxDriver(const UbloxDriver&) = delete;
            UbloxDriver& operator=(const UbloxDriver&) = delete;

            /**
             * @brief Service channel, device state machine and sockets, in that order
             */
            void poll();

            /**
             * @brief Pump poll() until pending resolves or budget elapses
             *
             * On timeout the marker is abandoned: the operation still runs to
             * completion inside the driver and its result is discarded.
             */
            template<typename T>
            Result<T> wait(Pending<T> pending, Millis budget) {
                const TimePoint deadline = clock_->now() + budget;
                while (!pending.ready()) {
                    poll();
                    if (pending.ready()) {
                        break;
                    }
                    if (clock_->now() >= deadline) {
                        pending.abandon();
                        return Result<T>::error(Status::TIMEOUT, "UbloxDriver::wait");
                    }
                    clock_->sleep_for(config_.poll_interval());
                }
                return pending.result();
            }

            /**
             * @brief Blocking AT command through the device state machine
             */
            Result<AtResponse> send_at(const AtCommand& command);

            UrcSubscription subscribe_urc() { return channel_.subscribe_urc(); }

            // === Accessors ===

            CommandChannel& channel() { return channel_; }
            DeviceStateMachine& device() { return device_; }
            const DeviceStateMachine& device() const { return device_; }
            SocketRegistry& sockets() { return sockets_; }
            const SocketRegistry& sockets() const { return sockets_; }
            IClock& clock() { return *clock_; }
            ISerialPort& port() { return *port_; }
            const DriverConfig& config() const { return config_; }
            const DriverStatistics& statistics() const { return stats_; }
            void reset_statistics() { stats_.reset(); }

        private:
            DriverConfig config_;
            std::unique_ptr<ISerialPort> port_;
            std::unique_ptr<IClock> clock_;
            DriverStatistics stats_;
            ResetBroadcast resets_;
            CommandChannel channel_;
            DeviceStateMachine device_;
            SocketRegistry sockets_;

            static const DriverConfig& checked(const DriverConfig& config);
            static ISerialPort& checked(const std::unique_ptr<ISerialPort>& port);
            static IClock& checked(const std::unique_ptr<IClock>& clock);
    };

} // namespace ublox
