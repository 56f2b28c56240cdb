/**
 * @file ublox_driver.cpp
 * @brief Driver owner implementation
 * @version 1.0
 * @date 2025-11-18
 */

#include <stdexcept>

#include "../include/pattern/ublox_driver.hpp"
#include "../include/io/real_serial_port.hpp"
#include "../include/exception/ublox_exception.hpp"

namespace ublox {

    // === Constructor & Factory ===

    UbloxDriver::UbloxDriver(std::unique_ptr<ISerialPort> port, std::unique_ptr<IClock> clock,
        const DriverConfig& config)
        : config_(checked(config))
        , port_(std::move(port))
        , clock_(std::move(clock))
        , channel_(checked(port_), checked(clock_), resets_, stats_, config_.trace_traffic,
            config_.urc_queue_capacity)
        , device_(channel_, *clock_, config_, resets_, stats_)
        , sockets_(channel_, *clock_, device_, config_, resets_, stats_) {}

    std::unique_ptr<UbloxDriver> UbloxDriver::create(const DriverConfig& config) {
        config.validate();

        // Opens and configures the tty, throws DeviceException on failure
        auto port = std::make_unique<RealSerialPort>(config.device_path, config.serial_baud,
            config.flow_control);

        return std::make_unique<UbloxDriver>(std::move(port), std::make_unique<SteadyClock>(),
            config);
    }

    const DriverConfig& UbloxDriver::checked(const DriverConfig& config) {
        config.validate();
        return config;
    }

    ISerialPort& UbloxDriver::checked(const std::unique_ptr<ISerialPort>& port) {
        if (!port) {
            throw std::invalid_argument("UbloxDriver requires a serial port");
        }
        if (!port->is_open()) {
            throw DeviceException(Status::DNOT_OPEN, "UbloxDriver(" + port->get_device_path() + ")");
        }
        return *port;
    }

    IClock& UbloxDriver::checked(const std::unique_ptr<IClock>& clock) {
        if (!clock) {
            throw std::invalid_argument("UbloxDriver requires a clock");
        }
        return *clock;
    }

    // === Poll Loop ===

    void UbloxDriver::poll() {
        channel_.poll();
        device_.poll();
        sockets_.poll();
    }

    Result<AtResponse> UbloxDriver::send_at(const AtCommand& command) {
        auto submitted = device_.execute(command);
        if (!submitted) {
            return Result<AtResponse>::error(submitted, "UbloxDriver::send_at");
        }
        // The channel enforces the command timeout; the margin only covers polling
        return wait(submitted.value(), command.timeout + config_.poll_interval() * 4);
    }

} // namespace ublox
