/**
 * @file test_utils.hpp
 * @brief Test utility functions for creating mocked components
 * @version 1.0
 * @date 2025-11-18
 *
 * Provides helpers to create a UbloxDriver with mock dependencies injected,
 * to build the EDM frames a module would send, and to script the module
 * replies for the common bring-up sequences.
 */

#pragma once

#include "../include/pattern/ublox_driver.hpp"
#include "../include/pattern/driver_config.hpp"
#include "../include/frame/edm_frame.hpp"
#include "mocks/mock_clock.hpp"
#include "mocks/mock_serial_port.hpp"
#include <memory>
#include <string>
#include <vector>

namespace ublox {
    namespace test {

        /**
         * @brief Driver plus non-owning handles to its injected mocks
         */
        struct MockedDriver {
            MockSerialPort* port = nullptr;
            MockClock* clock = nullptr;
            std::unique_ptr<UbloxDriver> driver;
        };

        /**
         * @brief Default configuration with short budgets for virtual time tests
         */
        inline DriverConfig test_config() {
            DriverConfig config = DriverConfig::create_default();
            config.device_path = "/dev/mock";
            config.boot_probe_timeout_ms = 200;
            config.boot_attempts = 3;
            config.boot_backoff_ms = 10;
            config.edm_settle_ms = 20;
            config.join_timeout_ms = 5000;
            config.connect_timeout_ms = 3000;
            config.close_timeout_ms = 2000;
            config.dns_timeout_ms = 4000;
            config.poll_interval_ms = 5;
            return config;
        }

        /**
         * @brief Create UbloxDriver with MockSerialPort and MockClock
         *
         * Example:
         * @code
         * auto m = create_driver_with_mocks();
         * script_boot(*m.port);
         * auto booted = m.driver->wait(m.driver->device().start_boot(), Millis(5000));
         * @endcode
         */
        inline MockedDriver create_driver_with_mocks(const DriverConfig& config = test_config()) {
            auto port = std::make_unique<MockSerialPort>(config.device_path);
            auto clock = std::make_unique<MockClock>();

            MockedDriver mocked;
            mocked.port = port.get();
            mocked.clock = clock.get();
            mocked.driver = std::make_unique<UbloxDriver>(std::move(port), std::move(clock), config);
            return mocked;
        }

        // === EDM Frame Builders ===

        inline std::vector<uint8_t> edm_bytes(const EdmFrame& frame) {
            return frame.serialize().value();
        }

        inline std::vector<uint8_t> text_frame(PayloadType type, const std::string& text) {
            EdmFrame frame;
            frame.type = type;
            frame.payload.assign(text.begin(), text.end());
            return edm_bytes(frame);
        }

        /// AT response inside EDM ("\r\nOK\r\n")
        inline std::vector<uint8_t> at_confirmation(const std::string& text) {
            return text_frame(PayloadType::AT_CONFIRMATION, text);
        }

        /// URC inside EDM ("\r\n+UUDPD:1\r\n")
        inline std::vector<uint8_t> at_event(const std::string& text) {
            return text_frame(PayloadType::AT_EVENT, text);
        }

        inline std::vector<uint8_t> start_event() {
            EdmFrame frame;
            frame.type = PayloadType::START_EVENT;
            return edm_bytes(frame);
        }

        inline std::vector<uint8_t> connect_event_ipv4(uint8_t channel, SocketProtocol protocol,
            const Endpoint& remote, const Endpoint& local = Endpoint{{192, 168, 1, 50}, 49152}) {
            ConnectEvent event;
            event.channel = channel;
            event.type = ConnectionType::IPV4;
            event.protocol = protocol;
            event.remote_address.assign(remote.address.begin(), remote.address.end());
            event.remote_port = remote.port;
            event.local_address.assign(local.address.begin(), local.address.end());
            event.local_port = local.port;
            return edm_bytes(event.to_frame());
        }

        inline std::vector<uint8_t> disconnect_event(uint8_t channel) {
            EdmFrame frame;
            frame.type = PayloadType::DISCONNECT_EVENT;
            frame.channel = channel;
            return edm_bytes(frame);
        }

        inline std::vector<uint8_t> data_event(uint8_t channel, const std::string& data) {
            EdmFrame frame;
            frame.type = PayloadType::DATA_EVENT;
            frame.channel = channel;
            frame.payload.assign(data.begin(), data.end());
            return edm_bytes(frame);
        }

        inline std::vector<uint8_t> concat(const std::vector<std::vector<uint8_t> >& parts) {
            std::vector<uint8_t> out;
            for (const auto& part : parts) {
                out.insert(out.end(), part.begin(), part.end());
            }
            return out;
        }

        inline std::vector<uint8_t> bytes_of(const std::string& text) {
            return std::vector<uint8_t>(text.begin(), text.end());
        }

        // === Module Scripts ===

        /// Text-mode replies for probe, echo off and firmware query
        inline void script_boot(MockSerialPort& port, const std::string& firmware = "2.1.0-017") {
            port.add_text_response("AT\r\n", "\r\nOK\r\n");
            port.add_text_response("ATE0\r\n", "ATE0\r\n\r\nOK\r\n");
            port.add_text_response("AT+GMR\r\n", "\r\n\"" + firmware + "\"\r\nOK\r\n");
        }

        /// ATO2 answered in text, followed by the module's EDM start event
        inline void script_edm_entry(MockSerialPort& port) {
            port.add_response("ATO2\r\n", concat({bytes_of("\r\nOK\r\n"), start_event()}));
        }

        /// OK confirmation for every EDM command containing trigger
        inline void script_edm_ok(MockSerialPort& port, const std::string& trigger, bool once = true) {
            port.add_response(trigger, at_confirmation("\r\nOK\r\n"), once);
        }

        /// Station join: configuration OKs, then link and network URCs
        inline void script_join(MockSerialPort& port) {
            script_edm_ok(port, "AT+UWSC=0,", false);
            port.add_response("AT+UWSCA=0,3", std::vector<std::vector<uint8_t> >{
                at_confirmation("\r\nOK\r\n"),
                at_event("\r\n+UUWLE:0,32A1B2C3D4E5,6\r\n"),
                at_event("\r\n+UUNU:0\r\n")
            });
        }

        /// AT+UDCP answered with a peer handle, then the data channel opens
        inline void script_open(MockSerialPort& port, const Endpoint& remote, int peer,
            uint8_t channel, SocketProtocol protocol = SocketProtocol::TCP) {
            port.add_response("AT+UDCP=", std::vector<std::vector<uint8_t> >{
                at_confirmation("\r\n+UDCP:" + std::to_string(peer) + "\r\nOK\r\n"),
                at_event("\r\n+UUDPC:" + std::to_string(peer) + ",2," +
                    std::to_string(static_cast<int>(protocol)) + ",192.168.1.50,49152," +
                    remote.address_string() + "," + std::to_string(remote.port) + "\r\n"),
                connect_event_ipv4(channel, protocol, remote)
            });
        }

        /**
         * @brief Boot, enter EDM and join, all against the scripted mock
         * @return true when the driver reached a joined data path
         */
        inline bool bring_up(MockedDriver& m) {
            script_boot(*m.port);
            script_edm_entry(*m.port);
            script_join(*m.port);

            UbloxDriver& d = *m.driver;
            if (!d.wait(d.device().start_boot(), Millis(10000))) return false;
            if (!d.wait(d.device().enter_edm(), Millis(10000))) return false;
            if (!d.wait(d.device().join("HomeNet", "secret-pass"), Millis(20000))) return false;
            m.port->clear_responses();
            m.port->clear_tx_history();
            return d.device().data_path_ready();
        }

    } // namespace test
} // namespace ublox
