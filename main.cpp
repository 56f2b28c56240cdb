#include "include/ublox.hpp"
#include <iostream>
#include <iomanip>
#include <csignal>
#include <chrono>
#include <cstdlib>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace ublox;

// Set by the signal handler, checked by the receive loop
volatile std::sig_atomic_t g_stop_requested = 0;

// Helper function to get current timestamp string
std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    auto timer = std::chrono::system_clock::to_time_t(now);
    std::tm bt = *std::localtime(&timer);

    std::ostringstream oss;
    oss << std::put_time(&bt, "%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

// Signal handler for graceful shutdown
void signal_handler(int signal) {
    if (signal == SIGINT) {
        g_stop_requested = 1;
    }
}

std::string arg_or_env(int argc, char* argv[], int index, const char* env_name,
    const std::string& fallback) {
    if (argc > index) {
        return argv[index];
    }
    const char* value = std::getenv(env_name);
    return value ? std::string(value) : fallback;
}

int main(int argc, char* argv[]) {
    std::cout << "=== u-blox WiFi HTTP Fetch ===\n\n";

    try {
        // Usage: ublox_example [ssid] [passphrase] [host] [config.json]
        const std::string ssid = arg_or_env(argc, argv, 1, "UBLOX_SSID", "");
        const std::string passphrase = arg_or_env(argc, argv, 2, "UBLOX_PASSPHRASE", "");
        const std::string host = arg_or_env(argc, argv, 3, "UBLOX_HTTP_HOST", "example.com");
        std::optional<std::string> config_path;
        if (argc > 4) {
            config_path = argv[4];
        } else {
            config_path = std::string("config/driver_config.json");
        }

        if (ssid.empty()) {
            std::cerr << "Usage: " << argv[0] << " <ssid> [passphrase] [host] [config.json]\n";
            std::cerr << "  (or set UBLOX_SSID / UBLOX_PASSPHRASE / UBLOX_HTTP_HOST)\n";
            return 1;
        }

        DriverConfig config = DriverConfig::load(config_path);
        config.validate();

        std::cout << "Configuration:\n";
        std::cout << "  Module:       " << features::describe() << "\n";
        std::cout << "  Serial:       " << config.device_path << " @ "
                  << static_cast<std::uint32_t>(config.serial_baud) << " bps"
                  << (config.flow_control ? " (RTS/CTS)" : "") << "\n";
        std::cout << "  Network:      " << ssid << "\n";
        std::cout << "  HTTP host:    " << host << "\n\n";

        std::signal(SIGINT, signal_handler);

        std::cout << "[DRIVER] Opening serial device...\n";
        auto driver = UbloxDriver::create(config);
        NetworkAdapter adapter(*driver);

        std::cout << "[DRIVER] Joining " << ssid << "...\n";
        auto connected = adapter.connect(ssid, passphrase);
        if (!connected) {
            std::cerr << "[ERROR] Join failed: " << connected.describe() << "\n";
            return 1;
        }
        std::cout << "[DRIVER] Firmware " << driver->device().firmware_version() << ", status "
                  << connection_status_to_string(adapter.connection_status()) << "\n\n";

        auto opened = adapter.socket_open(SocketProtocol::TCP, host, 80);
        if (!opened) {
            std::cerr << "[ERROR] Connect to " << host << ":80 failed: " << opened.describe() << "\n";
            return 1;
        }
        SocketId socket = opened.value();

        const std::string request = "GET / HTTP/1.1\r\nHost: " + host +
                                    "\r\nConnection: close\r\n\r\n";
        std::size_t offset = 0;
        while (offset < request.size() && !g_stop_requested) {
            auto sent = adapter.socket_send(socket, span<const std::uint8_t>(
                reinterpret_cast<const std::uint8_t*>(request.data()) + offset,
                request.size() - offset));
            if (sent) {
                offset += sent.value();
            } else if (sent.error() == NetError::WOULD_BLOCK) {
                driver->clock().sleep_for(config.poll_interval());
            } else {
                std::cerr << "[ERROR] Send failed: " << sent.describe() << "\n";
                return 1;
            }
        }

        std::cout << "[" << get_timestamp() << "] Request sent (" << offset << " bytes)\n";
        std::cout << "----------------------------------------\n";

        std::vector<std::uint8_t> buffer(512);
        std::size_t total = 0;
        const TimePoint deadline = driver->clock().now() + config.connect_timeout();
        while (!g_stop_requested) {
            auto received = adapter.socket_recv(socket, span<std::uint8_t>(buffer.data(), buffer.size()));
            if (received && received.value() == 0) {
                break;
            }
            if (received) {
                std::cout.write(reinterpret_cast<const char*>(buffer.data()),
                    static_cast<std::streamsize>(received.value()));
                total += received.value();
                continue;
            }
            if (received.error() != NetError::WOULD_BLOCK) {
                std::cerr << "\n[ERROR] Receive failed: " << received.describe() << "\n";
                break;
            }
            if (driver->clock().now() >= deadline) {
                std::cerr << "\n[ERROR] No reply within " << config.connect_timeout_ms << " ms\n";
                break;
            }
            driver->clock().sleep_for(config.poll_interval());
        }

        std::cout << "\n----------------------------------------\n";
        std::cout << "[" << get_timestamp() << "] Received " << total << " bytes"
                  << (g_stop_requested ? " (interrupted)" : "") << "\n";

        auto closed = adapter.socket_close(socket);
        if (!closed) {
            std::cerr << "[ERROR] Close failed: " << closed.describe() << "\n";
        }

        auto left = adapter.disconnect();
        if (!left) {
            std::cerr << "[ERROR] Disconnect failed: " << left.describe() << "\n";
        }

        std::cout << "\n" << driver->statistics().to_string() << "\n";

    } catch (const DeviceException& e) {
        std::cerr << "\n[ERROR] Device error: " << e.what() << "\n";
        std::cerr << "  Status code: " << static_cast<int>(e.status()) << "\n";
        std::cerr << "\nTroubleshooting:\n";
        std::cerr << "  - Check the serial device path (default: /dev/ttyUSB0)\n";
        std::cerr << "  - Check the module baud rate and RTS/CTS wiring\n";
        return 1;
    }
    catch (const std::invalid_argument& e) {
        std::cerr << "\n[ERROR] Configuration error: " << e.what() << "\n";
        return 1;
    }
    catch (const std::exception& e) {
        std::cerr << "\n[ERROR] Unexpected error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\n[MAIN] Exiting.\n";
    return 0;
}
