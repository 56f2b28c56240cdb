/**
 * @file network_adapter.cpp
 * @brief Socket style API implementation
 * @version 1.0
 * @date 2025-11-18
 */

#include <algorithm>
#include <iostream>

#include "../include/pattern/network_adapter.hpp"

namespace ublox {

    std::string connection_status_to_string(ConnectionStatus status) {
        switch (status) {
        case ConnectionStatus::DISCONNECTED: return "DISCONNECTED";
        case ConnectionStatus::CONNECTING:   return "CONNECTING";
        case ConnectionStatus::LOCAL_UP:     return "LOCAL_UP";
        case ConnectionStatus::GLOBAL_UP:    return "GLOBAL_UP";
        default:                             return "UNKNOWN";
        }
    }

    NetworkAdapter::NetworkAdapter(UbloxDriver& driver)
        : driver_(driver) {}

    // === Error Translation ===

    template<typename T>
    Result<T, NetError> NetworkAdapter::translate(const Result<T>& result, const std::string& op) {
        if (result) {
            return Result<T, NetError>::success(result.value());
        }
        std::cerr << "[ADAPTER] " << op << ": " << result.describe() << std::endl;
        return Result<T, NetError>::error(to_net_error(result.error()), op);
    }

    Result<void, NetError> NetworkAdapter::translate(const Result<void>& result, const std::string& op) {
        if (result) {
            return Result<void, NetError>::success();
        }
        std::cerr << "[ADAPTER] " << op << ": " << result.describe() << std::endl;
        return Result<void, NetError>::error(to_net_error(result.error()), op);
    }

    Millis NetworkAdapter::script_budget(std::size_t commands) const {
        const DriverConfig& config = driver_.config();
        // Peer commands carry a 5 s module side timeout
        const std::uint64_t per_attempt = std::max<std::uint64_t>(config.command_timeout_ms, 5000)
                                          + config.boot_backoff_ms;
        return Millis(per_attempt * config.command_retries * commands);
    }

    Millis NetworkAdapter::boot_budget() const {
        const DriverConfig& config = driver_.config();
        Millis budget(0);
        Millis backoff = config.boot_backoff();
        for (std::uint32_t attempt = 0; attempt < config.boot_attempts; ++attempt) {
            budget += config.boot_probe_timeout() + backoff;
            backoff *= 2;
        }
        return budget + script_budget(2);
    }

    // === Interface ===

    Result<void, NetError> NetworkAdapter::initialize() {
        DeviceStateMachine& device = driver_.device();

        if (device.state() == DeviceState::OFF) {
            auto booted = driver_.wait(device.start_boot(), boot_budget());
            if (!booted) {
                return translate(booted, "NetworkAdapter::initialize(boot)");
            }
        }

        auto edm = driver_.wait(device.enter_edm(),
            script_budget(1) + driver_.config().edm_settle());
        return translate(edm, "NetworkAdapter::initialize(edm)");
    }

    Result<void, NetError> NetworkAdapter::connect(const std::string& ssid,
        const std::string& passphrase) {
        if (!features::WIFI_STA) {
            return Result<void, NetError>::error(NetError::UNSUPPORTED, "NetworkAdapter::connect");
        }

        DeviceStateMachine& device = driver_.device();
        if (device.state() != DeviceState::EDM_MODE) {
            auto ready = initialize();
            if (!ready) {
                return ready;
            }
        }

        auto joined = driver_.wait(device.join(ssid, passphrase),
            script_budget(5) + driver_.config().join_timeout());
        if (!joined && joined.error() == Status::PROTOCOL) {
            // Module refused the join or the link dropped during it
            std::cerr << "[ADAPTER] NetworkAdapter::connect: " << joined.describe() << std::endl;
            return Result<void, NetError>::error(NetError::NO_CONNECTION, "NetworkAdapter::connect");
        }
        return translate(joined, "NetworkAdapter::connect");
    }

    Result<void, NetError> NetworkAdapter::disconnect() {
        auto left = driver_.wait(driver_.device().leave(), script_budget(1));
        return translate(left, "NetworkAdapter::disconnect");
    }

    Result<void, NetError> NetworkAdapter::start_access_point(const std::string& ssid,
        const std::string& passphrase, int channel) {
        if (!features::WIFI_AP) {
            return Result<void, NetError>::error(NetError::UNSUPPORTED,
                "NetworkAdapter::start_access_point");
        }

        DeviceStateMachine& device = driver_.device();
        if (device.state() != DeviceState::EDM_MODE) {
            auto ready = initialize();
            if (!ready) {
                return ready;
            }
        }

        auto started = driver_.wait(device.start_access_point(ssid, passphrase, channel),
            script_budget(5) + driver_.config().join_timeout());
        return translate(started, "NetworkAdapter::start_access_point");
    }

    Result<void, NetError> NetworkAdapter::stop_access_point() {
        auto stopped = driver_.wait(driver_.device().stop_access_point(), script_budget(1));
        return translate(stopped, "NetworkAdapter::stop_access_point");
    }

    Result<std::string, NetError> NetworkAdapter::gethostbyname(const std::string& host) {
        const DriverConfig& config = driver_.config();
        auto resolved = driver_.wait(driver_.device().resolve_host(host),
            Millis(static_cast<std::uint64_t>(config.dns_timeout_ms) * config.command_retries)
            + script_budget(1));
        if (resolved) {
            return Result<std::string, NetError>::success(resolved.value());
        }

        switch (resolved.error()) {
        case Status::BUSY:
        case Status::NOT_READY:
        case Status::INVALID_ARGUMENT:
            return translate(resolved, "NetworkAdapter::gethostbyname");
        default:
            std::cerr << "[ADAPTER] gethostbyname(" << host << "): " << resolved.describe()
                      << std::endl;
            return Result<std::string, NetError>::error(NetError::DNS_FAILURE,
                "NetworkAdapter::gethostbyname");
        }
    }

    bool NetworkAdapter::is_connected() const {
        return driver_.device().data_path_ready();
    }

    ConnectionStatus NetworkAdapter::connection_status() const {
        const DeviceStateMachine& device = driver_.device();
        if (device.network_state() == NetworkState::JOINING || device.state() == DeviceState::BOOTING) {
            return ConnectionStatus::CONNECTING;
        }
        if (device.state() != DeviceState::EDM_MODE) {
            return ConnectionStatus::DISCONNECTED;
        }
        if (device.network_state() == NetworkState::JOINED) {
            return ConnectionStatus::GLOBAL_UP;
        }
        if (device.access_point_active()) {
            return ConnectionStatus::LOCAL_UP;
        }
        return ConnectionStatus::DISCONNECTED;
    }

    // === Sockets ===

    Result<SocketId, NetError> NetworkAdapter::socket_open(SocketProtocol protocol,
        const std::string& host, std::uint16_t port) {
        using R = Result<SocketId, NetError>;

        auto address = gethostbyname(host);
        if (!address) {
            return R::error(address.error(), "NetworkAdapter::socket_open(" + host + ")");
        }
        auto remote = Endpoint::parse(address.value(), port);
        if (!remote) {
            return R::error(NetError::NO_ADDRESS, "NetworkAdapter::socket_open(" + host + ")");
        }

        auto opened = driver_.wait(driver_.sockets().open(protocol, *remote),
            driver_.config().connect_timeout() + script_budget(1));
        return translate(opened, "NetworkAdapter::socket_open(" + remote->to_string() + ")");
    }

    Result<std::size_t, NetError> NetworkAdapter::socket_send(SocketId id,
        span<const std::uint8_t> data) {
        using R = Result<std::size_t, NetError>;
        if (data.empty()) {
            return R::success(0);
        }

        auto sent = driver_.sockets().send(id, data);
        if (!sent) {
            return translate(sent, "NetworkAdapter::socket_send");
        }
        if (sent.value() == 0) {
            return R::error(NetError::WOULD_BLOCK, "NetworkAdapter::socket_send");
        }
        return R::success(sent.value());
    }

    Result<std::size_t, NetError> NetworkAdapter::socket_recv(SocketId id, span<std::uint8_t> out) {
        using R = Result<std::size_t, NetError>;

        driver_.poll();
        auto received = driver_.sockets().receive(id, out);
        if (!received) {
            if (received.error() == Status::CLOSED) {
                return R::success(0);
            }
            return translate(received, "NetworkAdapter::socket_recv");
        }
        if (received.value() == 0) {
            return R::error(NetError::WOULD_BLOCK, "NetworkAdapter::socket_recv");
        }
        return R::success(received.value());
    }

    Result<void, NetError> NetworkAdapter::socket_close(SocketId id) {
        auto closed = driver_.wait(driver_.sockets().close(id),
            driver_.config().close_timeout() + script_budget(1));
        return translate(closed, "NetworkAdapter::socket_close");
    }

#if UBLOX_FEATURE_ASYNC
    // === Cooperative API ===

    Pending<void> NetworkAdapter::connect_async(const std::string& ssid,
        const std::string& passphrase) {
        return driver_.device().join(ssid, passphrase);
    }

    Pending<std::string> NetworkAdapter::gethostbyname_async(const std::string& host) {
        return driver_.device().resolve_host(host);
    }

    Pending<SocketId> NetworkAdapter::socket_open_async(SocketProtocol protocol,
        const Endpoint& remote) {
        return driver_.sockets().open(protocol, remote);
    }

    Pending<void> NetworkAdapter::socket_close_async(SocketId id) {
        return driver_.sockets().close(id);
    }
#endif

} // namespace ublox
