/**
 * @file commands.hpp
 * @brief Catalog of the AT commands the driver issues
 * @version 1.0
 * @date 2025-11-18
 *
 * Command grammar shared by the ODIN/NINA/ANNA short-range families.
 * Commands needing a radio the selected variant lacks are rejected by the
 * callers through features::, not here.
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <cstdint>
#include <string>

#include "at_command.hpp"
#include "../enums/protocol.hpp"
#include "../frame/endpoint.hpp"

namespace ublox {
    namespace commands {

        // Wi-Fi station configuration parameters (+UWSC)
        static constexpr int WSC_ACTIVE_ON_STARTUP = 0;
        static constexpr int WSC_SSID = 2;
        static constexpr int WSC_AUTHENTICATION = 5;
        static constexpr int WSC_PASSPHRASE = 8;
        static constexpr int WSC_AUTH_OPEN = 1;
        static constexpr int WSC_AUTH_WPA_PSK = 2;

        // Wi-Fi access point configuration parameters (+UWAPC)
        static constexpr int WAPC_SSID = 2;
        static constexpr int WAPC_CHANNEL = 4;
        static constexpr int WAPC_SECURITY = 5;
        static constexpr int WAPC_PASSPHRASE = 8;

        // Configuration actions (+UWSCA / +UWAPCA)
        static constexpr int ACTION_RESET = 0;
        static constexpr int ACTION_STORE = 1;
        static constexpr int ACTION_LOAD = 2;
        static constexpr int ACTION_ACTIVATE = 3;
        static constexpr int ACTION_DEACTIVATE = 4;

        // === General ===
        AtCommand attention();
        AtCommand echo_off();
        AtCommand software_version();
        AtCommand store_config();
        AtCommand reboot();

        // === Data mode ===
        AtCommand enter_edm();

        /// "tcp://10.0.0.5:80/" style peer URL
        std::string peer_url(SocketProtocol protocol, const Endpoint& remote);
        AtCommand connect_peer(SocketProtocol protocol, const Endpoint& remote);
        AtCommand close_peer(int peer_handle);

        // === Wi-Fi station ===
        AtCommand wifi_station_config(int param, const std::string& quoted_or_raw_value);
        AtCommand wifi_station_action(int action);

        // === Wi-Fi access point ===
        AtCommand wifi_ap_config(int param, const std::string& quoted_or_raw_value);
        AtCommand wifi_ap_action(int action);

        // === DNS ===
        AtCommand resolve_host(const std::string& host);

    } // namespace commands
} // namespace ublox
