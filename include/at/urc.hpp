/**
 * @file urc.hpp
 * @brief Unsolicited result codes emitted by the module
 * @version 1.0
 * @date 2025-11-18
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace ublox {

    enum class UrcKind {
        STARTUP,                      ///< +STARTUP, module (re)booted
        PEER_CONNECTED,               ///< +UUDPC:<peer>,<type>,<proto>,<laddr>,<lport>,<raddr>,<rport>
        PEER_DISCONNECTED,            ///< +UUDPD:<peer>
        LATE_PEER_HANDLE,             ///< +UDCP:<peer> arriving after its command gave up
        WIFI_LINK_CONNECTED,          ///< +UUWLE:<id>,<bssid>,<channel>
        WIFI_LINK_DISCONNECTED,       ///< +UUWLD:<id>,<reason>
        WIFI_AP_UP,                   ///< +UUWAPU:<id>
        WIFI_AP_DOWN,                 ///< +UUWAPD:<id>
        WIFI_AP_STATION_CONNECTED,    ///< +UUWAPSTAC:<mac>
        WIFI_AP_STATION_DISCONNECTED, ///< +UUWAPSTAD:<mac>
        NETWORK_UP,                   ///< +UUNU:<interface>
        NETWORK_DOWN,                 ///< +UUND:<interface>
        NETWORK_ERROR,                ///< +UUNERR:<error>
        BT_ACL_CONNECTED,             ///< +UUBTACLC:<handle>,<type>,<address>
        BT_ACL_DISCONNECTED,          ///< +UUBTACLD:<handle>
    };

    /**
     * @brief Reason code carried by +UUWLD
     */
    enum class DisconnectReason : int {
        UNKNOWN = 0,
        REMOTE_CLOSE = 1,
        OUT_OF_RANGE = 2,
        ROAMING = 3,
        SECURITY_PROBLEMS = 4,
        NETWORK_DISABLED = 5,
    };

    std::string disconnect_reason_to_string(DisconnectReason reason);

    struct Urc {
        UrcKind kind = UrcKind::STARTUP;
        std::string line;                 ///< Raw line as received
        std::vector<std::string> params;  ///< Tokens after the ':' (quotes removed)

        /**
         * @brief Match a line against the URC catalog
         * @return std::nullopt when the line is not a known URC
         */
        static std::optional<Urc> parse(const std::string& line);

        /// Integer parameter, or fallback when absent or not numeric
        int int_param(std::size_t index, int fallback = -1) const;

        std::string str_param(std::size_t index) const;

        DisconnectReason disconnect_reason() const;
    };

    std::string urc_kind_to_string(UrcKind kind);

} // namespace ublox
