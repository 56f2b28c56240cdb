/**
 * @file urc.cpp
 * @brief URC catalog matching
 * @version 1.0
 * @date 2025-11-18
 *
 * @copyright Copyright (c) 2025
 *
 */

#include <map>

#include "../include/at/urc.hpp"
#include "../include/at/at_command.hpp"

namespace ublox {

    namespace {

        const std::map<std::string, UrcKind>& catalog() {
            static const std::map<std::string, UrcKind> table = {
                {"+STARTUP", UrcKind::STARTUP},
                {"+UUDPC", UrcKind::PEER_CONNECTED},
                {"+UUDPD", UrcKind::PEER_DISCONNECTED},
                // Only reaches the catalog when no pending AT+UDCP claimed it
                {"+UDCP", UrcKind::LATE_PEER_HANDLE},
                {"+UUWLE", UrcKind::WIFI_LINK_CONNECTED},
                {"+UUWLD", UrcKind::WIFI_LINK_DISCONNECTED},
                {"+UUWAPU", UrcKind::WIFI_AP_UP},
                {"+UUWAPD", UrcKind::WIFI_AP_DOWN},
                {"+UUWAPSTAC", UrcKind::WIFI_AP_STATION_CONNECTED},
                {"+UUWAPSTAD", UrcKind::WIFI_AP_STATION_DISCONNECTED},
                {"+UUNU", UrcKind::NETWORK_UP},
                {"+UUND", UrcKind::NETWORK_DOWN},
                {"+UUNERR", UrcKind::NETWORK_ERROR},
                {"+UUBTACLC", UrcKind::BT_ACL_CONNECTED},
                {"+UUBTACLD", UrcKind::BT_ACL_DISCONNECTED},
            };
            return table;
        }

    } // namespace

    std::optional<Urc> Urc::parse(const std::string& raw) {
        std::string line = trim(raw);
        if (line.empty() || line[0] != '+') {
            return std::nullopt;
        }

        std::size_t colon = line.find(':');
        std::string name = line.substr(0, colon);
        auto it = catalog().find(name);
        if (it == catalog().end()) {
            return std::nullopt;
        }

        Urc urc;
        urc.kind = it->second;
        urc.line = line;
        if (colon != std::string::npos) {
            urc.params = split_params(line.substr(colon + 1));
        }
        return urc;
    }

    int Urc::int_param(std::size_t index, int fallback) const {
        if (index >= params.size()) {
            return fallback;
        }
        return to_int(params[index]).value_or(fallback);
    }

    std::string Urc::str_param(std::size_t index) const {
        return index < params.size() ? params[index] : std::string();
    }

    DisconnectReason Urc::disconnect_reason() const {
        int reason = int_param(1, 0);
        if (kind != UrcKind::WIFI_LINK_DISCONNECTED || reason < 0 || reason > 5) {
            return DisconnectReason::UNKNOWN;
        }
        return static_cast<DisconnectReason>(reason);
    }

    std::string disconnect_reason_to_string(DisconnectReason reason) {
        switch (reason) {
        case DisconnectReason::REMOTE_CLOSE:      return "remote close";
        case DisconnectReason::OUT_OF_RANGE:      return "out of range";
        case DisconnectReason::ROAMING:           return "roaming";
        case DisconnectReason::SECURITY_PROBLEMS: return "security problems";
        case DisconnectReason::NETWORK_DISABLED:  return "network disabled";
        default:                                  return "unknown";
        }
    }

    std::string urc_kind_to_string(UrcKind kind) {
        for (const auto& [name, k] : catalog()) {
            if (k == kind) {
                return name;
            }
        }
        return "+UNKNOWN";
    }

} // namespace ublox
