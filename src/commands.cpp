/**
 * @file commands.cpp
 * @brief AT command catalog
 * @version 1.0
 * @date 2025-11-18
 *
 * @copyright Copyright (c) 2025
 *
 */

#include "../include/at/commands.hpp"

namespace ublox {
    namespace commands {

        namespace {

            AtCommand make(std::string text, std::string prefix = "", Millis timeout = Millis(1000)) {
                AtCommand cmd;
                cmd.text = std::move(text);
                cmd.response_prefix = std::move(prefix);
                cmd.timeout = timeout;
                return cmd;
            }

        } // namespace

        AtCommand attention() {
            return make("AT");
        }

        AtCommand echo_off() {
            return make("ATE0");
        }

        AtCommand software_version() {
            return make("AT+GMR");
        }

        AtCommand store_config() {
            return make("AT&W");
        }

        AtCommand reboot() {
            return make("AT+CPWROFF");
        }

        AtCommand enter_edm() {
            AtCommand cmd = make("ATO2");
            cmd.switches_to_edm = true;
            return cmd;
        }

        std::string peer_url(SocketProtocol protocol, const Endpoint& remote) {
            return protocol_to_string(protocol) + "://" + remote.to_string() + "/";
        }

        AtCommand connect_peer(SocketProtocol protocol, const Endpoint& remote) {
            return make("AT+UDCP=" + quote(peer_url(protocol, remote)), "+UDCP", Millis(5000));
        }

        AtCommand close_peer(int peer_handle) {
            return make("AT+UDCPC=" + std::to_string(peer_handle), "", Millis(5000));
        }

        AtCommand wifi_station_config(int param, const std::string& value) {
            return make("AT+UWSC=0," + std::to_string(param) + "," + value);
        }

        AtCommand wifi_station_action(int action) {
            return make("AT+UWSCA=0," + std::to_string(action), "", Millis(3000));
        }

        AtCommand wifi_ap_config(int param, const std::string& value) {
            return make("AT+UWAPC=0," + std::to_string(param) + "," + value);
        }

        AtCommand wifi_ap_action(int action) {
            return make("AT+UWAPCA=0," + std::to_string(action), "", Millis(3000));
        }

        AtCommand resolve_host(const std::string& host) {
            return make("AT+UDNSRN=0," + quote(host), "+UDNSRN", Millis(70000));
        }

    } // namespace commands
} // namespace ublox
