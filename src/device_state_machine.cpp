/**
 * @file device_state_machine.cpp
 * @brief Module readiness state machine implementation
 * @version 1.0
 * @date 2025-11-18
 */

#include <iostream>

#include "../include/pattern/device_state_machine.hpp"
#include "../include/at/commands.hpp"
#include "../include/features.hpp"

namespace ublox {

    namespace {

        std::string unquote(const std::string& text) {
            std::string value = trim(text);
            if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                return value.substr(1, value.size() - 2);
            }
            return value;
        }

        template<typename T>
        Pending<T> rejected(Status status, const std::string& context) {
            return Pending<T>::resolved(Result<T>::error(status, context));
        }

        Pending<void> accepted() {
            return Pending<void>::resolved(Result<void>::success());
        }

    } // namespace

    std::string device_state_to_string(DeviceState state) {
        switch (state) {
        case DeviceState::OFF:       return "OFF";
        case DeviceState::BOOTING:   return "BOOTING";
        case DeviceState::AT_MODE:   return "AT_MODE";
        case DeviceState::EDM_MODE:  return "EDM_MODE";
        case DeviceState::RESETTING: return "RESETTING";
        default:                     return "UNKNOWN";
        }
    }

    std::string network_state_to_string(NetworkState state) {
        switch (state) {
        case NetworkState::IDLE:    return "IDLE";
        case NetworkState::JOINING: return "JOINING";
        case NetworkState::JOINED:  return "JOINED";
        default:                    return "UNKNOWN";
        }
    }

    // === Constructor ===

    DeviceStateMachine::DeviceStateMachine(CommandChannel& channel, IClock& clock,
        const DriverConfig& config, ResetBroadcast& resets, DriverStatistics& stats)
        : channel_(channel)
        , clock_(clock)
        , config_(config)
        , resets_(resets)
        , stats_(stats) {
        channel_.add_urc_listener(this);
        channel_.add_event_sink(this);
    }

    // === Operations ===

    Pending<void> DeviceStateMachine::start_boot() {
        if (op_.kind != OpKind::NONE) {
            return rejected<void>(Status::BUSY, "DeviceStateMachine::start_boot");
        }
        if (module_ready()) {
            return accepted();
        }

        op_ = Operation{};
        op_.kind = OpKind::BOOT;
        op_.step = Step::PROBE;
        state_ = DeviceState::BOOTING;
        firmware_.clear();
        channel_.set_framing(Framing::TEXT);

        // The probe keeps its own short timeout, unlike start_sequence() scripts
        AtCommand probe = commands::attention();
        probe.timeout = config_.boot_probe_timeout();
        op_.sequence = std::make_unique<CommandSequence>(channel_, clock_,
            std::vector<AtCommand>{probe},
            RetryPolicy{static_cast<int>(config_.boot_attempts), config_.boot_backoff(), true});

        std::cout << "[DEVICE] Booting " << variant_traits(features::MODULE).name
                  << " module..." << std::endl;
        return op_.done;
    }

    Pending<void> DeviceStateMachine::enter_edm() {
        if (op_.kind == OpKind::NONE && state_ == DeviceState::EDM_MODE) {
            return accepted();
        }
        auto claimed = begin(OpKind::ENTER_EDM, Step::ENSURE_EDM, {});
        if (!claimed) {
            return Pending<void>::resolved(Result<void>::error(claimed, "DeviceStateMachine::enter_edm"));
        }
        return op_.done;
    }

    Pending<void> DeviceStateMachine::join(const std::string& ssid, const std::string& passphrase) {
        if (!features::WIFI_STA) {
            return rejected<void>(Status::UNSUPPORTED, "DeviceStateMachine::join");
        }
        if (ssid.empty() || ssid.size() > 32) {
            return rejected<void>(Status::INVALID_ARGUMENT, "DeviceStateMachine::join(ssid)");
        }
        if (!passphrase.empty() && (passphrase.size() < 8 || passphrase.size() > 63)) {
            return rejected<void>(Status::INVALID_ARGUMENT, "DeviceStateMachine::join(passphrase)");
        }
        if (op_.kind == OpKind::NONE && network_ == NetworkState::JOINED) {
            return accepted();
        }

        std::vector<AtCommand> script;
        script.push_back(commands::wifi_station_config(commands::WSC_SSID, quote(ssid)));
        if (passphrase.empty()) {
            script.push_back(commands::wifi_station_config(commands::WSC_AUTHENTICATION,
                std::to_string(commands::WSC_AUTH_OPEN)));
        } else {
            script.push_back(commands::wifi_station_config(commands::WSC_AUTHENTICATION,
                std::to_string(commands::WSC_AUTH_WPA_PSK)));
            script.push_back(commands::wifi_station_config(commands::WSC_PASSPHRASE,
                quote(passphrase)));
        }
        script.push_back(commands::wifi_station_action(commands::ACTION_ACTIVATE));

        auto claimed = begin(OpKind::JOIN, Step::ENSURE_EDM, std::move(script));
        if (!claimed) {
            return Pending<void>::resolved(Result<void>::error(claimed, "DeviceStateMachine::join"));
        }
        std::cout << "[DEVICE] Joining WiFi network \"" << ssid << "\"..." << std::endl;
        return op_.done;
    }

    Pending<void> DeviceStateMachine::leave() {
        if (!features::WIFI_STA) {
            return rejected<void>(Status::UNSUPPORTED, "DeviceStateMachine::leave");
        }
        if (!module_ready()) {
            return rejected<void>(Status::NOT_READY, "DeviceStateMachine::leave");
        }
        if (op_.kind == OpKind::NONE && network_ != NetworkState::JOINED) {
            return accepted();
        }
        auto claimed = begin(OpKind::LEAVE, Step::COMMANDS,
            {commands::wifi_station_action(commands::ACTION_DEACTIVATE)});
        if (!claimed) {
            return Pending<void>::resolved(Result<void>::error(claimed, "DeviceStateMachine::leave"));
        }
        return op_.done;
    }

    Pending<void> DeviceStateMachine::start_access_point(const std::string& ssid,
        const std::string& passphrase, int channel) {
        if (!features::WIFI_AP) {
            return rejected<void>(Status::UNSUPPORTED, "DeviceStateMachine::start_access_point");
        }
        if (ssid.empty() || ssid.size() > 32 || channel < 1 || channel > 165) {
            return rejected<void>(Status::INVALID_ARGUMENT, "DeviceStateMachine::start_access_point");
        }
        if (!passphrase.empty() && (passphrase.size() < 8 || passphrase.size() > 63)) {
            return rejected<void>(Status::INVALID_ARGUMENT,
                "DeviceStateMachine::start_access_point(passphrase)");
        }
        if (op_.kind == OpKind::NONE && ap_active_) {
            return accepted();
        }

        std::vector<AtCommand> script;
        script.push_back(commands::wifi_ap_config(commands::WAPC_SSID, quote(ssid)));
        script.push_back(commands::wifi_ap_config(commands::WAPC_CHANNEL, std::to_string(channel)));
        if (passphrase.empty()) {
            script.push_back(commands::wifi_ap_config(commands::WAPC_SECURITY,
                std::to_string(commands::WSC_AUTH_OPEN)));
        } else {
            script.push_back(commands::wifi_ap_config(commands::WAPC_SECURITY,
                std::to_string(commands::WSC_AUTH_WPA_PSK)));
            script.push_back(commands::wifi_ap_config(commands::WAPC_PASSPHRASE, quote(passphrase)));
        }
        script.push_back(commands::wifi_ap_action(commands::ACTION_ACTIVATE));

        auto claimed = begin(OpKind::AP_START, Step::ENSURE_EDM, std::move(script));
        if (!claimed) {
            return Pending<void>::resolved(Result<void>::error(claimed,
                "DeviceStateMachine::start_access_point"));
        }
        return op_.done;
    }

    Pending<void> DeviceStateMachine::stop_access_point() {
        if (!features::WIFI_AP) {
            return rejected<void>(Status::UNSUPPORTED, "DeviceStateMachine::stop_access_point");
        }
        if (!module_ready()) {
            return rejected<void>(Status::NOT_READY, "DeviceStateMachine::stop_access_point");
        }
        if (op_.kind == OpKind::NONE && !ap_active_) {
            return accepted();
        }
        auto claimed = begin(OpKind::AP_STOP, Step::COMMANDS,
            {commands::wifi_ap_action(commands::ACTION_DEACTIVATE)});
        if (!claimed) {
            return Pending<void>::resolved(Result<void>::error(claimed,
                "DeviceStateMachine::stop_access_point"));
        }
        return op_.done;
    }

    Pending<std::string> DeviceStateMachine::resolve_host(const std::string& host) {
        if (host.empty() || host.size() > 253) {
            return rejected<std::string>(Status::INVALID_ARGUMENT, "DeviceStateMachine::resolve_host");
        }
        if (Endpoint::parse(host, 0)) {
            return Pending<std::string>::resolved(Result<std::string>::success(host));
        }

        if (!data_path_ready()) {
            return rejected<std::string>(Status::NOT_READY,
                "DeviceStateMachine::resolve_host(" + host + ") without a network");
        }

        AtCommand lookup = commands::resolve_host(host);
        lookup.timeout = config_.dns_timeout();
        auto claimed = begin(OpKind::DNS, Step::COMMANDS, {lookup});
        if (!claimed) {
            return Pending<std::string>::resolved(Result<std::string>::error(claimed,
                "DeviceStateMachine::resolve_host(" + host + ")"));
        }
        return op_.address;
    }

    Pending<void> DeviceStateMachine::restart(bool store_config) {
        std::vector<AtCommand> script;
        if (store_config) {
            script.push_back(commands::store_config());
        }
        script.push_back(commands::reboot());

        auto claimed = begin(OpKind::RESTART, Step::COMMANDS, std::move(script));
        if (!claimed) {
            return Pending<void>::resolved(Result<void>::error(claimed, "DeviceStateMachine::restart"));
        }
        return op_.done;
    }

    Result<Pending<AtResponse> > DeviceStateMachine::execute(const AtCommand& command) {
        if (!module_ready()) {
            return Result<Pending<AtResponse> >::error(Status::NOT_READY,
                "DeviceStateMachine::execute(" + command.text + ") in " +
                device_state_to_string(state_));
        }
        return channel_.submit(command);
    }

    Result<void> DeviceStateMachine::begin(OpKind kind, Step first, std::vector<AtCommand> script) {
        // A boot in flight holds op_, but the module is still not ready for anything else
        if (!module_ready()) {
            return Result<void>::error(Status::NOT_READY,
                "DeviceStateMachine::begin in " + device_state_to_string(state_));
        }
        if (op_.kind != OpKind::NONE) {
            return Result<void>::error(Status::BUSY, "DeviceStateMachine::begin");
        }
        op_ = Operation{};
        op_.kind = kind;
        op_.step = first;
        op_.script = std::move(script);
        return Result<void>::success();
    }

    // === Reset Cascade ===

    void DeviceStateMachine::reset_cascade(const std::string& reason) {
        if (state_ == DeviceState::OFF || state_ == DeviceState::RESETTING) {
            return;
        }

        std::cerr << "[DEVICE] Reset cascade (" << reason
                  << "): invalidating sockets and pending command" << std::endl;
        state_ = DeviceState::RESETTING;
        stats_.resets++;
        resets_.signal();

        if (op_.kind != OpKind::NONE) {
            if (op_.sequence) {
                op_.sequence->abort(Status::FATAL);
            }
            fail(Status::FATAL, "DeviceStateMachine::reset(" + reason + ")");
        }

        network_ = NetworkState::IDLE;
        link_up_ = false;
        network_up_ = false;
        link_lost_ = false;
        ap_active_ = false;
        ap_stations_ = 0;
        bt_links_ = 0;
        edm_entry_ = false;
        settle_until_.reset();

        state_ = DeviceState::OFF;
    }

    // === Poll ===

    void DeviceStateMachine::poll() {
        if (op_.kind == OpKind::NONE) {
            return;
        }

        switch (op_.step) {
        case Step::PROBE:
        case Step::ECHO_OFF:
        case Step::VERSION:
            advance_boot();
            break;
        case Step::ENSURE_EDM:
        case Step::AWAIT_EDM:
        case Step::SETTLE:
            advance_edm_entry();
            break;
        case Step::COMMANDS:
        case Step::AWAIT_COMMANDS:
            advance_commands();
            break;
        case Step::AWAIT_URC:
            await_urc();
            break;
        }
    }

    RetryPolicy DeviceStateMachine::command_policy() const {
        return RetryPolicy{static_cast<int>(config_.command_retries), config_.boot_backoff(), false};
    }

    void DeviceStateMachine::start_sequence(std::vector<AtCommand> script, RetryPolicy policy) {
        for (auto& command : script) {
            if (command.timeout < config_.command_timeout()) {
                command.timeout = config_.command_timeout();
            }
        }
        op_.sequence = std::make_unique<CommandSequence>(channel_, clock_, std::move(script), policy);
    }

    std::optional<Result<std::vector<AtResponse> > > DeviceStateMachine::sequence_outcome() {
        if (!op_.sequence) {
            return Result<std::vector<AtResponse> >::error(Status::UNKNOWN,
                "DeviceStateMachine: no command script");
        }
        if (!op_.sequence->poll()) {
            return std::nullopt;
        }
        auto outcome = op_.sequence->result();
        op_.sequence.reset();
        return outcome;
    }

    void DeviceStateMachine::advance_boot() {
        auto outcome = sequence_outcome();
        if (!outcome) {
            return;
        }

        switch (op_.step) {
        case Step::PROBE:
            if (!*outcome) {
                std::cerr << "[DEVICE] Module not responding after " << config_.boot_attempts
                          << " probe(s)" << std::endl;
                state_ = DeviceState::OFF;
                fail(Status::FATAL, "DeviceStateMachine::boot(probe)");
                return;
            }
            op_.step = Step::ECHO_OFF;
            start_sequence({commands::echo_off()}, command_policy());
            return;

        case Step::ECHO_OFF:
            if (!*outcome) {
                std::cerr << "[DEVICE] Echo off failed: " << outcome->describe() << std::endl;
                state_ = DeviceState::OFF;
                fail(Status::FATAL, "DeviceStateMachine::boot(echo off)");
                return;
            }
            op_.step = Step::VERSION;
            start_sequence({commands::software_version()}, command_policy());
            return;

        case Step::VERSION:
            if (*outcome && !outcome->value().empty() && !outcome->value().front().empty()) {
                firmware_ = unquote(outcome->value().front().lines.front());
            } else {
                std::cerr << "[DEVICE] Firmware version query failed, continuing" << std::endl;
                firmware_ = "unknown";
            }
            state_ = DeviceState::AT_MODE;
            network_ = NetworkState::IDLE;
            std::cout << "[DEVICE] Module ready in AT mode (firmware " << firmware_ << ") ✓"
                      << std::endl;
            finish();
            return;

        default:
            return;
        }
    }

    void DeviceStateMachine::advance_edm_entry() {
        if (op_.step == Step::ENSURE_EDM) {
            if (state_ == DeviceState::EDM_MODE) {
                op_.step = Step::COMMANDS;
                advance_commands();
                return;
            }
            edm_entry_ = true;
            op_.step = Step::AWAIT_EDM;
            start_sequence({commands::enter_edm()}, command_policy());
            return;
        }

        if (op_.step == Step::AWAIT_EDM) {
            auto outcome = sequence_outcome();
            if (!outcome) {
                return;
            }
            if (!*outcome) {
                edm_entry_ = false;
                fail(*outcome, "DeviceStateMachine::enter_edm");
                return;
            }
            settle_until_ = clock_.now() + config_.edm_settle();
            op_.step = Step::SETTLE;
        }

        if (settle_until_ && clock_.now() < *settle_until_) {
            return;
        }
        settle_until_.reset();
        edm_entry_ = false;
        state_ = DeviceState::EDM_MODE;
        std::cout << "[DEVICE] Extended Data Mode active ✓" << std::endl;
        op_.step = Step::COMMANDS;
        advance_commands();
    }

    void DeviceStateMachine::advance_commands() {
        if (op_.step == Step::COMMANDS) {
            if (op_.script.empty()) {
                on_commands_done({});
                return;
            }
            if (op_.kind == OpKind::JOIN) {
                network_ = NetworkState::JOINING;
                link_up_ = false;
                network_up_ = false;
                link_lost_ = false;
            }
            op_.step = Step::AWAIT_COMMANDS;
            start_sequence(op_.script, command_policy());
            return;
        }

        auto outcome = sequence_outcome();
        if (!outcome) {
            return;
        }
        if (!*outcome) {
            if (op_.kind == OpKind::JOIN) {
                network_ = NetworkState::IDLE;
            }
            std::cerr << "[DEVICE] Command script failed: " << outcome->describe() << std::endl;
            fail(*outcome, "DeviceStateMachine::poll");
            return;
        }
        on_commands_done(outcome->value());
    }

    void DeviceStateMachine::on_commands_done(const std::vector<AtResponse>& responses) {
        switch (op_.kind) {
        case OpKind::JOIN:
            op_.deadline = clock_.now() + config_.join_timeout();
            op_.step = Step::AWAIT_URC;
            await_urc();
            return;

        case OpKind::AP_START:
            op_.deadline = clock_.now() + config_.join_timeout();
            op_.step = Step::AWAIT_URC;
            await_urc();
            return;

        case OpKind::LEAVE:
            network_ = NetworkState::IDLE;
            link_up_ = false;
            network_up_ = false;
            std::cout << "[DEVICE] Left WiFi network" << std::endl;
            finish();
            return;

        case OpKind::AP_STOP:
            ap_active_ = false;
            ap_stations_ = 0;
            std::cout << "[DEVICE] Access point stopped" << std::endl;
            finish();
            return;

        case OpKind::DNS: {
            std::vector<std::string> params;
            if (!responses.empty()) {
                params = responses.front().params("+UDNSRN");
            }
            if (params.empty() || !Endpoint::parse(params.front(), 0)) {
                fail(Status::PROTOCOL, "DeviceStateMachine::resolve_host: no address in reply");
                return;
            }
            finish_address(params.front());
            return;
        }

        case OpKind::RESTART: {
            Pending<void> done = op_.done;
            op_ = Operation{};
            reset_cascade("restart requested");
            done.resolve(Result<void>::success());
            return;
        }

        default:
            finish();
            return;
        }
    }

    void DeviceStateMachine::await_urc() {
        if (op_.kind == OpKind::JOIN) {
            if (link_lost_) {
                network_ = NetworkState::IDLE;
                std::string reason = last_disconnect_reason_
                                     ? disconnect_reason_to_string(*last_disconnect_reason_)
                                     : "unknown";
                std::cerr << "[DEVICE] WiFi join failed: " << reason << std::endl;
                fail(Status::PROTOCOL, "DeviceStateMachine::join: link down (" + reason + ")");
                return;
            }
            if (link_up_ && network_up_) {
                network_ = NetworkState::JOINED;
                std::cout << "[DEVICE] Joined WiFi network ✓" << std::endl;
                finish();
                return;
            }
        } else if (op_.kind == OpKind::AP_START) {
            if (ap_active_) {
                std::cout << "[DEVICE] Access point up ✓" << std::endl;
                finish();
                return;
            }
        }

        if (clock_.now() >= op_.deadline) {
            if (op_.kind == OpKind::JOIN) {
                network_ = NetworkState::IDLE;
            }
            std::cerr << "[DEVICE] Timed out waiting for network confirmation" << std::endl;
            fail(Status::TIMEOUT, "DeviceStateMachine::await_urc");
        }
    }

    // === Completion ===

    void DeviceStateMachine::finish() {
        Operation finished = std::move(op_);
        op_ = Operation{};
        finished.done.resolve(Result<void>::success());
    }

    void DeviceStateMachine::finish_address(const std::string& address) {
        Operation finished = std::move(op_);
        op_ = Operation{};
        finished.address.resolve(Result<std::string>::success(address));
    }

    void DeviceStateMachine::fail(Status status, const std::string& context) {
        Operation finished = std::move(op_);
        op_ = Operation{};
        finished.done.resolve(Result<void>::error(status, context));
        finished.address.resolve(Result<std::string>::error(status, context));
    }

    template<typename U>
    void DeviceStateMachine::fail(const Result<U>& failure, const std::string& context) {
        Operation finished = std::move(op_);
        op_ = Operation{};
        finished.done.resolve(Result<void>::error(failure, context));
        finished.address.resolve(Result<std::string>::error(failure, context));
    }

    // === Readiness ===

    bool DeviceStateMachine::data_path_ready() const {
        return state_ == DeviceState::EDM_MODE
               && (network_ == NetworkState::JOINED || ap_active_);
    }

    // === Listeners ===

    void DeviceStateMachine::on_urc(const Urc& urc) {
        switch (urc.kind) {
        case UrcKind::STARTUP:
            if (state_ == DeviceState::BOOTING) {
                return;
            }
            reset_cascade("+STARTUP");
            return;

        case UrcKind::WIFI_LINK_CONNECTED:
            link_up_ = true;
            return;

        case UrcKind::WIFI_LINK_DISCONNECTED:
            last_disconnect_reason_ = urc.disconnect_reason();
            link_up_ = false;
            if (network_ == NetworkState::JOINING) {
                link_lost_ = true;
            } else if (network_ == NetworkState::JOINED) {
                network_ = NetworkState::IDLE;
                std::cerr << "[DEVICE] WiFi link lost: "
                          << disconnect_reason_to_string(*last_disconnect_reason_) << std::endl;
            }
            return;

        case UrcKind::NETWORK_UP:
            network_up_ = true;
            return;

        case UrcKind::NETWORK_DOWN:
            network_up_ = false;
            return;

        case UrcKind::NETWORK_ERROR:
            std::cerr << "[DEVICE] Network error: " << urc.line << std::endl;
            return;

        case UrcKind::WIFI_AP_UP:
            ap_active_ = true;
            return;

        case UrcKind::WIFI_AP_DOWN:
            ap_active_ = false;
            ap_stations_ = 0;
            return;

        case UrcKind::WIFI_AP_STATION_CONNECTED:
            ++ap_stations_;
            return;

        case UrcKind::WIFI_AP_STATION_DISCONNECTED:
            if (ap_stations_ > 0) {
                --ap_stations_;
            }
            return;

        case UrcKind::BT_ACL_CONNECTED:
            if (features::BLUETOOTH) {
                ++bt_links_;
            }
            return;

        case UrcKind::BT_ACL_DISCONNECTED:
            if (features::BLUETOOTH && bt_links_ > 0) {
                --bt_links_;
            }
            return;

        default:
            // Peer URCs belong to the socket registry
            return;
        }
    }

    void DeviceStateMachine::on_start_event() {
        if (state_ == DeviceState::BOOTING || edm_entry_) {
            return;
        }
        reset_cascade("unexpected EDM start event");
    }

} // namespace ublox
