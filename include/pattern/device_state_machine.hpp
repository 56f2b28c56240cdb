/**
 * @file device_state_machine.hpp
 * @brief Module readiness tracking: boot, AT/EDM mode, network join, reset cascade
 * @version 1.0
 * @date 2025-11-18
 *
 * Device lifecycle:
 *   OFF -> BOOTING -> AT_MODE -> EDM_MODE -> RESETTING -> OFF
 * Network lifecycle (meaningful while AT_MODE or EDM_MODE):
 *   IDLE -> JOINING -> JOINED
 *
 * Every long running operation is a Pending marker advanced by poll(). Only
 * one operation runs at a time; a second request fails with BUSY.
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "command_sequence.hpp"
#include "driver_config.hpp"

namespace ublox {

    enum class DeviceState {
        OFF,
        BOOTING,
        AT_MODE,
        EDM_MODE,
        RESETTING
    };

    enum class NetworkState {
        IDLE,
        JOINING,
        JOINED
    };

    std::string device_state_to_string(DeviceState state);
    std::string network_state_to_string(NetworkState state);

    /**
     * @brief Readiness query the socket layer consults before touching the module
     */
    class IReadinessGate {
        public:
            virtual ~IReadinessGate() = default;

            /// EDM framing active and a network (station or access point) up
            virtual bool data_path_ready() const = 0;
    };

    class DeviceStateMachine : public IUrcListener, public IEdmEventSink, public IReadinessGate {
        public:
            /**
             * @param channel Shared command channel; the machine registers itself as
             *        URC listener and event sink
             * @param clock Time source
             * @param config Timeouts and retry budgets
             * @param resets Reset epoch this machine signals
             * @param stats Driver counters
             */
            DeviceStateMachine(CommandChannel& channel, IClock& clock, const DriverConfig& config,
                ResetBroadcast& resets, DriverStatistics& stats);

            DeviceStateMachine(const DeviceStateMachine&) = delete;
            DeviceStateMachine& operator=(const DeviceStateMachine&) = delete;

            // === Operations ===

            /// Liveness probe with backoff, echo off, firmware query
            Pending<void> start_boot();

            /// ATO2 plus settle window
            Pending<void> enter_edm();

            /// Station join, entering EDM first when needed
            Pending<void> join(const std::string& ssid, const std::string& passphrase = "");

            Pending<void> leave();

            Pending<void> start_access_point(const std::string& ssid,
                const std::string& passphrase = "", int channel = 6);

            Pending<void> stop_access_point();

            /// Dotted IPv4 address of host, resolved by the module
            Pending<std::string> resolve_host(const std::string& host);

            /// Optional AT&W, then AT+CPWROFF, then the invalidation cascade
            Pending<void> restart(bool store_config = false);

            /**
             * @brief Issue a caller supplied command
             * @return NOT_READY unless the module is in AT or EDM mode; nothing is
             *         written in that case
             */
            Result<Pending<AtResponse> > execute(const AtCommand& command);

            /**
             * @brief Invalidate every socket and pending command, then go OFF
             *
             * Safe to call from the receive path and idempotent: a second call
             * before the next boot does nothing.
             */
            void reset_cascade(const std::string& reason);

            void poll();

            // === Queries ===

            DeviceState state() const { return state_; }
            NetworkState network_state() const { return network_; }
            bool operation_in_flight() const { return op_.kind != OpKind::NONE; }
            const std::string& firmware_version() const { return firmware_; }
            bool access_point_active() const { return ap_active_; }
            int access_point_stations() const { return ap_stations_; }
            int bluetooth_links() const { return bt_links_; }
            std::optional<DisconnectReason> last_disconnect_reason() const {
                return last_disconnect_reason_;
            }

            bool data_path_ready() const override;

            // === Listeners ===

            void on_urc(const Urc& urc) override;
            void on_start_event() override;

        private:
            enum class OpKind {
                NONE,
                BOOT,
                ENTER_EDM,
                JOIN,
                LEAVE,
                AP_START,
                AP_STOP,
                DNS,
                RESTART
            };

            /// Progress of the running operation
            enum class Step {
                ENSURE_EDM,     ///< Send ATO2 if still in AT mode
                AWAIT_EDM,      ///< ATO2 outstanding
                SETTLE,         ///< Post ATO2 quiet period
                COMMANDS,       ///< Send the operation's command script
                AWAIT_COMMANDS, ///< Script outstanding
                AWAIT_URC,      ///< Waiting for the confirming URC
                PROBE,          ///< Boot: liveness probe outstanding
                ECHO_OFF,       ///< Boot: ATE0 outstanding
                VERSION         ///< Boot: AT+GMR outstanding
            };

            struct Operation {
                OpKind kind = OpKind::NONE;
                Step step = Step::COMMANDS;
                std::vector<AtCommand> script;
                std::unique_ptr<CommandSequence> sequence;
                TimePoint deadline{};
                Pending<void> done;
                Pending<std::string> address;
            };

            CommandChannel& channel_;
            IClock& clock_;
            DriverConfig config_;
            ResetBroadcast& resets_;
            DriverStatistics& stats_;

            DeviceState state_ = DeviceState::OFF;
            NetworkState network_ = NetworkState::IDLE;
            Operation op_;

            std::string firmware_;
            bool edm_entry_ = false;                ///< ATO2 sent, settle window not over
            std::optional<TimePoint> settle_until_;
            bool link_up_ = false;
            bool network_up_ = false;
            bool link_lost_ = false;
            std::optional<DisconnectReason> last_disconnect_reason_;
            bool ap_active_ = false;
            int ap_stations_ = 0;
            int bt_links_ = 0;

            bool module_ready() const {
                return state_ == DeviceState::AT_MODE || state_ == DeviceState::EDM_MODE;
            }

            RetryPolicy command_policy() const;

            /// Check the common preconditions and claim the operation slot
            Result<void> begin(OpKind kind, Step first, std::vector<AtCommand> script);

            void start_sequence(std::vector<AtCommand> script, RetryPolicy policy);
            std::optional<Result<std::vector<AtResponse> > > sequence_outcome();

            void advance_boot();
            void advance_edm_entry();
            void advance_commands();
            void on_commands_done(const std::vector<AtResponse>& responses);
            void await_urc();

            void finish();
            void finish_address(const std::string& address);
            void fail(Status status, const std::string& context);
            template<typename U>
            void fail(const Result<U>& failure, const std::string& context);
    };

} // namespace ublox
