/**
 * @file command_channel.hpp
 * @brief Single-slot AT command dispatcher with URC routing
 * @version 1.0
 * @date 2025-11-18
 *
 * The channel owns the inbound byte stream. In text mode it assembles lines,
 * after ATO2 it decodes EDM frames. Every inbound line goes through an explicit
 * two-branch dispatch: the grammar of the pending command first, the URC
 * catalog second. Data/connect/disconnect/start frames go to event sinks.
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../at/at_command.hpp"
#include "../at/urc.hpp"
#include "../frame/edm_codec.hpp"
#include "../io/clock.hpp"
#include "../io/serial_port.hpp"
#include "../template/pending.hpp"
#include "../template/result.hpp"
#include "driver_statistics.hpp"
#include "reset_broadcast.hpp"

namespace ublox {

    enum class Framing {
        TEXT,   ///< Plain AT lines
        EDM     ///< Extended Data Mode frames
    };

    inline std::string framing_to_string(Framing framing) {
        return framing == Framing::TEXT ? "TEXT" : "EDM";
    }

    /**
     * @brief Synchronous URC consumer inside the driver
     */
    class IUrcListener {
        public:
            virtual ~IUrcListener() = default;
            virtual void on_urc(const Urc& urc) = 0;
    };

    /**
     * @brief Consumer of EDM events that are not AT text
     */
    class IEdmEventSink {
        public:
            virtual ~IEdmEventSink() = default;
            virtual void on_connect_event(const ConnectEvent&) {}
            virtual void on_disconnect_event(std::uint8_t) {}
            virtual void on_data_event(std::uint8_t, span<const std::uint8_t>) {}
            virtual void on_start_event() {}
    };

    /**
     * @brief Pull-style URC stream for application code
     *
     * Bounded: when the consumer falls behind, the oldest URC is dropped
     * and counted.
     */
    class UrcSubscription {
        public:
            struct Queue {
                std::deque<Urc> items;
                std::size_t capacity = 16;
                std::uint64_t dropped = 0;
            };

            explicit UrcSubscription(std::shared_ptr<Queue> queue)
                : queue_(std::move(queue)) {}

            /**
             * @brief Next URC, or nullopt until the poll loop delivers one
             */
            std::optional<Urc> next() {
                if (queue_->items.empty()) {
                    return std::nullopt;
                }
                Urc urc = std::move(queue_->items.front());
                queue_->items.pop_front();
                return urc;
            }

            std::size_t pending() const { return queue_->items.size(); }
            std::uint64_t dropped() const { return queue_->dropped; }

        private:
            std::shared_ptr<Queue> queue_;
    };

    class CommandChannel {
        public:
            /**
             * @param port Serial transport (not owned)
             * @param clock Time source (not owned)
             * @param resets Reset epoch to observe
             * @param stats Counters to update
             * @param trace Dump traffic to stdout
             * @param urc_queue_capacity Capacity of each UrcSubscription
             */
            CommandChannel(ISerialPort& port, IClock& clock, const ResetBroadcast& resets,
                DriverStatistics& stats, bool trace = false, std::size_t urc_queue_capacity = 16);

            CommandChannel(const CommandChannel&) = delete;
            CommandChannel& operator=(const CommandChannel&) = delete;

            // === Command Slot ===

            /**
             * @brief Write a command and occupy the single command slot
             * @return In-flight marker resolved with the response, TIMEOUT or
             *         PROTOCOL; BUSY at once if a command is already pending;
             *         DWRITE_ERROR if the transport refused the bytes
             */
            Result<Pending<AtResponse> > submit(const AtCommand& command);

            bool busy() const { return pending_.has_value(); }

            /// Text of the pending command, empty when idle
            std::string pending_text() const;

            /**
             * @brief Fail the pending command (reset cascade, shutdown)
             */
            void abort_pending(Status reason, const std::string& context);

            // === Data Path ===

            /**
             * @brief Send channel payload as DataCommand frames
             * @return NOT_READY outside EDM framing, DWRITE_ERROR on transport failure
             */
            Result<void> write_data(std::uint8_t channel, span<const std::uint8_t> data);

            /**
             * @brief Ask the module to replay ConnectEvents for open channels
             */
            Result<void> resend_connect_events();

            // === Inbound ===

            /**
             * @brief Read pending serial bytes, dispatch them, expire the command timeout
             */
            void poll();

            /**
             * @brief Dispatch bytes as if they had been read from the port
             */
            void process_inbound(span<const std::uint8_t> bytes);

            // === Routing ===

            void add_urc_listener(IUrcListener* listener);
            void add_event_sink(IEdmEventSink* sink);
            UrcSubscription subscribe_urc();

            Framing framing() const { return framing_; }
            void set_framing(Framing framing);

        private:
            struct PendingCommand {
                AtCommand command;
                TimePoint issued_at;
                AtResponse response;
                Pending<AtResponse> marker;
            };

            ISerialPort& port_;
            IClock& clock_;
            ResetObserver resets_;
            DriverStatistics& stats_;
            bool trace_;
            std::size_t urc_queue_capacity_;

            Framing framing_ = Framing::TEXT;
            std::optional<PendingCommand> pending_;
            std::string text_line_;
            EdmDecoder decoder_;
            DecoderCounters decoder_seen_;  ///< Decoder counters already folded into stats_

            std::vector<IUrcListener*> listeners_;
            std::vector<IEdmEventSink*> sinks_;
            std::vector<std::weak_ptr<UrcSubscription::Queue> > subscriptions_;

            static constexpr std::size_t MAX_LINE_LENGTH = 1024;
            static constexpr std::size_t READ_CHUNK = 256;
            static constexpr int MAX_WRITE_STALLS = 100;

            /// Drop state invalidated by a module reset; true if one happened
            bool observe_reset();

            void handle_line(const std::string& line);
            void handle_frame(const EdmFrame& frame);
            void dispatch_urc(const Urc& urc);
            void drain_decoder();
            void complete(Result<AtResponse> outcome);
            void check_timeout();

            Result<void> write_all(const std::vector<std::uint8_t>& bytes, const char* what);
    };

} // namespace ublox
