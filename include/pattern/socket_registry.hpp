/**
 * @file socket_registry.hpp
 * @brief Fixed-capacity table of logical sockets mapped onto module peers and EDM channels
 * @version 1.0
 * @date 2025-11-18
 *
 * Per-socket lifecycle:
 *   CLOSED -> OPENING -> OPEN -> [DATA_TRANSFER] -> CLOSING -> CLOSED
 *
 * Callers only ever hold a SocketId. The generation part changes whenever a
 * slot is released, so an id kept past close() or a reset is rejected with
 * INVALID_HANDLE instead of touching the slot's next owner.
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <array>
#include <deque>
#include <memory>
#include <optional>
#include <string>

#include "../features.hpp"
#include "../frame/endpoint.hpp"
#include "../template/ring_buffer.hpp"
#include "command_sequence.hpp"
#include "device_state_machine.hpp"
#include "driver_config.hpp"

namespace ublox {

    struct SocketId {
        std::uint8_t slot = 0xFF;
        std::uint16_t generation = 0;

        bool operator==(const SocketId& other) const {
            return slot == other.slot && generation == other.generation;
        }

        bool operator!=(const SocketId& other) const {
            return !(*this == other);
        }

        std::string to_string() const {
            return "socket#" + std::to_string(slot) + "." + std::to_string(generation);
        }
    };

    enum class SocketState {
        CLOSED,
        OPENING,
        OPEN,
        DATA_TRANSFER,
        CLOSING
    };

    std::string socket_state_to_string(SocketState state);

    class SocketRegistry : public IUrcListener, public IEdmEventSink {
        public:
            static constexpr std::size_t CAPACITY = features::MAX_SOCKETS;

            /**
             * @param channel Command channel; the registry registers itself as
             *        URC listener and event sink
             * @param clock Time source
             * @param gate Readiness of the data path (device state machine)
             * @param config Timeouts and retry budgets
             * @param resets Reset epoch to observe
             * @param stats Driver counters
             */
            SocketRegistry(CommandChannel& channel, IClock& clock, const IReadinessGate& gate,
                const DriverConfig& config, const ResetBroadcast& resets, DriverStatistics& stats);

            SocketRegistry(const SocketRegistry&) = delete;
            SocketRegistry& operator=(const SocketRegistry&) = delete;

            // === Socket Operations ===

            /**
             * @brief Allocate a slot and connect it to remote
             * @return Marker resolved with the new id once the module reports the
             *         channel; NOT_READY, UNSUPPORTED or RESOURCE_EXHAUSTED at once
             */
            Pending<SocketId> open(SocketProtocol protocol, const Endpoint& remote);

            /**
             * @brief Queue bytes and flush what the channel accepts
             * @return Bytes accepted, possibly fewer than offered when the tx buffer is full
             */
            Result<std::size_t> send(SocketId id, span<const std::uint8_t> data);

            /**
             * @brief Drain buffered bytes into out, never blocks
             * @return 0 when nothing is buffered; CLOSED once the peer closed and the
             *         buffer is empty
             */
            Result<std::size_t> receive(SocketId id, span<std::uint8_t> out);

            /**
             * @brief Close the peer and release the slot
             *
             * A close that times out still releases the slot and reports success.
             */
            Pending<void> close(SocketId id);

            void poll();

            // === Queries ===

            /// CLOSED for ids that do not name a live socket
            SocketState state(SocketId id) const;
            std::size_t free_slots() const;
            std::size_t buffered(SocketId id) const;
            bool peer_closed(SocketId id) const;
            std::optional<std::uint8_t> channel_of(SocketId id) const;
            std::optional<Endpoint> remote_of(SocketId id) const;

            // === Listeners ===

            void on_urc(const Urc& urc) override;
            void on_connect_event(const ConnectEvent& event) override;
            void on_disconnect_event(std::uint8_t channel) override;
            void on_data_event(std::uint8_t channel, span<const std::uint8_t> data) override;
            void on_start_event() override;

        private:
            struct Slot {
                SocketState state = SocketState::CLOSED;
                std::uint16_t generation = 0;
                SocketProtocol protocol = SocketProtocol::TCP;
                Endpoint remote;
                std::optional<int> peer;
                std::optional<std::uint8_t> channel;
                bool remote_closed = false;
                RingBuffer<features::SOCKET_RX_BUFFER> rx;
                RingBuffer<features::SOCKET_TX_BUFFER> tx;
                std::unique_ptr<CommandSequence> sequence;
                TimePoint deadline{};
                Pending<SocketId> opening;
                Pending<void> closing;
            };

            CommandChannel& channel_;
            IClock& clock_;
            const IReadinessGate& gate_;
            DriverConfig config_;
            ResetObserver resets_;
            DriverStatistics& stats_;

            std::array<Slot, CAPACITY> slots_;
            std::deque<int> orphan_peers_;               ///< Peers left behind by failed opens
            std::unique_ptr<CommandSequence> orphan_close_;

            static constexpr std::size_t MAX_ORPHANS = 8;

            SocketId id_of(std::size_t index) const {
                return SocketId{static_cast<std::uint8_t>(index), slots_[index].generation};
            }

            Slot* lookup(SocketId id);
            const Slot* lookup(SocketId id) const;
            Slot* find_by_channel(std::uint8_t channel);

            RetryPolicy command_policy() const;
            RetryPolicy connect_policy() const;
            AtCommand with_timeout(AtCommand command, Millis timeout) const;

            void observe_reset();
            void advance_opening(std::size_t index);
            void advance_closing(std::size_t index);
            void try_promote(std::size_t index);
            void fail_open(std::size_t index, Result<SocketId> failure);
            void flush_tx(Slot& slot);
            void release(Slot& slot);
            void orphan(int peer);
            void advance_orphans();
    };

} // namespace ublox
