/**
 * @file socket_registry.cpp
 * @brief Logical socket table implementation
 * @version 1.0
 * @date 2025-11-18
 */

#include <iostream>

#include "../include/pattern/socket_registry.hpp"
#include "../include/at/commands.hpp"

namespace ublox {

    std::string socket_state_to_string(SocketState state) {
        switch (state) {
        case SocketState::CLOSED:        return "CLOSED";
        case SocketState::OPENING:       return "OPENING";
        case SocketState::OPEN:          return "OPEN";
        case SocketState::DATA_TRANSFER: return "DATA_TRANSFER";
        case SocketState::CLOSING:       return "CLOSING";
        default:                         return "UNKNOWN";
        }
    }

    // === Constructor ===

    SocketRegistry::SocketRegistry(CommandChannel& channel, IClock& clock, const IReadinessGate& gate,
        const DriverConfig& config, const ResetBroadcast& resets, DriverStatistics& stats)
        : channel_(channel)
        , clock_(clock)
        , gate_(gate)
        , config_(config)
        , resets_(resets)
        , stats_(stats) {
        channel_.add_urc_listener(this);
        channel_.add_event_sink(this);
    }

    // === Socket Operations ===

    Pending<SocketId> SocketRegistry::open(SocketProtocol protocol, const Endpoint& remote) {
        using R = Result<SocketId>;
        observe_reset();

        const bool compiled_in = protocol == SocketProtocol::TCP ? features::SOCKET_TCP
                                                                  : features::SOCKET_UDP;
        if (!compiled_in) {
            return Pending<SocketId>::resolved(R::error(Status::UNSUPPORTED,
                "SocketRegistry::open(" + protocol_to_string(protocol) + ")"));
        }
        if (remote.port == 0) {
            return Pending<SocketId>::resolved(R::error(Status::INVALID_ARGUMENT,
                "SocketRegistry::open(port 0)"));
        }
        if (!gate_.data_path_ready()) {
            return Pending<SocketId>::resolved(R::error(Status::NOT_READY, "SocketRegistry::open"));
        }

        std::size_t index = 0;
        while (index < CAPACITY && slots_[index].state != SocketState::CLOSED) {
            ++index;
        }
        if (index == CAPACITY) {
            return Pending<SocketId>::resolved(R::error(Status::RESOURCE_EXHAUSTED,
                "SocketRegistry::open"));
        }

        Slot& slot = slots_[index];
        slot.state = SocketState::OPENING;
        slot.protocol = protocol;
        slot.remote = remote;
        slot.peer.reset();
        slot.channel.reset();
        slot.remote_closed = false;
        slot.rx.clear();
        slot.tx.clear();
        slot.opening = Pending<SocketId>();
        slot.deadline = clock_.now() + config_.connect_timeout();
        slot.sequence = std::make_unique<CommandSequence>(channel_, clock_,
            std::vector<AtCommand>{with_timeout(commands::connect_peer(protocol, remote),
                                                config_.command_timeout())},
            connect_policy());

        std::cout << "[SOCKET] " << id_of(index).to_string() << " opening "
                  << commands::peer_url(protocol, remote) << std::endl;
        return slot.opening;
    }

    Result<std::size_t> SocketRegistry::send(SocketId id, span<const std::uint8_t> data) {
        using R = Result<std::size_t>;
        observe_reset();

        Slot* slot = lookup(id);
        if (!slot) {
            return R::error(Status::INVALID_HANDLE, "SocketRegistry::send(" + id.to_string() + ")");
        }
        if (slot->remote_closed) {
            return R::error(Status::CLOSED, "SocketRegistry::send(" + id.to_string() + ")");
        }
        if (slot->state != SocketState::OPEN && slot->state != SocketState::DATA_TRANSFER) {
            return R::error(Status::NOT_READY, "SocketRegistry::send(" + id.to_string() + ") in " +
                socket_state_to_string(slot->state));
        }
        if (!gate_.data_path_ready()) {
            return R::error(Status::NOT_READY, "SocketRegistry::send");
        }

        std::size_t accepted = slot->tx.push(data);
        if (accepted > 0) {
            slot->state = SocketState::DATA_TRANSFER;
        }
        flush_tx(*slot);
        return R::success(accepted);
    }

    Result<std::size_t> SocketRegistry::receive(SocketId id, span<std::uint8_t> out) {
        using R = Result<std::size_t>;
        observe_reset();

        Slot* slot = lookup(id);
        if (!slot) {
            return R::error(Status::INVALID_HANDLE, "SocketRegistry::receive(" + id.to_string() + ")");
        }
        if (slot->state == SocketState::OPENING) {
            return R::error(Status::NOT_READY, "SocketRegistry::receive(" + id.to_string() + ")");
        }

        std::size_t count = slot->rx.pop(out);
        if (count == 0 && slot->remote_closed) {
            return R::error(Status::CLOSED, "SocketRegistry::receive(" + id.to_string() + ")");
        }
        return R::success(count);
    }

    Pending<void> SocketRegistry::close(SocketId id) {
        observe_reset();

        Slot* slot = lookup(id);
        if (!slot) {
            return Pending<void>::resolved(Result<void>::error(Status::INVALID_HANDLE,
                "SocketRegistry::close(" + id.to_string() + ")"));
        }
        if (slot->state == SocketState::CLOSING) {
            return slot->closing;
        }
        if (slot->state == SocketState::OPENING) {
            return Pending<void>::resolved(Result<void>::error(Status::BUSY,
                "SocketRegistry::close(" + id.to_string() + ") while opening"));
        }

        if (slot->remote_closed || !slot->peer) {
            if (slot->peer) {
                orphan(*slot->peer);
            }
            std::cout << "[SOCKET] " << id.to_string() << " released" << std::endl;
            release(*slot);
            return Pending<void>::resolved(Result<void>::success());
        }

        flush_tx(*slot);
        slot->state = SocketState::CLOSING;
        slot->closing = Pending<void>();
        slot->sequence = std::make_unique<CommandSequence>(channel_, clock_,
            std::vector<AtCommand>{with_timeout(commands::close_peer(*slot->peer),
                                                config_.close_timeout())},
            command_policy());
        return slot->closing;
    }

    // === Poll ===

    void SocketRegistry::poll() {
        observe_reset();

        for (std::size_t index = 0; index < CAPACITY; ++index) {
            Slot& slot = slots_[index];
            switch (slot.state) {
            case SocketState::OPENING:
                advance_opening(index);
                break;
            case SocketState::OPEN:
            case SocketState::DATA_TRANSFER:
                flush_tx(slot);
                break;
            case SocketState::CLOSING:
                advance_closing(index);
                break;
            default:
                break;
            }
        }

        advance_orphans();
    }

    void SocketRegistry::advance_opening(std::size_t index) {
        Slot& slot = slots_[index];

        if (slot.sequence) {
            if (!slot.sequence->poll()) {
                return;
            }
            auto outcome = slot.sequence->result();
            slot.sequence.reset();
            if (!outcome) {
                fail_open(index, Result<SocketId>::error(outcome, "SocketRegistry::open"));
                return;
            }

            std::optional<int> peer;
            if (!outcome.value().empty()) {
                auto params = outcome.value().front().params("+UDCP");
                if (!params.empty()) {
                    peer = to_int(params.front());
                }
            }
            if (!peer) {
                std::cerr << "[SOCKET] No peer handle in +UDCP reply" << std::endl;
                fail_open(index, Result<SocketId>::error(Status::PROTOCOL,
                    "SocketRegistry::open: missing +UDCP"));
                return;
            }
            slot.peer = peer;
        }

        try_promote(index);

        if (slot.state == SocketState::OPENING && clock_.now() >= slot.deadline) {
            std::cerr << "[SOCKET] " << id_of(index).to_string()
                      << " no connect event within budget" << std::endl;
            fail_open(index, Result<SocketId>::error(Status::TIMEOUT, "SocketRegistry::open"));
        }
    }

    void SocketRegistry::try_promote(std::size_t index) {
        Slot& slot = slots_[index];
        if (slot.state != SocketState::OPENING || slot.sequence || !slot.peer || !slot.channel) {
            return;
        }
        slot.state = SocketState::OPEN;
        std::cout << "[SOCKET] " << id_of(index).to_string() << " open (peer " << *slot.peer
                  << ", channel " << static_cast<int>(*slot.channel) << ") ✓" << std::endl;
        slot.opening.resolve(Result<SocketId>::success(id_of(index)));
    }

    void SocketRegistry::fail_open(std::size_t index, Result<SocketId> failure) {
        Slot& slot = slots_[index];
        if (slot.peer && !slot.remote_closed) {
            orphan(*slot.peer);
        }
        Pending<SocketId> opening = slot.opening;
        release(slot);
        opening.resolve(std::move(failure));
    }

    void SocketRegistry::advance_closing(std::size_t index) {
        Slot& slot = slots_[index];
        if (!slot.sequence || !slot.sequence->poll()) {
            return;
        }
        auto outcome = slot.sequence->result();
        Pending<void> closing = slot.closing;
        SocketId id = id_of(index);
        release(slot);

        if (outcome || outcome.error() == Status::TIMEOUT) {
            std::cout << "[SOCKET] " << id.to_string() << " closed" << std::endl;
            closing.resolve(Result<void>::success());
        } else {
            std::cerr << "[SOCKET] " << id.to_string() << " close failed: " << outcome.describe()
                      << std::endl;
            closing.resolve(Result<void>::error(outcome, "SocketRegistry::close"));
        }
    }

    void SocketRegistry::flush_tx(Slot& slot) {
        if (!slot.channel || slot.tx.empty() || channel_.framing() != Framing::EDM) {
            return;
        }
        std::array<std::uint8_t, EGRESS_CHUNK_SIZE> chunk;
        while (!slot.tx.empty()) {
            std::size_t count = slot.tx.peek(span<std::uint8_t>(chunk.data(), chunk.size()));
            auto written = channel_.write_data(*slot.channel,
                span<const std::uint8_t>(chunk.data(), count));
            if (!written) {
                // Kept for the next poll
                return;
            }
            slot.tx.consume(count);
        }
    }

    void SocketRegistry::release(Slot& slot) {
        slot.state = SocketState::CLOSED;
        slot.generation++;
        slot.peer.reset();
        slot.channel.reset();
        slot.remote_closed = false;
        slot.rx.clear();
        slot.tx.clear();
        slot.sequence.reset();
    }

    // === Orphan Peers ===

    void SocketRegistry::orphan(int peer) {
        if (orphan_peers_.size() >= MAX_ORPHANS) {
            std::cerr << "[SOCKET] Too many orphan peers, leaking peer " << orphan_peers_.front()
                      << std::endl;
            orphan_peers_.pop_front();
        }
        orphan_peers_.push_back(peer);
    }

    void SocketRegistry::advance_orphans() {
        if (orphan_close_) {
            if (!orphan_close_->poll()) {
                return;
            }
            auto outcome = orphan_close_->result();
            if (!outcome) {
                std::cerr << "[SOCKET] Background peer close failed: " << outcome.describe()
                          << std::endl;
            }
            orphan_close_.reset();
        }

        if (orphan_peers_.empty() || channel_.framing() != Framing::EDM) {
            return;
        }
        int peer = orphan_peers_.front();
        orphan_peers_.pop_front();
        orphan_close_ = std::make_unique<CommandSequence>(channel_, clock_,
            std::vector<AtCommand>{with_timeout(commands::close_peer(peer), config_.close_timeout())},
            command_policy());
    }

    // === Reset ===

    void SocketRegistry::observe_reset() {
        if (!resets_.observe()) {
            return;
        }

        std::size_t invalidated = 0;
        for (std::size_t index = 0; index < CAPACITY; ++index) {
            Slot& slot = slots_[index];
            if (slot.state == SocketState::CLOSED) {
                continue;
            }
            ++invalidated;
            Pending<SocketId> opening = slot.opening;
            Pending<void> closing = slot.closing;
            const SocketState previous = slot.state;
            release(slot);
            if (previous == SocketState::OPENING) {
                opening.resolve(Result<SocketId>::error(Status::NOT_READY, "SocketRegistry::reset"));
            } else if (previous == SocketState::CLOSING) {
                closing.resolve(Result<void>::success());
            }
        }
        orphan_peers_.clear();
        orphan_close_.reset();

        if (invalidated > 0) {
            std::cerr << "[SOCKET] Module reset: " << invalidated << " socket(s) invalidated"
                      << std::endl;
        }
    }

    // === Listeners ===

    void SocketRegistry::on_urc(const Urc& urc) {
        observe_reset();

        if (urc.kind == UrcKind::LATE_PEER_HANDLE) {
            const int late = urc.int_param(0);
            if (late >= 0) {
                std::cerr << "[SOCKET] Late +UDCP reply, closing peer " << late << std::endl;
                orphan(late);
            }
            return;
        }
        if (urc.kind != UrcKind::PEER_DISCONNECTED) {
            return;
        }
        const int peer = urc.int_param(0);

        for (auto it = orphan_peers_.begin(); it != orphan_peers_.end(); ++it) {
            if (*it == peer) {
                orphan_peers_.erase(it);
                return;
            }
        }

        for (std::size_t index = 0; index < CAPACITY; ++index) {
            Slot& slot = slots_[index];
            if (slot.state == SocketState::CLOSED || slot.peer != peer) {
                continue;
            }
            if (slot.state == SocketState::OPENING) {
                slot.peer.reset();
                fail_open(index, Result<SocketId>::error(Status::CLOSED,
                    "SocketRegistry::open: peer disconnected"));
                return;
            }
            slot.remote_closed = true;
            slot.peer.reset();
            std::cout << "[SOCKET] " << id_of(index).to_string() << " closed by peer" << std::endl;
            return;
        }
    }

    void SocketRegistry::on_connect_event(const ConnectEvent& event) {
        observe_reset();

        if (find_by_channel(event.channel)) {
            // Replayed after ResendConnectEvents
            return;
        }

        auto remote = event.remote_ipv4();
        if (remote) {
            for (std::size_t index = 0; index < CAPACITY; ++index) {
                Slot& slot = slots_[index];
                if (slot.state == SocketState::OPENING && !slot.channel
                    && slot.protocol == event.protocol && slot.remote == *remote) {
                    slot.channel = event.channel;
                    try_promote(index);
                    return;
                }
            }
        }

        stats_.frames_stale++;
        std::cerr << "[SOCKET] Connect event for unknown channel " << static_cast<int>(event.channel)
                  << std::endl;
    }

    void SocketRegistry::on_disconnect_event(std::uint8_t channel) {
        observe_reset();

        Slot* slot = find_by_channel(channel);
        if (!slot) {
            stats_.frames_stale++;
            return;
        }
        slot->channel.reset();
        if (slot->state == SocketState::OPENING) {
            for (std::size_t index = 0; index < CAPACITY; ++index) {
                if (&slots_[index] == slot) {
                    fail_open(index, Result<SocketId>::error(Status::CLOSED,
                        "SocketRegistry::open: channel closed"));
                    return;
                }
            }
        }
        slot->remote_closed = true;
    }

    void SocketRegistry::on_data_event(std::uint8_t channel, span<const std::uint8_t> data) {
        observe_reset();

        Slot* slot = find_by_channel(channel);
        if (!slot) {
            stats_.frames_stale++;
            return;
        }
        std::size_t accepted = slot->rx.push(data);
        if (accepted < data.size()) {
            stats_.rx_overflow_bytes += data.size() - accepted;
            std::cerr << "[SOCKET] RX buffer full on channel " << static_cast<int>(channel)
                      << ", dropped " << (data.size() - accepted) << " byte(s)" << std::endl;
        }
    }

    void SocketRegistry::on_start_event() {
        observe_reset();
    }

    // === Lookup ===

    SocketRegistry::Slot* SocketRegistry::lookup(SocketId id) {
        if (id.slot >= CAPACITY) {
            return nullptr;
        }
        Slot& slot = slots_[id.slot];
        if (slot.state == SocketState::CLOSED || slot.generation != id.generation) {
            return nullptr;
        }
        return &slot;
    }

    const SocketRegistry::Slot* SocketRegistry::lookup(SocketId id) const {
        // Queries answer as if the reset had already been applied
        if (id.slot >= CAPACITY || resets_.pending()) {
            return nullptr;
        }
        const Slot& slot = slots_[id.slot];
        if (slot.state == SocketState::CLOSED || slot.generation != id.generation) {
            return nullptr;
        }
        return &slot;
    }

    SocketRegistry::Slot* SocketRegistry::find_by_channel(std::uint8_t channel) {
        for (auto& slot : slots_) {
            if (slot.state != SocketState::CLOSED && slot.channel == channel) {
                return &slot;
            }
        }
        return nullptr;
    }

    RetryPolicy SocketRegistry::command_policy() const {
        return RetryPolicy{static_cast<int>(config_.command_retries), config_.boot_backoff(), false};
    }

    RetryPolicy SocketRegistry::connect_policy() const {
        // A timed out AT+UDCP may still open a peer, a second one would open another
        RetryPolicy policy = command_policy();
        policy.retry_timeouts = false;
        return policy;
    }

    AtCommand SocketRegistry::with_timeout(AtCommand command, Millis timeout) const {
        if (command.timeout < timeout) {
            command.timeout = timeout;
        }
        return command;
    }

    // === Queries ===

    SocketState SocketRegistry::state(SocketId id) const {
        const Slot* slot = lookup(id);
        return slot ? slot->state : SocketState::CLOSED;
    }

    std::size_t SocketRegistry::free_slots() const {
        if (resets_.pending()) {
            return CAPACITY;
        }
        std::size_t free = 0;
        for (const auto& slot : slots_) {
            if (slot.state == SocketState::CLOSED) {
                ++free;
            }
        }
        return free;
    }

    std::size_t SocketRegistry::buffered(SocketId id) const {
        const Slot* slot = lookup(id);
        return slot ? slot->rx.size() : 0;
    }

    bool SocketRegistry::peer_closed(SocketId id) const {
        const Slot* slot = lookup(id);
        return slot && slot->remote_closed;
    }

    std::optional<std::uint8_t> SocketRegistry::channel_of(SocketId id) const {
        const Slot* slot = lookup(id);
        return slot ? slot->channel : std::nullopt;
    }

    std::optional<Endpoint> SocketRegistry::remote_of(SocketId id) const {
        const Slot* slot = lookup(id);
        if (!slot) {
            return std::nullopt;
        }
        return slot->remote;
    }

} // namespace ublox
