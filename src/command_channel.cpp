/**
 * @file command_channel.cpp
 * @brief Single-slot AT command dispatcher implementation
 * @version 1.0
 * @date 2025-11-18
 *
 * @copyright Copyright (c) 2025
 */

#include <algorithm>
#include <iostream>

#include "../include/pattern/command_channel.hpp"

namespace ublox {

    namespace {

        std::vector<std::string> split_lines(const std::string& text) {
            std::vector<std::string> lines;
            std::string current;
            for (char c : text) {
                if (c == '\n') {
                    std::string line = trim(current);
                    if (!line.empty()) {
                        lines.push_back(std::move(line));
                    }
                    current.clear();
                } else if (c != '\r') {
                    current.push_back(c);
                }
            }
            std::string tail = trim(current);
            if (!tail.empty()) {
                lines.push_back(std::move(tail));
            }
            return lines;
        }

        bool is_error_line(const std::string& line) {
            return line == "ERROR"
                   || line.compare(0, 10, "+CME ERROR") == 0
                   || line.compare(0, 10, "+CMS ERROR") == 0;
        }

        std::uint64_t delta(std::uint64_t now, std::uint64_t& seen) {
            std::uint64_t d = now >= seen ? now - seen : 0;
            seen = now;
            return d;
        }

    } // namespace

    // === Constructor ===

    CommandChannel::CommandChannel(ISerialPort& port, IClock& clock, const ResetBroadcast& resets,
        DriverStatistics& stats, bool trace, std::size_t urc_queue_capacity)
        : port_(port)
        , clock_(clock)
        , resets_(resets)
        , stats_(stats)
        , trace_(trace)
        , urc_queue_capacity_(std::max<std::size_t>(1, urc_queue_capacity)) {}

    // === Command Slot ===

    Result<Pending<AtResponse> > CommandChannel::submit(const AtCommand& command) {
        using R = Result<Pending<AtResponse> >;
        observe_reset();

        if (pending_) {
            return R::error(Status::BUSY, "CommandChannel::submit(" + command.text + ")");
        }

        std::vector<std::uint8_t> bytes;
        if (framing_ == Framing::TEXT) {
            std::string wire = command.wire();
            bytes.assign(wire.begin(), wire.end());
        } else {
            auto encoded = EdmCodec::encode(EdmFrame::at_request(command.wire()));
            if (!encoded) {
                return R::error(encoded, "CommandChannel::submit");
            }
            bytes = std::move(encoded.value());
        }

        auto written = write_all(bytes, "AT");
        if (!written) {
            return R::error(written, "CommandChannel::submit(" + command.text + ")");
        }

        stats_.commands_sent++;
        if (framing_ == Framing::EDM) {
            stats_.frames_tx++;
        }

        Pending<AtResponse> marker;
        pending_ = PendingCommand{command, clock_.now(), AtResponse{}, marker};
        return R::success(marker);
    }

    std::string CommandChannel::pending_text() const {
        return pending_ ? pending_->command.text : std::string();
    }

    void CommandChannel::abort_pending(Status reason, const std::string& context) {
        if (pending_) {
            complete(Result<AtResponse>::error(reason, context));
        }
    }

    void CommandChannel::complete(Result<AtResponse> outcome) {
        // Free the slot before resolving so a follow-up submit is accepted
        Pending<AtResponse> marker = pending_->marker;
        pending_.reset();
        marker.resolve(std::move(outcome));
    }

    void CommandChannel::check_timeout() {
        if (!pending_) {
            return;
        }
        if (clock_.now() - pending_->issued_at < pending_->command.timeout) {
            return;
        }
        stats_.command_timeouts++;
        std::cerr << "[CHANNEL] Timeout waiting for response to "
                  << pending_->command.text << std::endl;
        complete(Result<AtResponse>::error(Status::TIMEOUT,
            "CommandChannel::poll(" + pending_->command.text + ")"));
    }

    // === Data Path ===

    Result<void> CommandChannel::write_data(std::uint8_t channel, span<const std::uint8_t> data) {
        if (framing_ != Framing::EDM) {
            return Result<void>::error(Status::NOT_READY, "CommandChannel::write_data");
        }
        for (const auto& frame : EdmCodec::encode_data(channel, data)) {
            auto written = write_all(frame, "DATA");
            if (!written) {
                return Result<void>::error(written, "CommandChannel::write_data");
            }
            stats_.frames_tx++;
        }
        return Result<void>::success();
    }

    Result<void> CommandChannel::resend_connect_events() {
        if (framing_ != Framing::EDM) {
            return Result<void>::error(Status::NOT_READY, "CommandChannel::resend_connect_events");
        }
        auto encoded = EdmCodec::encode(EdmFrame::resend_connect_events());
        if (!encoded) {
            return Result<void>::error(encoded, "CommandChannel::resend_connect_events");
        }
        auto written = write_all(encoded.value(), "RESEND");
        if (!written) {
            return Result<void>::error(written, "CommandChannel::resend_connect_events");
        }
        stats_.frames_tx++;
        return Result<void>::success();
    }

    Result<void> CommandChannel::write_all(const std::vector<std::uint8_t>& bytes, const char* what) {
        if (trace_) {
            std::cout << "[CHANNEL] TX " << what << ": " << to_hex(span<const std::uint8_t>(bytes))
                      << std::endl;
        }

        std::size_t offset = 0;
        int stalls = 0;
        while (offset < bytes.size()) {
            ssize_t n = port_.write(bytes.data() + offset, bytes.size() - offset);
            if (n < 0) {
                stats_.serial_errors++;
                std::cerr << "[CHANNEL] Serial write failed on " << port_.get_device_path()
                          << std::endl;
                return Result<void>::error(Status::DWRITE_ERROR, "CommandChannel::write_all");
            }
            if (n == 0) {
                if (++stalls > MAX_WRITE_STALLS) {
                    stats_.serial_errors++;
                    return Result<void>::error(Status::DWRITE_ERROR, "CommandChannel::write_all");
                }
                clock_.sleep_for(Millis(1));
                continue;
            }
            stalls = 0;
            offset += static_cast<std::size_t>(n);
            stats_.bytes_tx += static_cast<std::uint64_t>(n);
        }
        return Result<void>::success();
    }

    // === Inbound ===

    void CommandChannel::poll() {
        observe_reset();

        std::uint8_t buffer[READ_CHUNK];
        // Bounded so a chatty module cannot starve the rest of the poll loop
        for (int round = 0; round < 16; ++round) {
            ssize_t n = port_.read(buffer, sizeof(buffer));
            if (n < 0) {
                stats_.serial_errors++;
                std::cerr << "[CHANNEL] Serial read failed on " << port_.get_device_path()
                          << std::endl;
                break;
            }
            if (n == 0) {
                break;
            }
            stats_.bytes_rx += static_cast<std::uint64_t>(n);
            process_inbound(span<const std::uint8_t>(buffer, static_cast<std::size_t>(n)));
        }

        check_timeout();
    }

    void CommandChannel::process_inbound(span<const std::uint8_t> bytes) {
        if (trace_ && !bytes.empty()) {
            std::cout << "[CHANNEL] RX: " << to_hex(bytes) << std::endl;
        }

        std::size_t i = 0;
        while (i < bytes.size()) {
            if (framing_ == Framing::EDM) {
                decoder_.feed(bytes.subspan(i));
                drain_decoder();
                return;
            }

            const char c = static_cast<char>(bytes[i++]);
            if (c == '\n') {
                std::string line = trim(text_line_);
                text_line_.clear();
                if (!line.empty()) {
                    handle_line(line);
                    observe_reset();
                }
            } else if (c != '\r') {
                if (text_line_.size() >= MAX_LINE_LENGTH) {
                    std::cerr << "[CHANNEL] Text line overflow, discarding" << std::endl;
                    stats_.lines_unmatched++;
                    text_line_.clear();
                }
                text_line_.push_back(c);
            }
        }
    }

    void CommandChannel::drain_decoder() {
        while (framing_ == Framing::EDM) {
            auto frame = decoder_.next();
            if (!frame) {
                break;
            }
            handle_frame(*frame);
            if (observe_reset()) {
                break;
            }
        }

        const DecoderCounters& counters = decoder_.counters();
        stats_.frames_corrupt += delta(counters.corrupt, decoder_seen_.corrupt);
        stats_.frames_unknown += delta(counters.unknown, decoder_seen_.unknown);
    }

    bool CommandChannel::observe_reset() {
        if (!resets_.observe()) {
            return false;
        }
        abort_pending(Status::FATAL, "CommandChannel::reset");
        framing_ = Framing::TEXT;
        decoder_.reset();
        text_line_.clear();
        return true;
    }

    // === Dispatch ===

    void CommandChannel::handle_line(const std::string& line) {
        // Branch 1: grammar of the pending command
        if (pending_) {
            if (line == "OK") {
                AtResponse response = std::move(pending_->response);
                if (pending_->command.switches_to_edm) {
                    set_framing(Framing::EDM);
                }
                complete(Result<AtResponse>::success(std::move(response)));
                return;
            }
            if (is_error_line(line)) {
                std::cerr << "[CHANNEL] " << pending_->command.text << " failed: " << line
                          << std::endl;
                complete(Result<AtResponse>::error(Status::PROTOCOL,
                    pending_->command.text + ": " + line));
                return;
            }
            if (line == pending_->command.text) {
                return;  // echo
            }
            if (pending_->command.expects(line)) {
                pending_->response.lines.push_back(line);
                return;
            }
        }

        // Branch 2: URC catalog
        if (auto urc = Urc::parse(line)) {
            dispatch_urc(*urc);
            return;
        }

        stats_.lines_unmatched++;
        std::cerr << "[CHANNEL] Unmatched line: " << line << std::endl;
    }

    void CommandChannel::handle_frame(const EdmFrame& frame) {
        stats_.frames_rx++;

        switch (frame.type) {
        case PayloadType::AT_CONFIRMATION:
            for (const auto& line : split_lines(frame.text())) {
                handle_line(line);
            }
            break;

        case PayloadType::AT_EVENT:
            for (const auto& line : split_lines(frame.text())) {
                if (auto urc = Urc::parse(line)) {
                    dispatch_urc(*urc);
                } else {
                    stats_.lines_unmatched++;
                    std::cerr << "[CHANNEL] Unmatched event: " << line << std::endl;
                }
            }
            break;

        case PayloadType::START_EVENT:
            for (auto* sink : sinks_) {
                sink->on_start_event();
            }
            break;

        case PayloadType::CONNECT_EVENT: {
            auto event = ConnectEvent::parse(frame);
            if (!event) {
                stats_.frames_corrupt++;
                std::cerr << "[CHANNEL] Bad connect event: " << event.describe() << std::endl;
                break;
            }
            for (auto* sink : sinks_) {
                sink->on_connect_event(event.value());
            }
            break;
        }

        case PayloadType::DISCONNECT_EVENT:
            for (auto* sink : sinks_) {
                sink->on_disconnect_event(frame.channel.value_or(0));
            }
            break;

        case PayloadType::DATA_EVENT:
            for (auto* sink : sinks_) {
                sink->on_data_event(frame.channel.value_or(0),
                    span<const std::uint8_t>(frame.payload.data(), frame.payload.size()));
            }
            break;

        default:
            // Host-direction or unsupported payloads
            stats_.frames_unknown++;
            break;
        }
    }

    void CommandChannel::dispatch_urc(const Urc& urc) {
        stats_.urcs_rx++;
        if (trace_) {
            std::cout << "[CHANNEL] URC " << urc_kind_to_string(urc.kind) << ": " << urc.line
                      << std::endl;
        }

        for (auto* listener : listeners_) {
            listener->on_urc(urc);
        }

        subscriptions_.erase(std::remove_if(subscriptions_.begin(), subscriptions_.end(),
            [](const std::weak_ptr<UrcSubscription::Queue>& q) { return q.expired(); }),
            subscriptions_.end());

        for (auto& weak : subscriptions_) {
            auto queue = weak.lock();
            if (!queue) {
                continue;
            }
            queue->items.push_back(urc);
            if (queue->items.size() > queue->capacity) {
                queue->items.pop_front();
                queue->dropped++;
                stats_.urcs_dropped++;
            }
        }
    }

    // === Routing ===

    void CommandChannel::add_urc_listener(IUrcListener* listener) {
        if (listener) {
            listeners_.push_back(listener);
        }
    }

    void CommandChannel::add_event_sink(IEdmEventSink* sink) {
        if (sink) {
            sinks_.push_back(sink);
        }
    }

    UrcSubscription CommandChannel::subscribe_urc() {
        auto queue = std::make_shared<UrcSubscription::Queue>();
        queue->capacity = urc_queue_capacity_;
        subscriptions_.push_back(queue);
        return UrcSubscription(queue);
    }

    void CommandChannel::set_framing(Framing framing) {
        if (framing == framing_) {
            return;
        }
        framing_ = framing;
        decoder_.reset();
        text_line_.clear();
        std::cout << "[CHANNEL] Framing -> " << framing_to_string(framing_) << std::endl;
    }

} // namespace ublox
