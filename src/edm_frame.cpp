/**
 * @file edm_frame.cpp
 * @brief EDM frame serialization and connect event decoding
 * @version 1.0
 * @date 2025-11-18
 *
 * @copyright Copyright (c) 2025
 *
 */

#include <algorithm>
#include <cctype>
#include <sstream>

#include "../include/frame/edm_frame.hpp"

namespace ublox {

    // === Endpoint ===

    std::optional<Endpoint> Endpoint::parse(const std::string& ip, std::uint16_t port) {
        Endpoint ep;
        ep.port = port;

        std::vector<std::string> parts;
        std::istringstream iss(ip);
        std::string part;
        while (std::getline(iss, part, '.')) {
            parts.push_back(part);
        }
        if (parts.size() != 4 || ip.empty() || ip.back() == '.') {
            return std::nullopt;
        }

        for (std::size_t i = 0; i < 4; ++i) {
            const auto& octet = parts[i];
            if (octet.empty() || octet.size() > 3 ||
                !std::all_of(octet.begin(), octet.end(),
                [](unsigned char c) { return std::isdigit(c) != 0; })) {
                return std::nullopt;
            }
            int value = std::stoi(octet);
            if (value > 255) {
                return std::nullopt;
            }
            ep.address[i] = static_cast<std::uint8_t>(value);
        }
        return ep;
    }

    std::string Endpoint::address_string() const {
        std::ostringstream oss;
        oss << static_cast<int>(address[0]) << '.' << static_cast<int>(address[1]) << '.'
            << static_cast<int>(address[2]) << '.' << static_cast<int>(address[3]);
        return oss.str();
    }

    std::string Endpoint::to_string() const {
        return address_string() + ":" + std::to_string(port);
    }

    // === EdmFrame Factories ===

    EdmFrame EdmFrame::at_request(const std::string& command_text) {
        EdmFrame frame;
        frame.type = PayloadType::AT_REQUEST;
        frame.payload.assign(command_text.begin(), command_text.end());
        return frame;
    }

    EdmFrame EdmFrame::data_command(std::uint8_t channel, span<const std::uint8_t> data) {
        EdmFrame frame;
        frame.type = PayloadType::DATA_COMMAND;
        frame.channel = channel;
        frame.payload.assign(data.begin(), data.end());
        return frame;
    }

    EdmFrame EdmFrame::resend_connect_events() {
        EdmFrame frame;
        frame.type = PayloadType::RESEND_CONNECT_EVENTS;
        return frame;
    }

    std::string EdmFrame::text() const {
        return std::string(payload.begin(), payload.end());
    }

    std::size_t EdmFrame::wire_length() const {
        return PAYLOAD_ID_SIZE + (channel ? 1 : 0) + payload.size();
    }

    // === Serialization ===

    Result<std::vector<std::uint8_t> > EdmFrame::serialize() const {
        using R = Result<std::vector<std::uint8_t> >;

        if (type == PayloadType::UNKNOWN) {
            return R::error(Status::WBAD_PAYLOAD_ID, "EdmFrame::serialize");
        }
        if (carries_channel(type) != channel.has_value()) {
            return R::error(Status::WBAD_PAYLOAD, "EdmFrame::serialize: channel byte mismatch");
        }

        std::size_t length = wire_length();
        if (length > MAX_EDM_LENGTH) {
            return R::error(Status::WBAD_LENGTH, "EdmFrame::serialize: payload too long");
        }

        std::vector<std::uint8_t> buffer;
        buffer.reserve(EdmLayout::frame_size(length));

        auto len_bytes = int_to_bytes_be<std::uint16_t>(static_cast<std::uint16_t>(length));
        buffer.push_back(to_byte(Constants::START_BYTE));
        buffer.push_back(len_bytes[0] & EDM_SIZE_FILTER);
        buffer.push_back(len_bytes[1]);
        buffer.push_back(to_byte(Constants::PAYLOAD_ID_HIGH));
        buffer.push_back(to_byte(type));
        if (channel) {
            buffer.push_back(*channel);
        }
        buffer.insert(buffer.end(), payload.begin(), payload.end());
        buffer.push_back(to_byte(Constants::END_BYTE));

        return R::success(std::move(buffer));
    }

    Result<EdmFrame> EdmFrame::deserialize(span<const std::uint8_t> buffer) {
        using R = Result<EdmFrame>;

        if (buffer.size() < EdmLayout::frame_size(PAYLOAD_ID_SIZE)) {
            return R::error(Status::WBAD_LENGTH, "EDM frame requires at least 6 bytes");
        }
        if (buffer[EdmLayout::START] != to_byte(Constants::START_BYTE)) {
            return R::error(Status::WBAD_START, "Invalid START byte");
        }
        if ((buffer[EdmLayout::LEN_HI] & ~EDM_SIZE_FILTER) != 0) {
            return R::error(Status::WBAD_LENGTH, "Reserved length bits set");
        }

        std::size_t length = bytes_to_int_be<std::uint16_t>(
            buffer.subspan(EdmLayout::LEN_HI, 2)) & EDM_FULL_SIZE_FILTER;
        if (length < PAYLOAD_ID_SIZE || buffer.size() != EdmLayout::frame_size(length)) {
            return R::error(Status::WBAD_LENGTH, "Buffer size doesn't match LENGTH field");
        }
        if (buffer[buffer.size() - 1] != to_byte(Constants::END_BYTE)) {
            return R::error(Status::WBAD_END, "Invalid END byte");
        }
        if (buffer[EdmLayout::ID_HI] != to_byte(Constants::PAYLOAD_ID_HIGH)) {
            return R::error(Status::WBAD_PAYLOAD_ID, "Invalid PAYLOAD_ID high byte");
        }

        EdmFrame frame;
        frame.type = payload_type_from_byte(buffer[EdmLayout::ID_LO]);
        if (frame.type == PayloadType::UNKNOWN) {
            return R::error(Status::WBAD_PAYLOAD_ID, "Unknown payload id");
        }

        auto body = buffer.subspan(EdmLayout::PAYLOAD, length - PAYLOAD_ID_SIZE);
        if (carries_channel(frame.type)) {
            if (body.empty()) {
                return R::error(Status::WBAD_PAYLOAD, "Missing channel byte");
            }
            frame.channel = body[0];
            body = body.subspan(1);
        }
        frame.payload.assign(body.begin(), body.end());

        return R::success(std::move(frame));
    }

    // === Connect Event ===

    Result<ConnectEvent> ConnectEvent::parse(const EdmFrame& frame) {
        using R = Result<ConnectEvent>;

        if (frame.type != PayloadType::CONNECT_EVENT || !frame.channel) {
            return R::error(Status::WBAD_PAYLOAD_ID, "ConnectEvent::parse: not a connect event");
        }
        const auto& p = frame.payload;
        if (p.empty()) {
            return R::error(Status::WBAD_PAYLOAD, "ConnectEvent::parse: empty payload");
        }

        ConnectEvent ev;
        ev.channel = *frame.channel;
        ev.type = from_byte<ConnectionType>(p[0]);
        span<const std::uint8_t> bytes(p.data(), p.size());

        switch (ev.type) {
        case ConnectionType::IPV4:
        case ConnectionType::IPV6: {
            std::size_t addr_len = ev.type == ConnectionType::IPV4 ? 4 : 16;
            // type + protocol + 2 * (address + port)
            if (p.size() != 2 + 2 * (addr_len + 2)) {
                return R::error(Status::WBAD_PAYLOAD, "ConnectEvent::parse: bad IP payload size");
            }
            if (p[1] > to_byte(SocketProtocol::UDP)) {
                return R::error(Status::WBAD_PAYLOAD, "ConnectEvent::parse: unknown protocol");
            }
            ev.protocol = from_byte<SocketProtocol>(p[1]);
            std::size_t pos = 2;
            ev.remote_address.assign(p.begin() + pos, p.begin() + pos + addr_len);
            pos += addr_len;
            ev.remote_port = bytes_to_int_be<std::uint16_t>(bytes.subspan(pos, 2));
            pos += 2;
            ev.local_address.assign(p.begin() + pos, p.begin() + pos + addr_len);
            pos += addr_len;
            ev.local_port = bytes_to_int_be<std::uint16_t>(bytes.subspan(pos, 2));
            break;
        }
        case ConnectionType::BLUETOOTH:
            // type + profile + bd_addr(6) + frame size(2)
            if (p.size() != 10) {
                return R::error(Status::WBAD_PAYLOAD,
                    "ConnectEvent::parse: bad Bluetooth payload size");
            }
            ev.bluetooth_profile = p[1];
            ev.remote_address.assign(p.begin() + 2, p.begin() + 8);
            ev.frame_size = bytes_to_int_be<std::uint16_t>(bytes.subspan(8, 2));
            break;
        default:
            return R::error(Status::WBAD_PAYLOAD, "ConnectEvent::parse: unknown connection type");
        }

        return R::success(std::move(ev));
    }

    std::optional<Endpoint> ConnectEvent::remote_ipv4() const {
        if (type != ConnectionType::IPV4 || remote_address.size() != 4) {
            return std::nullopt;
        }
        Endpoint ep;
        std::copy(remote_address.begin(), remote_address.end(), ep.address.begin());
        ep.port = remote_port;
        return ep;
    }

    EdmFrame ConnectEvent::to_frame() const {
        EdmFrame frame;
        frame.type = PayloadType::CONNECT_EVENT;
        frame.channel = channel;
        frame.payload.push_back(to_byte(type));
        if (type == ConnectionType::BLUETOOTH) {
            frame.payload.push_back(bluetooth_profile);
            frame.payload.insert(frame.payload.end(), remote_address.begin(), remote_address.end());
            auto fs = int_to_bytes_be<std::uint16_t>(frame_size);
            frame.payload.insert(frame.payload.end(), fs.begin(), fs.end());
            return frame;
        }
        frame.payload.push_back(to_byte(protocol));
        frame.payload.insert(frame.payload.end(), remote_address.begin(), remote_address.end());
        auto rp = int_to_bytes_be<std::uint16_t>(remote_port);
        frame.payload.insert(frame.payload.end(), rp.begin(), rp.end());
        frame.payload.insert(frame.payload.end(), local_address.begin(), local_address.end());
        auto lp = int_to_bytes_be<std::uint16_t>(local_port);
        frame.payload.insert(frame.payload.end(), lp.begin(), lp.end());
        return frame;
    }

} // namespace ublox
