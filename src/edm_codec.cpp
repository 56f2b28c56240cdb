/**
 * @file edm_codec.cpp
 * @brief Incremental EDM encoder/decoder implementation
 * @version 1.0
 * @date 2025-11-18
 *
 * @copyright Copyright (c) 2025
 *
 */

#include <algorithm>
#include <iostream>

#include "../include/frame/edm_codec.hpp"

namespace ublox {

    // === Encoder ===

    Result<std::vector<std::uint8_t> > EdmCodec::encode(const EdmFrame& frame) {
        return frame.serialize();
    }

    std::vector<std::vector<std::uint8_t> > EdmCodec::encode_data(std::uint8_t channel,
        span<const std::uint8_t> data, std::size_t chunk_size) {
        std::vector<std::vector<std::uint8_t> > frames;
        chunk_size = std::max<std::size_t>(1, std::min(chunk_size, MAX_EDM_PAYLOAD - 1));

        for (std::size_t offset = 0; offset < data.size(); offset += chunk_size) {
            std::size_t count = std::min(chunk_size, data.size() - offset);
            auto encoded = EdmFrame::data_command(channel, data.subspan(offset, count)).serialize();
            // Chunk size is clamped below the length limit, serialize cannot fail here
            frames.push_back(std::move(encoded.value()));
        }
        return frames;
    }

    // === Decoder ===

    EdmDecoder::EdmDecoder(std::size_t max_text_line)
        : max_text_line_(max_text_line) {
    }

    void EdmDecoder::feed(span<const std::uint8_t> bytes) {
        buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
    }

    void EdmDecoder::reset() {
        buffer_.clear();
        text_line_.clear();
    }

    std::vector<EdmFrame> EdmDecoder::drain() {
        std::vector<EdmFrame> frames;
        while (auto frame = next()) {
            frames.push_back(std::move(*frame));
        }
        return frames;
    }

    std::optional<EdmFrame> EdmDecoder::next() {
        const std::uint8_t start = to_byte(Constants::START_BYTE);

        while (!buffer_.empty()) {
            // Bytes before a start marker are plain text from the module
            if (buffer_.front() != start) {
                if (auto line = consume_stray_byte()) {
                    return line;
                }
                continue;
            }

            // Need start + 2 length bytes + payload id high byte to judge the header
            if (buffer_.size() < EdmLayout::ID_LO) {
                return std::nullopt;
            }
            std::uint8_t len_hi = buffer_[EdmLayout::LEN_HI];
            if ((len_hi & ~EDM_SIZE_FILTER) != 0) {
                drop_start_byte("reserved length bits set");
                continue;
            }
            std::size_t length = (static_cast<std::size_t>(len_hi & EDM_SIZE_FILTER) << 8) |
                buffer_[EdmLayout::LEN_LO];
            if (length < PAYLOAD_ID_SIZE) {
                drop_start_byte("length shorter than payload id");
                continue;
            }
            if (buffer_[EdmLayout::ID_HI] != to_byte(Constants::PAYLOAD_ID_HIGH)) {
                drop_start_byte("bad payload id high byte");
                continue;
            }

            std::size_t total = EdmLayout::frame_size(length);
            if (buffer_.size() < total) {
                return std::nullopt;  // Partial frame, wait for more bytes
            }
            if (buffer_[total - 1] != to_byte(Constants::END_BYTE)) {
                drop_start_byte("stop byte mismatch");
                continue;
            }

            std::vector<std::uint8_t> raw(buffer_.begin(), buffer_.begin() + total);
            buffer_.erase(buffer_.begin(), buffer_.begin() + total);

            auto decoded = EdmFrame::deserialize(span<const std::uint8_t>(raw.data(), raw.size()));
            if (decoded.fail()) {
                if (decoded.error() == Status::WBAD_PAYLOAD_ID) {
                    ++counters_.unknown;
                    std::cerr << "[EDM] Dropping frame with unknown payload id 0x" << std::hex <<
                        static_cast<int>(raw[EdmLayout::ID_LO]) << std::dec << std::endl;
                } else {
                    ++counters_.corrupt;
                    std::cerr << "[EDM] Dropping frame: " << decoded.describe() << std::endl;
                }
                continue;
            }
            if (decoded.value().type == PayloadType::IPHONE_EVENT) {
                ++counters_.unknown;
                continue;
            }

            ++counters_.frames;
            return std::move(decoded.value());
        }
        return std::nullopt;
    }

    // === Private Helpers ===

    std::optional<EdmFrame> EdmDecoder::consume_stray_byte() {
        std::uint8_t byte = buffer_.front();
        buffer_.pop_front();
        ++counters_.stray_bytes;

        if (byte == '\n') {
            std::string line;
            line.swap(text_line_);
            if (line.empty()) {
                return std::nullopt;
            }
            ++counters_.text_lines;
            EdmFrame frame;
            frame.type = PayloadType::AT_EVENT;
            line += "\r\n";
            frame.payload.assign(line.begin(), line.end());
            return frame;
        }
        if (byte == '\r') {
            return std::nullopt;
        }
        if (byte < 0x20 || byte > 0x7E || text_line_.size() >= max_text_line_) {
            // Binary garbage, not a text line
            text_line_.clear();
            return std::nullopt;
        }
        text_line_.push_back(static_cast<char>(byte));
        return std::nullopt;
    }

    void EdmDecoder::drop_start_byte(const char* reason) {
        ++counters_.corrupt;
        std::cerr << "[EDM] Corrupt frame (" << reason << "), resynchronizing" << std::endl;
        buffer_.pop_front();
        text_line_.clear();
    }

} // namespace ublox
