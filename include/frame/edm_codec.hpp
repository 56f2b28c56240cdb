/**
 * @file edm_codec.hpp
 * @brief Incremental EDM encoder/decoder
 * @version 1.0
 * @date 2025-11-18
 *
 * The decoder keeps partial frames across feed() calls, so the sequence of
 * frames produced never depends on how the byte stream was chunked. Corrupt
 * frames are dropped and decoding resynchronizes on the next start byte.
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <vector>

#include "edm_frame.hpp"

namespace ublox {

    class EdmCodec {
        public:
            /**
             * @brief Encode a frame (see EdmFrame::serialize)
             */
            static Result<std::vector<std::uint8_t> > encode(const EdmFrame& frame);

            /**
             * @brief Encode channel data as one or more DataCommand frames
             *
             * Data is split into EGRESS_CHUNK_SIZE pieces, each a complete frame.
             */
            static std::vector<std::vector<std::uint8_t> > encode_data(std::uint8_t channel,
                span<const std::uint8_t> data, std::size_t chunk_size = EGRESS_CHUNK_SIZE);
    };

    /**
     * @brief Counters of locally recovered decoding problems
     */
    struct DecoderCounters {
        std::uint64_t frames = 0;          ///< Frames produced
        std::uint64_t corrupt = 0;         ///< Frames dropped for bad length/stop byte
        std::uint64_t unknown = 0;         ///< Frames dropped for unknown payload id
        std::uint64_t stray_bytes = 0;     ///< Bytes seen outside any frame
        std::uint64_t text_lines = 0;      ///< Stray text lines surfaced as AT events
    };

    class EdmDecoder {
        public:
            /**
             * @param max_text_line Longest stray text line kept before it is discarded
             */
            explicit EdmDecoder(std::size_t max_text_line = 256);

            /**
             * @brief Append received bytes to the decode buffer
             */
            void feed(span<const std::uint8_t> bytes);

            /**
             * @brief Next complete frame, or nullopt until more bytes arrive
             *
             * Text lines received outside frames (a module that restarted prints
             * "+STARTUP" unframed) come out as AT_EVENT frames without channel.
             */
            std::optional<EdmFrame> next();

            /**
             * @brief Decode everything currently buffered
             */
            std::vector<EdmFrame> drain();

            /**
             * @brief Drop buffered bytes and partial text
             */
            void reset();

            std::size_t buffered() const { return buffer_.size(); }

            const DecoderCounters& counters() const { return counters_; }

        private:
            std::deque<std::uint8_t> buffer_;
            std::string text_line_;
            std::size_t max_text_line_;
            DecoderCounters counters_;

            /// Consume one byte that is not part of a frame
            std::optional<EdmFrame> consume_stray_byte();

            void drop_start_byte(const char* reason);
    };

} // namespace ublox
