/**
 * @file xmodem_block.hpp
 * @brief XMODEM data block (132/133 bytes)
 * @version 0.1
 * @date 2025-11-02
 *
 * State-first design:
 * - Block number, mode and the padded payload are stored as state
 * - Serialization on demand via serialize()
 * - Trailer (checksum or CRC) computed during encoding
 */

#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

#include "../enums/protocol.hpp"
#include "../interface/serialization_helpers.hpp"

namespace txmodem {

    /**
     * @brief Byte offsets of an XMODEM block
     */
    struct XmodemBlockLayout {
        static constexpr std::size_t START = 0;
        static constexpr std::size_t BLOCK_NUM = 1;
        static constexpr std::size_t BLOCK_NUM_INV = 2;
        static constexpr std::size_t PAYLOAD = 3;
        static constexpr std::size_t TRAILER = PAYLOAD + BLOCK_SIZE;   // 131

        static constexpr std::size_t HEADER_SIZE = PAYLOAD;
        static constexpr std::size_t CHECKSUM_FRAME_SIZE = TRAILER + 1;  // 132
        static constexpr std::size_t CRC_FRAME_SIZE = TRAILER + 2;       // 133
    };

    /**
     * @brief One XMODEM block
     *
     * Block structure:
     * ```
     * [SOH][BLK][~BLK][PAYLOAD(128)][CHECKSUM]          checksum mode, 132 bytes
     * [SOH][BLK][~BLK][PAYLOAD(128)][CRC_HI][CRC_LO]    CRC mode, 133 bytes
     *   0    1    2      3-130          131   (132)
     * ```
     *
     * A payload shorter than 128 bytes is padded with PAD_BYTE. The padding
     * only exists on the wire; payload_length() reports the source bytes.
     */
    class XmodemBlock {
        private:
            using Layout = XmodemBlockLayout;

            std::uint8_t block_number_ = 1;
            Mode mode_ = Mode::CHECKSUM;
            std::array<std::uint8_t, BLOCK_SIZE> payload_{};
            std::size_t payload_length_ = 0;
            std::uint16_t trailer_ = 0;

            XmodemBlock(std::uint8_t block_number, Mode mode)
                : block_number_(block_number), mode_(mode) {}

        public:
            /**
             * @brief Build a block from raw source bytes
             * @param block_number Wire block number (see block_number_for())
             * @param payload Up to 128 source bytes
             * @param mode Integrity check to append
             * @param pad Filler used for a short payload
             * @return XmodemBlock Encoded block
             * @throws CommunicationException (WBAD_LENGTH) if payload exceeds 128 bytes
             */
            static XmodemBlock encode(std::uint8_t block_number,
                span<const std::uint8_t> payload,
                Mode mode,
                std::uint8_t pad = PAD_BYTE);

            /**
             * @brief Map a 1-based block sequence index to its wire number
             *
             * Numbering is modulo 256: 1, 2, ..., 255, 0, 1, ...
             */
            static constexpr std::uint8_t block_number_for(std::size_t sequence) {
                return static_cast<std::uint8_t>(sequence & 0xFF);
            }

            // === State Access ===

            std::uint8_t block_number() const { return block_number_; }

            std::uint8_t complement() const {
                return static_cast<std::uint8_t>(0xFF - block_number_);
            }

            Mode mode() const { return mode_; }

            const std::array<std::uint8_t, BLOCK_SIZE>& payload() const { return payload_; }

            std::size_t payload_length() const { return payload_length_; }

            bool is_padded() const { return payload_length_ < BLOCK_SIZE; }

            /**
             * @brief Checksum (low byte) or CRC of the padded payload
             */
            std::uint16_t trailer() const { return trailer_; }

            std::size_t trailer_size() const { return txmodem::trailer_size(mode_); }

            /**
             * @brief Serialized size
             * @return std::size_t 132 (checksum) or 133 (CRC)
             */
            std::size_t size() const { return Layout::HEADER_SIZE + BLOCK_SIZE + trailer_size(); }

            // === Serialization ===

            /**
             * @brief Serialize block state to the wire format
             * @return std::vector<std::uint8_t> 132 or 133 bytes
             */
            std::vector<std::uint8_t> serialize() const;

            std::string to_string() const;
    };

} // namespace txmodem
