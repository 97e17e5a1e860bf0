/**
 * @file serialization_helpers.hpp
 * @brief Pure static helper classes for block serialization
 * @version 0.1
 * @date 2025-11-02
 *
 * - ChecksumHelper: 8-bit arithmetic checksum and CRC-16/XMODEM
 * - ByteHelper: big-endian integer packing for block trailers
 *
 * These are pure static classes (no state) that work on raw byte buffers.
 */

#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <numeric>
#include "../enums/protocol.hpp"

namespace txmodem {

    /**
     * @brief Static helper for XMODEM integrity checks
     *
     * Pure static class with no state. Both algorithms are computed over the
     * full (padded) 128-byte payload of a block.
     */
    class ChecksumHelper {
        public:
            static constexpr std::uint16_t CRC16_POLYNOMIAL = 0x1021;
            static constexpr std::uint16_t CRC16_INIT = 0x0000;

            /**
             * @brief 8-bit arithmetic checksum
             *
             * Sums all bytes and keeps the lower 8 bits (no carry, no polynomial).
             *
             * @param data Payload bytes
             * @return std::uint8_t The computed checksum (sum & 0xFF)
             *
             * @example
             * @code
             * std::array<std::uint8_t, 128> payload{};
             * payload.fill(0xFF);
             * auto sum = ChecksumHelper::checksum8(payload);   // 0x80
             * @endcode
             */
            static std::uint8_t checksum8(span<const std::uint8_t> data) {
                std::uint32_t sum = std::accumulate(
                    data.begin(),
                    data.end(),
                    std::uint32_t(0),
                    [](std::uint32_t acc, std::uint8_t b) {
                        return acc + b;
                    }
                );

                return static_cast<std::uint8_t>(sum & 0xFF);
            }

            /**
             * @brief CRC-16/XMODEM
             *
             * Polynomial 0x1021, initial value 0x0000, no input or output
             * reflection, no final XOR. Bitwise MSB-first implementation.
             *
             * @param data Payload bytes
             * @return std::uint16_t The CRC, sent MSB first on the wire
             *
             * @example
             * @code
             * const std::uint8_t check[] = {'1','2','3','4','5','6','7','8','9'};
             * auto crc = ChecksumHelper::crc16_xmodem(span<const std::uint8_t>(check, 9)); // 0x31C3
             * @endcode
             */
            static std::uint16_t crc16_xmodem(span<const std::uint8_t> data) {
                std::uint16_t crc = CRC16_INIT;
                for (std::uint8_t byte : data) {
                    crc ^= static_cast<std::uint16_t>(byte) << 8;
                    for (int bit = 0; bit < 8; ++bit) {
                        if (crc & 0x8000) {
                            crc = static_cast<std::uint16_t>((crc << 1) ^ CRC16_POLYNOMIAL);
                        } else {
                            crc = static_cast<std::uint16_t>(crc << 1);
                        }
                    }
                }
                return crc;
            }

            /**
             * @brief Compute the trailer for a payload in the given mode
             * @param data Payload bytes
             * @param mode CHECKSUM (1 byte) or CRC16 (2 bytes)
             * @return std::uint16_t Checksum in the low byte, or the full CRC
             */
            static std::uint16_t compute(span<const std::uint8_t> data, Mode mode) {
                if (mode == Mode::CRC16) {
                    return crc16_xmodem(data);
                }
                return checksum8(data);
            }
    };

    /**
     * @brief Static helper for multi-byte field packing
     */
    class ByteHelper {
        public:
            /**
             * @brief Split a 16-bit value into big-endian bytes
             * @param value The value to split
             * @return std::array<std::uint8_t, 2> {MSB, LSB}
             */
            static constexpr std::array<std::uint8_t, 2> u16_to_bytes_be(std::uint16_t value) {
                return {
                    static_cast<std::uint8_t>((value >> 8) & 0xFF),
                    static_cast<std::uint8_t>(value & 0xFF)
                };
            }

            /**
             * @brief Join two big-endian bytes into a 16-bit value
             */
            static constexpr std::uint16_t bytes_be_to_u16(std::uint8_t msb, std::uint8_t lsb) {
                return static_cast<std::uint16_t>((static_cast<std::uint16_t>(msb) << 8) | lsb);
            }
    };

}  // namespace txmodem
