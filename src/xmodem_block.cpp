/**
 * @file xmodem_block.cpp
 * @brief XmodemBlock encoding and serialization
 * @version 0.1
 * @date 2025-11-02
 */

#include "../include/frame/xmodem_block.hpp"
#include "../include/exception/txmodem_exception.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace txmodem {

    XmodemBlock XmodemBlock::encode(std::uint8_t block_number,
        span<const std::uint8_t> payload,
        Mode mode,
        std::uint8_t pad) {
        if (payload.size() > BLOCK_SIZE) {
            throw CommunicationException(Status::WBAD_LENGTH,
                "XmodemBlock::encode: payload of " + std::to_string(payload.size()) +
                " bytes exceeds " + std::to_string(BLOCK_SIZE));
        }

        XmodemBlock block(block_number, mode);

        std::copy(payload.begin(), payload.end(), block.payload_.begin());
        std::fill(block.payload_.begin() + payload.size(), block.payload_.end(), pad);
        block.payload_length_ = payload.size();

        // Trailer always covers the padded payload
        block.trailer_ = ChecksumHelper::compute(
            span<const std::uint8_t>(block.payload_.data(), block.payload_.size()), mode);

        return block;
    }

    std::vector<std::uint8_t> XmodemBlock::serialize() const {
        std::vector<std::uint8_t> buffer(size(), 0x00);

        buffer[Layout::START] = to_byte(Signal::SOH);
        buffer[Layout::BLOCK_NUM] = block_number_;
        buffer[Layout::BLOCK_NUM_INV] = complement();

        std::copy(payload_.begin(), payload_.end(), buffer.begin() + Layout::PAYLOAD);

        if (mode_ == Mode::CRC16) {
            auto crc = ByteHelper::u16_to_bytes_be(trailer_);
            buffer[Layout::TRAILER] = crc[0];
            buffer[Layout::TRAILER + 1] = crc[1];
        } else {
            buffer[Layout::TRAILER] = static_cast<std::uint8_t>(trailer_ & 0xFF);
        }

        return buffer;
    }

    std::string XmodemBlock::to_string() const {
        std::ostringstream oss;
        oss << "XmodemBlock(";
        oss << "Block: " << static_cast<int>(block_number_) << ", ";
        oss << "Mode: " << mode_to_string(mode_) << ", ";
        oss << "Payload: " << payload_length_ << "/" << BLOCK_SIZE << ", ";
        oss << "Trailer: 0x" << std::hex << std::uppercase << std::setfill('0')
            << std::setw(mode_ == Mode::CRC16 ? 4 : 2) << trailer_;
        oss << ")";
        return oss.str();
    }

} // namespace txmodem
