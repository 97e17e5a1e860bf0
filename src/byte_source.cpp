/**
 * @file byte_source.cpp
 * @brief File and buffer byte sources
 * @version 0.1
 * @date 2025-11-02
 */

#include "../include/io/byte_source.hpp"
#include "../include/exception/txmodem_exception.hpp"

#include <algorithm>
#include <cstring>

namespace txmodem {

    // === FileSource ===

    FileSource::FileSource(const std::string& path)
        : path_(path) {
        if (path_.empty()) {
            throw ConfigurationException(Status::CNO_FILE, "FileSource: no filename specified");
        }

        stream_.open(path_, std::ios::in | std::ios::binary);
        if (!stream_.is_open()) {
            throw ConfigurationException(Status::CNO_FILE,
                "FileSource: unable to access input filename '" + path_ + "'");
        }

        stream_.seekg(0, std::ios::end);
        std::streamoff end = stream_.tellg();
        stream_.seekg(0, std::ios::beg);
        if (end < 0 || !stream_) {
            throw ConfigurationException(Status::CNO_FILE,
                "FileSource: unable to determine size of '" + path_ + "'");
        }
        size_ = static_cast<std::size_t>(end);
    }

    std::size_t FileSource::read_chunk(std::uint8_t* buffer, std::size_t max_len) {
        if (stream_.eof()) {
            return 0;
        }

        stream_.read(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(max_len));
        std::streamsize got = stream_.gcount();

        // Short read is only legitimate at end of file
        if (stream_.bad() || (stream_.fail() && !stream_.eof())) {
            throw CommunicationException(Status::XIO_ERROR,
                "FileSource::read_chunk: read error on '" + path_ + "'");
        }

        return static_cast<std::size_t>(got);
    }

    // === BufferSource ===

    std::size_t BufferSource::read_chunk(std::uint8_t* buffer, std::size_t max_len) {
        std::size_t remaining = data_.size() - position_;
        std::size_t count = std::min(remaining, max_len);
        if (count > 0) {
            std::memcpy(buffer, data_.data() + position_, count);
            position_ += count;
        }
        return count;
    }

} // namespace txmodem
