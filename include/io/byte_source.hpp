/**
 * @file byte_source.hpp
 * @brief Finite byte sources streamed by the XMODEM sender
 * @version 0.1
 * @date 2025-11-02
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

namespace txmodem {

    /**
     * @brief Sequence of bytes consumed front to back in block-sized chunks
     *
     * The sender never seeks or re-reads: each call to read_chunk() returns
     * the next bytes of the source.
     */
    class IByteSource {
        public:
            virtual ~IByteSource() = default;

            /**
             * @brief Read the next bytes of the source
             * @param buffer Destination buffer
             * @param max_len Capacity of buffer
             * @return std::size_t Bytes copied; less than max_len only at the
             * end of the source, 0 once exhausted
             * @throws CommunicationException (XIO_ERROR) on a read failure
             */
            virtual std::size_t read_chunk(std::uint8_t* buffer, std::size_t max_len) = 0;

            /**
             * @brief Total number of bytes in the source
             */
            virtual std::size_t size() const = 0;
    };

    /**
     * @brief Byte source backed by a file opened in binary mode
     */
    class FileSource : public IByteSource {
        private:
            std::string path_;
            std::ifstream stream_;
            std::size_t size_ = 0;

        public:
            /**
             * @brief Open a file for streaming
             * @param path Path of the file to send
             * @throws ConfigurationException (CNO_FILE) if the file cannot be opened
             */
            explicit FileSource(const std::string& path);

            std::size_t read_chunk(std::uint8_t* buffer, std::size_t max_len) override;
            std::size_t size() const override { return size_; }

            const std::string& path() const { return path_; }
    };

    /**
     * @brief Byte source over an in-memory buffer
     */
    class BufferSource : public IByteSource {
        private:
            std::vector<std::uint8_t> data_;
            std::size_t position_ = 0;

        public:
            explicit BufferSource(std::vector<std::uint8_t> data)
                : data_(std::move(data)) {}

            std::size_t read_chunk(std::uint8_t* buffer, std::size_t max_len) override;
            std::size_t size() const override { return data_.size(); }
    };

} // namespace txmodem
