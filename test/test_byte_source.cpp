/**
 * @file test_byte_source.cpp
 * @brief Unit tests for file and buffer byte sources
 * @version 1.0
 * @date 2025-11-02
 */

#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <fstream>
#include <vector>

#include "../include/io/byte_source.hpp"
#include "../include/exception/txmodem_exception.hpp"

using namespace txmodem;

namespace {

    std::vector<std::uint8_t> drain(IByteSource& source, std::size_t chunk,
        std::vector<std::size_t>* sizes = nullptr) {
        std::vector<std::uint8_t> out;
        std::vector<std::uint8_t> buffer(chunk);
        for (;;) {
            std::size_t n = source.read_chunk(buffer.data(), buffer.size());
            if (n == 0) {
                break;
            }
            if (sizes != nullptr) {
                sizes->push_back(n);
            }
            out.insert(out.end(), buffer.begin(), buffer.begin() + n);
        }
        return out;
    }

} // namespace

TEST_CASE("BufferSource - Reads in chunks until exhausted", "[source]") {
    std::vector<std::uint8_t> data(300);
    for (std::size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<std::uint8_t>(i * 7);
    }
    BufferSource source(data);

    REQUIRE(source.size() == 300);

    std::vector<std::size_t> sizes;
    auto out = drain(source, 128, &sizes);

    REQUIRE(out == data);
    REQUIRE(sizes == std::vector<std::size_t>{ 128, 128, 44 });
    std::uint8_t byte = 0;
    REQUIRE(source.read_chunk(&byte, 1) == 0);
}

TEST_CASE("BufferSource - Empty buffer", "[source]") {
    BufferSource source(std::vector<std::uint8_t>{});
    std::uint8_t buffer[16];

    REQUIRE(source.size() == 0);
    REQUIRE(source.read_chunk(buffer, sizeof(buffer)) == 0);
}

TEST_CASE("FileSource - Streams file content", "[source][file]") {
    const std::string test_file = "/tmp/test_txmodem_source.bin";

    SECTION("Size not a multiple of the chunk") {
        std::vector<std::uint8_t> data(200, 0xA5);
        data[0] = 0x00;
        data[199] = 0x1A;
        {
            std::ofstream out(test_file, std::ios::binary);
            out.write(reinterpret_cast<const char*>(data.data()),
                static_cast<std::streamsize>(data.size()));
        }

        FileSource source(test_file);
        REQUIRE(source.size() == 200);
        REQUIRE(source.path() == test_file);

        std::vector<std::size_t> sizes;
        REQUIRE(drain(source, 128, &sizes) == data);
        REQUIRE(sizes == std::vector<std::size_t>{ 128, 72 });
    }

    SECTION("Exact multiple of the chunk") {
        std::vector<std::uint8_t> data(256, 0x3C);
        {
            std::ofstream out(test_file, std::ios::binary);
            out.write(reinterpret_cast<const char*>(data.data()),
                static_cast<std::streamsize>(data.size()));
        }

        FileSource source(test_file);
        std::vector<std::size_t> sizes;
        REQUIRE(drain(source, 128, &sizes) == data);
        REQUIRE(sizes == std::vector<std::size_t>{ 128, 128 });
    }

    SECTION("Empty file") {
        { std::ofstream out(test_file, std::ios::binary); }

        FileSource source(test_file);
        REQUIRE(source.size() == 0);
        REQUIRE(drain(source, 128).empty());
    }

    std::remove(test_file.c_str());
}

TEST_CASE("FileSource - Unreadable input is a configuration error", "[source][file]") {
    SECTION("Missing file") {
        try {
            FileSource source("/tmp/txmodem_does_not_exist.bin");
            FAIL("Expected ConfigurationException");
        } catch (const ConfigurationException& e) {
            REQUIRE(e.status() == Status::CNO_FILE);
            REQUIRE(std::string(e.what()).find("txmodem_does_not_exist.bin") !=
                std::string::npos);
        }
    }

    SECTION("Empty path") {
        REQUIRE_THROWS_AS(FileSource(""), ConfigurationException);
    }
}
