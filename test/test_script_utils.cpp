/**
 * @file test_script_utils.cpp
 * @brief Unit tests for txmodem_send argument parsing and progress output
 * @version 1.0
 * @date 2025-11-02
 */

#include <catch2/catch_test_macros.hpp>
#include <sstream>
#include <string>
#include <vector>

#include "../scripts/script_utils.hpp"

using namespace txmodem;

namespace {

    /**
     * @brief Owns argv storage for getopt
     */
    struct Args {
        std::vector<std::string> storage;
        std::vector<char*> argv;

        Args(std::initializer_list<std::string> args) : storage(args) {
            for (auto& arg : storage) {
                argv.push_back(&arg[0]);
            }
            argv.push_back(nullptr);
        }

        int argc() const { return static_cast<int>(storage.size()); }
    };

    CliOptions parse(std::initializer_list<std::string> args) {
        Args a(args);
        return parse_arguments(a.argc(), a.argv.data());
    }

} // namespace

TEST_CASE("parse_uint32 - Decimal and hex", "[cli]") {
    REQUIRE(parse_uint32("115200") == 115200);
    REQUIRE(parse_uint32("0x10") == 16);
    REQUIRE_THROWS_AS(parse_uint32("12a"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_uint32("-1"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_uint32(""), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_uint32("99999999999999999999999"), std::invalid_argument);
}

TEST_CASE("parse_arguments - Transfer options", "[cli]") {
    SECTION("Short options") {
        auto options = parse({ "txmodem_send", "-p", "/dev/ttyUSB0", "-b", "9600", "-t", "3",
                               "-f", "firmware.bin" });

        REQUIRE(options.device == std::optional<std::string>("/dev/ttyUSB0"));
        REQUIRE(options.baud_rate == std::optional<SerialBaud>(SerialBaud::BAUD_9600));
        REQUIRE(options.timeout_s == std::optional<std::uint32_t>(3));
        REQUIRE(options.file == "firmware.bin");
        REQUIRE_FALSE(options.show_help);
        REQUIRE_FALSE(options.list_ports);
        REQUIRE_FALSE(options.config_file.has_value());
    }

    SECTION("Long options") {
        auto options = parse({ "txmodem_send", "--port", "/dev/ttyACM0", "--file", "a.bin",
                               "--config", "txmodem.json", "--timeout=20" });

        REQUIRE(*options.device == "/dev/ttyACM0");
        REQUIRE(options.file == "a.bin");
        REQUIRE(*options.config_file == "txmodem.json");
        REQUIRE(*options.timeout_s == 20);
        REQUIRE_FALSE(options.baud_rate.has_value());
    }
}

TEST_CASE("parse_arguments - Help and list", "[cli]") {
    REQUIRE(parse({ "txmodem_send", "-?" }).show_help);
    REQUIRE(parse({ "txmodem_send", "-h" }).show_help);
    REQUIRE(parse({ "txmodem_send", "--help" }).show_help);
    REQUIRE(parse({ "txmodem_send", "-l" }).list_ports);
    REQUIRE(parse({ "txmodem_send", "--list" }).list_ports);
}

TEST_CASE("parse_arguments - Invalid arguments", "[cli]") {
    REQUIRE_THROWS_AS(parse({ "txmodem_send", "-b", "12345" }), std::invalid_argument);
    REQUIRE_THROWS_AS(parse({ "txmodem_send", "-b", "fast" }), std::invalid_argument);
    REQUIRE_THROWS_AS(parse({ "txmodem_send", "-t", "0" }), std::invalid_argument);
    REQUIRE_THROWS_AS(parse({ "txmodem_send", "-x" }), std::invalid_argument);
    REQUIRE_THROWS_AS(parse({ "txmodem_send", "-p" }), std::invalid_argument);
    REQUIRE_THROWS_AS(parse({ "txmodem_send", "-f", "a.bin", "extra" }), std::invalid_argument);
}

TEST_CASE("apply_cli_overrides - Command line wins", "[cli]") {
    TransferConfig config = TransferConfig::create_default();
    config.device = "/dev/from_config";

    SECTION("Given options replace configured values") {
        auto options = parse({ "txmodem_send", "-p", "/dev/ttyS0", "-b", "57600", "-t", "2" });
        apply_cli_overrides(config, options);

        REQUIRE(config.device == "/dev/ttyS0");
        REQUIRE(config.baud_rate == SerialBaud::BAUD_57600);
        REQUIRE(config.timeout_ms == 2000);
    }

    SECTION("Absent options keep configured values") {
        auto options = parse({ "txmodem_send", "-f", "a.bin" });
        apply_cli_overrides(config, options);

        REQUIRE(config.device == "/dev/from_config");
        REQUIRE(config.baud_rate == DEFAULT_SERIAL_BAUD);
        REQUIRE(config.timeout_ms == DEFAULT_TIMEOUT_MS);
    }
}

TEST_CASE("ProgressPrinter - Output", "[cli][listener]") {
    std::ostringstream out;
    ProgressPrinter printer(out);

    printer.on_initialization();
    printer.on_block_sent(1, 128, 256);
    printer.on_block_sent(2, 256, 256);
    printer.on_termination(true);

    std::string text = out.str();
    REQUIRE(text.find("sending") != std::string::npos);
    REQUIRE(text.find("128/256 bytes ( 50%)") != std::string::npos);
    REQUIRE(text.find("256/256 bytes (100%)") != std::string::npos);
    REQUIRE(text.find("Transfer completed") != std::string::npos);
}
