/**
 * @file script_utils.hpp
 * @brief Command-line parsing and progress output for txmodem_send
 * @version 0.1
 * @date 2025-11-02
 */

#pragma once

#include "../include/txmodem.hpp"
#include <string>
#include <iostream>
#include <iomanip>
#include <optional>
#include <stdexcept>
#include <getopt.h>

namespace txmodem {

// === Common Utility Functions ===

/**
 * @brief Parse hex or decimal integer from string
 * @param value_str String representation of integer (supports 0x prefix for hex)
 * @return std::uint32_t Parsed integer value
 * @throws std::invalid_argument if string is not a valid integer
 */
    inline std::uint32_t parse_uint32(const std::string& value_str) {
        if (value_str.empty() || value_str[0] == '-') {
            throw std::invalid_argument("Invalid integer format: " + value_str);
        }

        unsigned long value;
        std::size_t pos = 0;

        try {
            // Check if hex format (0x prefix)
            if (value_str.size() >= 2 && value_str[0] == '0' &&
                (value_str[1] == 'x' || value_str[1] == 'X')) {
                value = std::stoul(value_str, &pos, 16);
            } else {
                value = std::stoul(value_str, &pos, 10);
            }
        } catch (const std::out_of_range&) {
            throw std::invalid_argument("Integer out of range: " + value_str);
        }

        if (pos != value_str.size() || value > 0xFFFFFFFFul) {
            throw std::invalid_argument("Invalid integer format: " + value_str);
        }

        return static_cast<std::uint32_t>(value);
    }

// === Command-Line Argument Parsing ===

/**
 * @brief Options given on the command line
 *
 * Unset optionals leave the value from the configuration file, the
 * environment or the defaults untouched.
 */
    struct CliOptions {
        bool show_help = false;
        bool list_ports = false;
        std::optional<std::string> device;
        std::optional<SerialBaud> baud_rate;
        std::optional<std::uint32_t> timeout_s;
        std::optional<std::string> config_file;
        std::string file;
    };

/**
 * @brief Display help message for script usage
 * @param program_name The name of the program (argv[0])
 */
    inline void display_help(const std::string& program_name) {
        std::cout << "Usage: " << program_name << " [OPTIONS]\n\n";
        std::cout << "Options:\n";
        std::cout << "  -?, -h, --help          Display this help message\n";
        std::cout << "  -l, --list              List available serial ports\n";
        std::cout << "  -p, --port <device>     Serial device path (e.g. /dev/ttyUSB0)\n";
        std::cout << "  -b, --baud <baudrate>   Serial baudrate (default: 115200)\n";
        std::cout << "                          Supported: 1200, 2400, 4800, 9600, 19200, 38400,\n";
        std::cout << "                                     57600, 115200, 230400, 460800, 921600\n";
        std::cout << "  -t, --timeout <s>       Response timeout in seconds (default: 10)\n";
        std::cout << "  -f, --file <path>       File to send\n";
        std::cout << "  -c, --config <path>     JSON configuration file\n";
        std::cout << "\n";
        std::cout << "Sends a file over a serial line with XMODEM or XMODEM-CRC, as requested\n";
        std::cout << "by the receiver. Settings are taken from, in increasing priority: defaults,\n";
        std::cout << "the JSON file, TXMODEM_* environment variables, command-line options.\n";
        std::cout << "\n";
        std::cout << "Examples:\n";
        std::cout << "  # Send firmware.bin at 115200 baud:\n";
        std::cout << "  " << program_name << " -p /dev/ttyUSB0 -f firmware.bin\n\n";
        std::cout << "  # Slow link with a longer timeout:\n";
        std::cout << "  " << program_name << " -p /dev/ttyS0 -b 9600 -t 30 -f image.hex\n";
    }

/**
 * @brief Parse command-line arguments
 * @param argc Argument count
 * @param argv Argument values
 * @return CliOptions Parsed options
 * @throws std::invalid_argument if arguments are invalid
 */
    inline CliOptions parse_arguments(int argc, char* argv[]) {
        static const struct option long_options[] = {
            { "help",    no_argument,       nullptr, 'h' },
            { "list",    no_argument,       nullptr, 'l' },
            { "port",    required_argument, nullptr, 'p' },
            { "baud",    required_argument, nullptr, 'b' },
            { "timeout", required_argument, nullptr, 't' },
            { "file",    required_argument, nullptr, 'f' },
            { "config",  required_argument, nullptr, 'c' },
            { nullptr,   0,                 nullptr, 0 }
        };

        CliOptions options;
        int opt;
        bool baud_not_found = false;

        // Full rescan, parse_arguments may be called more than once
        optind = 0;
        opterr = 0;

        while ((opt = getopt_long(argc, argv, ":hlp:b:t:f:c:", long_options, nullptr)) != -1) {
            switch (opt) {
            case 'h':
                options.show_help = true;
                break;

            case 'l':
                options.list_ports = true;
                break;

            case 'p':
                options.device = std::string(optarg);
                break;

            case 'b':
                try {
                    options.baud_rate = serialbaud_from_int(
                        static_cast<int>(parse_uint32(optarg)), baud_not_found);
                    if (baud_not_found) {
                        throw std::invalid_argument("Unsupported serial baudrate: " +
                            std::string(optarg));
                    }
                } catch (const std::invalid_argument&) {
                    std::cerr << "Invalid serial baudrate: " << optarg << "\n";
                    throw;
                }
                break;

            case 't':
                try {
                    options.timeout_s = parse_uint32(optarg);
                    if (*options.timeout_s == 0 ||
                        *options.timeout_s > MAX_TIMEOUT_MS / 1000) {
                        throw std::invalid_argument("Timeout out of range: " +
                            std::string(optarg));
                    }
                } catch (const std::invalid_argument&) {
                    std::cerr << "Invalid timeout: " << optarg << "\n";
                    std::cerr << "Use a positive number of seconds (max " <<
                        MAX_TIMEOUT_MS / 1000 << ")\n";
                    throw;
                }
                break;

            case 'f':
                options.file = optarg;
                break;

            case 'c':
                options.config_file = std::string(optarg);
                break;

            case ':':
                throw std::invalid_argument("Missing value for option " +
                    std::string(argv[optind - 1]));

            case '?':
                // -? is accepted as help, anything else is unknown
                if (optopt == '?') {
                    options.show_help = true;
                    break;
                }
                if (optopt != 0) {
                    throw std::invalid_argument("Unknown option -" +
                        std::string(1, static_cast<char>(optopt)));
                }
                throw std::invalid_argument("Unknown option " + std::string(argv[optind - 1]));

            default:
                throw std::invalid_argument("Unhandled option");
            }
        }

        if (optind < argc) {
            throw std::invalid_argument("Unexpected argument: " + std::string(argv[optind]));
        }

        return options;
    }

/**
 * @brief Overlay command-line options on a loaded configuration
 */
    inline void apply_cli_overrides(TransferConfig& config, const CliOptions& options) {
        if (options.device) {
            config.device = *options.device;
        }
        if (options.baud_rate) {
            config.baud_rate = *options.baud_rate;
        }
        if (options.timeout_s) {
            config.timeout_ms = *options.timeout_s * 1000;
        }
    }

// === Progress Output ===

/**
 * @brief Listener printing transfer progress on a stream
 */
    class ProgressPrinter : public ITransferListener {
        public:
            explicit ProgressPrinter(std::ostream& out) : out_(out) {}

            void on_initialization() override {
                out_ << "[XMODEM] Receiver ready, sending..." << std::endl;
            }

            void on_block_sent(std::size_t block_number, std::size_t bytes_sent,
                std::size_t bytes_total) override {
                unsigned percent = bytes_total == 0 ? 100u :
                    static_cast<unsigned>((bytes_sent * 100) / bytes_total);
                out_ << "\r[XMODEM] Block " << std::setw(6) << block_number << "  "
                     << bytes_sent << "/" << bytes_total << " bytes ("
                     << std::setw(3) << percent << "%)" << std::flush;
                progress_shown_ = true;
            }

            void on_termination(bool success) override {
                if (progress_shown_) {
                    out_ << "\n";
                }
                out_ << (success ? "[XMODEM] Transfer completed" : "[XMODEM] Transfer aborted")
                     << std::endl;
            }

        private:
            std::ostream& out_;
            bool progress_shown_ = false;
    };

} // namespace txmodem
