/**
 * @file txmodem_send.cpp
 * @brief Send a file to a serial receiver with XMODEM / XMODEM-CRC
 * @version 0.1
 * @date 2025-11-02
 *
 * Exit code 0 when the receiver acknowledged the whole file, 1 on any
 * argument, configuration or communication error.
 */

#include "script_utils.hpp"
#include <memory>

using namespace txmodem;

int main(int argc, char* argv[]) {
    CliOptions options;
    try {
        options = parse_arguments(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[ERROR] " << e.what() << "\n\n";
        display_help(argv[0]);
        return 1;
    }

    if (options.show_help) {
        display_help(argv[0]);
        return 0;
    }

    if (options.list_ports) {
        auto ports = list_serial_ports();
        if (ports.empty()) {
            std::cout << "No serial ports found.\n";
        }
        for (const auto& port : ports) {
            std::cout << port << "\n";
        }
        return 0;
    }

    try {
        TransferConfig config = TransferConfig::load(options.config_file);
        apply_cli_overrides(config, options);
        std::cout << "[CONFIG] " << config.to_string() << std::endl;

        auto printer = std::make_shared<ProgressPrinter>(std::cout);
        XmodemSender sender(config, XmodemSender::PortFactory{}, printer);
        sender.send_file(options.file);

        std::cout << sender.statistics().to_string() << std::endl;
    } catch (const ConfigurationException& e) {
        std::cerr << "[ERROR] Configuration: " << e.what() << std::endl;
        return 1;
    } catch (const CommunicationException& e) {
        std::cerr << "[ERROR] Communication: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
