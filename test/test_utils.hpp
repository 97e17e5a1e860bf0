/**
 * @file test_utils.hpp
 * @brief Test utility functions for creating mocked components
 * @version 1.0
 * @date 2025-11-02
 *
 * Provides helpers to build XmodemSender instances over MockSerialPort,
 * record listener events and generate payloads, eliminating hardware
 * requirements in tests.
 */

#pragma once

#include "../include/pattern/xmodem_sender.hpp"
#include "../include/pattern/transfer_config.hpp"
#include "../include/pattern/transfer_listener.hpp"
#include "mocks/mock_serial_port.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace txmodem {
    namespace test {

        /**
         * @brief Holds the mock a PortFactory hands over to the sender
         */
        struct MockPortSlot {
            std::unique_ptr<MockSerialPort> pending;
            std::shared_ptr<PortProbe> probe;
            std::size_t open_calls = 0;

            /**
             * @brief Prepare a fresh mock and return it for scripting
             */
            MockSerialPort& prepare(const std::string& device_path = "/dev/mock") {
                pending = std::make_unique<MockSerialPort>(device_path);
                probe = pending->probe();
                return *pending;
            }
        };

        /**
         * @brief PortFactory returning the mock prepared in slot
         *
         * Throws DeviceException like RealSerialPort does for a missing
         * device when nothing was prepared.
         *
         * Example:
         * @code
         * auto slot = std::make_shared<MockPortSlot>();
         * slot->prepare().inject_response(Signal::CRC16);
         * XmodemSender sender(create_test_config(), mock_port_factory(slot));
         * @endcode
         */
        inline XmodemSender::PortFactory mock_port_factory(std::shared_ptr<MockPortSlot> slot) {
            return [slot](const TransferConfig& config) -> std::unique_ptr<ISerialPort> {
                       ++slot->open_calls;
                       if (!slot->pending) {
                           throw DeviceException(Status::DNOT_FOUND,
                               "mock_port_factory: " + config.device);
                       }
                       return std::move(slot->pending);
            };
        }

        /**
         * @brief Valid configuration with a short timeout and a mock device
         */
        inline TransferConfig create_test_config() {
            TransferConfig config = TransferConfig::create_default();
            config.device = "/dev/mock";
            config.timeout_ms = 50;
            return config;
        }

        /**
         * @brief Deterministic payload of the given size (0, 1, 2, ... wrapping)
         */
        inline std::vector<std::uint8_t> make_payload(std::size_t size, std::uint8_t seed = 0) {
            std::vector<std::uint8_t> data(size);
            for (std::size_t i = 0; i < size; ++i) {
                data[i] = static_cast<std::uint8_t>(seed + i);
            }
            return data;
        }

        /**
         * @brief Listener recording every event in order
         */
        class RecordingListener : public ITransferListener {
            public:
                struct BlockEvent {
                    std::size_t block_number;
                    std::size_t bytes_sent;
                    std::size_t bytes_total;
                };

                std::vector<std::string> events;
                std::vector<BlockEvent> blocks;
                int initializations = 0;
                int successes = 0;
                int failures = 0;

                void on_initialization() override {
                    ++initializations;
                    events.push_back("init");
                }

                void on_block_sent(std::size_t block_number, std::size_t bytes_sent,
                    std::size_t bytes_total) override {
                    blocks.push_back({ block_number, bytes_sent, bytes_total });
                    events.push_back("block");
                }

                void on_termination(bool success) override {
                    if (success) {
                        ++successes;
                    } else {
                        ++failures;
                    }
                    events.push_back(success ? "done" : "failed");
                }
        };

    } // namespace test
} // namespace txmodem
