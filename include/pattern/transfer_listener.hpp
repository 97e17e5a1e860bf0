/**
 * @file transfer_listener.hpp
 * @brief Observer interface for XMODEM transfer progress
 * @version 0.1
 * @date 2025-11-02
 */

#pragma once

#include <cstddef>
#include <functional>
#include <utility>

namespace txmodem {

    /**
     * @brief Receives the events of a transfer, synchronously and in order
     *
     * For a successful transfer the sequence is:
     * on_initialization(), on_block_sent() once per acknowledged block,
     * on_termination(true). A transfer aborted by a CommunicationException
     * ends with on_termination(false).
     */
    class ITransferListener {
        public:
            virtual ~ITransferListener() = default;

            /**
             * @brief Handshake completed and mode selected
             */
            virtual void on_initialization() = 0;

            /**
             * @brief A block has been acknowledged by the receiver
             * @param block_number 1-based sequence index (not wrapped)
             * @param bytes_sent Source bytes delivered so far, padding excluded
             * @param bytes_total Size of the source
             */
            virtual void on_block_sent(std::size_t block_number, std::size_t bytes_sent,
                std::size_t bytes_total) = 0;

            /**
             * @brief Transfer finished
             * @param success true after the EOT was acknowledged
             */
            virtual void on_termination(bool success) = 0;
    };

    /**
     * @brief Listener that ignores every event
     */
    class NullTransferListener : public ITransferListener {
        public:
            void on_initialization() override {}
            void on_block_sent(std::size_t, std::size_t, std::size_t) override {}
            void on_termination(bool) override {}
    };

    /**
     * @brief Listener forwarding events to std::function callbacks
     *
     * Unset callbacks are skipped.
     */
    class CallbackTransferListener : public ITransferListener {
        public:
            using InitCallback = std::function<void()>;
            using BlockCallback = std::function<void(std::size_t, std::size_t, std::size_t)>;
            using TerminationCallback = std::function<void(bool)>;

            CallbackTransferListener() = default;

            CallbackTransferListener(InitCallback on_init, BlockCallback on_block,
                TerminationCallback on_term)
                : on_init_(std::move(on_init)), on_block_(std::move(on_block)),
                on_term_(std::move(on_term)) {}

            void set_initialization_callback(InitCallback callback) {
                on_init_ = std::move(callback);
            }

            void set_block_callback(BlockCallback callback) {
                on_block_ = std::move(callback);
            }

            void set_termination_callback(TerminationCallback callback) {
                on_term_ = std::move(callback);
            }

            void on_initialization() override {
                if (on_init_) on_init_();
            }

            void on_block_sent(std::size_t block_number, std::size_t bytes_sent,
                std::size_t bytes_total) override {
                if (on_block_) on_block_(block_number, bytes_sent, bytes_total);
            }

            void on_termination(bool success) override {
                if (on_term_) on_term_(success);
            }

        private:
            InitCallback on_init_;
            BlockCallback on_block_;
            TerminationCallback on_term_;
    };

} // namespace txmodem
