/**
 * @file txmodem.hpp
 * @brief Header file to facilitate the inclusion of the txmodem library
 * @version 0.1
 * @date 2025-11-02
 */

#pragma once

// Include the protocol enums
#include "enums/protocol.hpp"
// Include exception hierarchy
#include "exception/txmodem_exception.hpp"
#include "template/result.hpp"
// Include the checksum helpers and block encoder
#include "interface/serialization_helpers.hpp"
#include "frame/xmodem_block.hpp"
// Include the channel and source abstractions
#include "io/serial_port.hpp"
#include "io/real_serial_port.hpp"
#include "io/byte_source.hpp"
// Include the transfer configuration
#include "pattern/transfer_config.hpp"
// Include the sender and its listeners
#include "pattern/transfer_listener.hpp"
#include "pattern/xmodem_sender.hpp"
