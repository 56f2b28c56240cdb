/**
 * @file ublox.hpp
 * @brief Header file to facilitate the inclusion of the u-blox driver library
 * @version 1.0
 * @date 2025-11-18
 *
 * @copyright Copyright (c) 2025
 *
 */

#pragma once

// Build time capabilities
#include "features.hpp"
// Include the protocol enums and error vocabularies
#include "enums/protocol.hpp"
#include "enums/error.hpp"
#include "enums/net_error.hpp"
// Include exception hierarchy
#include "exception/ublox_exception.hpp"
// Include the result and completion templates
#include "template/result.hpp"
#include "template/pending.hpp"
#include "template/ring_buffer.hpp"
// Include the transport interfaces
#include "io/clock.hpp"
#include "io/serial_port.hpp"
#include "io/real_serial_port.hpp"
// Include the EDM wire layer
#include "frame/endpoint.hpp"
#include "frame/edm_frame.hpp"
#include "frame/edm_codec.hpp"
// Include the AT command layer
#include "at/at_command.hpp"
#include "at/commands.hpp"
#include "at/urc.hpp"
// Include the driver layers
#include "pattern/driver_config.hpp"
#include "pattern/driver_statistics.hpp"
#include "pattern/reset_broadcast.hpp"
#include "pattern/command_channel.hpp"
#include "pattern/command_sequence.hpp"
#include "pattern/device_state_machine.hpp"
#include "pattern/socket_registry.hpp"
#include "pattern/ublox_driver.hpp"
#include "pattern/network_adapter.hpp"
