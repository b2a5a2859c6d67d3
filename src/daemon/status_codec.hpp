#pragma once

#include <string>
#include <core/types.hpp>
#include <managers/channel_service.hpp>

// Status record exchanged over the control plane:
//
//   state = "Running"
//   active_channels = 1
//   total_channels = 2
//
// Encoded without a trailing newline; decoding accepts one.
// The Failed reason is not carried on the wire.
std::string encode_status(const ServiceSnapshot& snapshot);

Result<ServiceSnapshot> decode_status(const std::string& text);
