#pragma once

#include <cstdint>
#include <vector>

#include "netflow_v5_packet.hpp"

// Serializes packet to wire format. Header fields are written as is except count which always equals number of
// flows appended after header. Addresses which are not valid dotted-quad strings are encoded as 0.0.0.0
// Returns empty vector when packet carries more flows than count field can hold
std::vector<uint8_t> encode_netflow5_packet(const netflow5_packet_t& packet);
