#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "netflow_v5_packet.hpp"

enum class netflow5_decode_error_t {
    none,
    // Buffer cannot fit header
    too_short,
    // Buffer ends in the middle of field
    field_read_error,
    // Record selected for decoding has less than 48 bytes
    truncated_record,
};

std::string get_netflow5_decode_error_as_string(netflow5_decode_error_t error);

// Decodes single Netflow v5 datagram. It does not trust number of flows from header and decodes only records
// which fully fit into buffer. Packet is updated only when function returns true
bool decode_netflow5_packet(const uint8_t* data,
                            size_t data_length,
                            const std::string& source_address,
                            uint16_t source_port,
                            uint32_t packet_number,
                            netflow5_packet_t& packet,
                            netflow5_decode_error_t& error);
