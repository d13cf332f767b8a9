#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Decoded Netflow v5 header in host byte order
class netflow5_packet_header_t {
    public:
    uint16_t version           = 0;
    uint16_t count             = 0;
    uint32_t sys_uptime        = 0;
    uint32_t unix_secs         = 0;
    uint32_t unix_nsecs        = 0;
    uint32_t flow_sequence     = 0;
    uint8_t engine_type        = 0;
    uint8_t engine_id          = 0;
    uint16_t sampling_interval = 0;

    // Export time in UTC, empty when unix_secs is zero
    std::optional<std::string> timestamp{};

    // Compares wire fields only, timestamp is derived from unix_secs
    bool operator==(const netflow5_packet_header_t& rhs) const {
        return version == rhs.version && count == rhs.count && sys_uptime == rhs.sys_uptime &&
               unix_secs == rhs.unix_secs && unix_nsecs == rhs.unix_nsecs && flow_sequence == rhs.flow_sequence &&
               engine_type == rhs.engine_type && engine_id == rhs.engine_id && sampling_interval == rhs.sampling_interval;
    }

    bool operator!=(const netflow5_packet_header_t& rhs) const {
        return !(*this == rhs);
    }

    std::string print() const;
};

// Single flow record with IPv4 addresses in dotted-quad form
class netflow5_flow_record_t {
    public:
    std::string srcaddr{ "0.0.0.0" };
    std::string dstaddr{ "0.0.0.0" };
    std::string nexthop{ "0.0.0.0" };
    uint16_t input_if  = 0;
    uint16_t output_if = 0;
    uint32_t packets   = 0;
    uint32_t bytes     = 0;
    uint32_t first     = 0;
    uint32_t last      = 0;
    uint16_t srcport   = 0;
    uint16_t dstport   = 0;
    uint8_t pad1       = 0;
    uint8_t tcp_flags  = 0;
    uint8_t protocol   = 0;
    uint8_t tos        = 0;
    uint16_t src_as    = 0;
    uint16_t dst_as    = 0;
    uint8_t src_mask   = 0;
    uint8_t dst_mask   = 0;
    uint16_t pad2      = 0;

    bool operator==(const netflow5_flow_record_t& rhs) const = default;

    std::string get_protocol_name() const;

    std::string print() const;
};

// One export datagram with information about its origin
class netflow5_packet_t {
    public:
    netflow5_packet_header_t header{};
    std::vector<netflow5_flow_record_t> flows{};

    // These fields are not carried on the wire
    std::string source_address{};
    uint16_t source_port   = 0;
    uint32_t packet_number = 0;

    std::string print() const;
};

// Human readable multi line report about packet and all its flows
std::string print_netflow5_packet(const netflow5_packet_t& packet);
