// Netflow v5 wire format definitions
// https://www.cisco.com/c/en/us/td/docs/net_mgmt/netflow_collection_engine/3-6/user/guide/format.html

#pragma once

#include <cstddef>
#include <cstdint>

#include "../fast_endianless.hpp"

const uint16_t netflow5_protocol_version = 5;

// Default UDP port for Netflow export
const uint16_t netflow5_default_port = 2055;

// Netflow v5 header
class __attribute__((__packed__)) netflow5_header_t {
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

    void network_to_host_byte_order() {
        version           = fast_ntoh(version);
        count             = fast_ntoh(count);
        sys_uptime        = fast_ntoh(sys_uptime);
        unix_secs         = fast_ntoh(unix_secs);
        unix_nsecs        = fast_ntoh(unix_nsecs);
        flow_sequence     = fast_ntoh(flow_sequence);
        sampling_interval = fast_ntoh(sampling_interval);
    }

    void host_byte_order_to_network_byte_order() {
        version           = fast_hton(version);
        count             = fast_hton(count);
        sys_uptime        = fast_hton(sys_uptime);
        unix_secs         = fast_hton(unix_secs);
        unix_nsecs        = fast_hton(unix_nsecs);
        flow_sequence     = fast_hton(flow_sequence);
        sampling_interval = fast_hton(sampling_interval);
    }
};

// We are using this class for encoding and decoding messages from the wire
// Please do not add new fields here
class __attribute__((__packed__)) netflow5_flow_t {
    public:
    // Source IP
    uint32_t srcaddr = 0;

    // Destination IP
    uint32_t dstaddr = 0;

    // IPv4 next hop
    uint32_t nexthop = 0;

    // Input interface
    uint16_t input_if = 0;

    // Output interface
    uint16_t output_if = 0;

    // Number of packets in flow
    uint32_t packets = 0;

    // Number of bytes / octets in flow
    uint32_t bytes = 0;

    // Flow start time in milliseconds of uptime
    uint32_t first = 0;

    // Flow end time in milliseconds of uptime
    uint32_t last = 0;

    uint16_t srcport = 0;
    uint16_t dstport = 0;

    uint8_t pad1      = 0;
    uint8_t tcp_flags = 0;
    uint8_t protocol  = 0;
    uint8_t tos       = 0;

    uint16_t src_as = 0;
    uint16_t dst_as = 0;

    // Mask lengths
    uint8_t src_mask = 0;
    uint8_t dst_mask = 0;

    // Trailing padding is two bytes to keep record at 48 bytes
    uint16_t pad2 = 0;

    void network_to_host_byte_order() {
        srcaddr   = fast_ntoh(srcaddr);
        dstaddr   = fast_ntoh(dstaddr);
        nexthop   = fast_ntoh(nexthop);
        input_if  = fast_ntoh(input_if);
        output_if = fast_ntoh(output_if);
        packets   = fast_ntoh(packets);
        bytes     = fast_ntoh(bytes);
        first     = fast_ntoh(first);
        last      = fast_ntoh(last);
        srcport   = fast_ntoh(srcport);
        dstport   = fast_ntoh(dstport);
        src_as    = fast_ntoh(src_as);
        dst_as    = fast_ntoh(dst_as);
        pad2      = fast_ntoh(pad2);
    }

    void host_byte_order_to_network_byte_order() {
        srcaddr   = fast_hton(srcaddr);
        dstaddr   = fast_hton(dstaddr);
        nexthop   = fast_hton(nexthop);
        input_if  = fast_hton(input_if);
        output_if = fast_hton(output_if);
        packets   = fast_hton(packets);
        bytes     = fast_hton(bytes);
        first     = fast_hton(first);
        last      = fast_hton(last);
        srcport   = fast_hton(srcport);
        dstport   = fast_hton(dstport);
        src_as    = fast_hton(src_as);
        dst_as    = fast_hton(dst_as);
        pad2      = fast_hton(pad2);
    }
};

const size_t netflow5_header_size      = sizeof(netflow5_header_t);
const size_t netflow5_flow_record_size = sizeof(netflow5_flow_t);

static_assert(sizeof(netflow5_header_t) == 24, "Bad size for netflow5_header_t");
static_assert(sizeof(netflow5_flow_t) == 48, "Bad size for netflow5_flow_t");

#define NETFLOW5_PACKET_SIZE(nflows) (netflow5_header_size + ((nflows) * netflow5_flow_record_size))
