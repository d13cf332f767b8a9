#include "netflow_v5_generator.hpp"

#include <vector>

#include "../fast_library.hpp"
#include "../iana_ip_protocols.hpp"

#include "netflow_v5.hpp"

// TCP SYN and ACK bits
const uint8_t synthetic_flow_tcp_flags = 0x12;

const uint16_t synthetic_flow_src_as = 65001;
const uint16_t synthetic_flow_dst_as = 65002;

const std::vector<uint16_t> synthetic_flow_destination_ports = { 80, 443, 22, 25, 53, 8080 };

const std::vector<ip_protocol_t> synthetic_flow_protocols = { ip_protocol_t::TCP, ip_protocol_t::UDP, ip_protocol_t::ICMP };

netflow5_random_source_t::netflow5_random_source_t() {
    std::random_device random_device;
    gen_.seed(random_device());
}

netflow5_random_source_t::netflow5_random_source_t(uint64_t seed_value) : gen_(seed_value) {
}

void netflow5_random_source_t::seed(uint64_t seed_value) {
    gen_.seed(seed_value);
}

uint32_t netflow5_random_source_t::randint(uint32_t min, uint32_t max) {
    std::uniform_int_distribution<uint32_t> dist(min, max);
    return dist(gen_);
}

netflow5_packet_t netflow5_synthetic_generator_t::generate_packet(netflow5_random_source_t& random_source, uint32_t unix_secs) {
    netflow5_packet_t packet;

    // Hosts from 192.168.2.0/24 talk to hosts from 10.0.1.0/24
    uint32_t source_host      = random_source.randint(1, 254);
    uint32_t destination_host = random_source.randint(1, 254);

    uint16_t srcport = random_source.randint(1024, 65535);

    size_t port_index = random_source.randint(0, synthetic_flow_destination_ports.size() - 1);
    uint16_t dstport  = synthetic_flow_destination_ports[port_index];

    size_t protocol_index = random_source.randint(0, synthetic_flow_protocols.size() - 1);
    uint8_t protocol      = get_ip_protocol_enum_as_number(synthetic_flow_protocols[protocol_index]);

    uint32_t packets = random_source.randint(1, 100);
    uint32_t bytes   = packets * random_source.randint(64, 1500);

    packet.header.version           = netflow5_protocol_version;
    packet.header.count             = 1;
    packet.header.sys_uptime        = random_source.randint(10000, 99999);
    packet.header.unix_secs         = unix_secs;
    packet.header.unix_nsecs        = 0;
    packet.header.flow_sequence     = flow_sequence;
    packet.header.engine_type       = 0;
    packet.header.engine_id         = 0;
    packet.header.sampling_interval = 0;

    if (unix_secs > 0) {
        packet.header.timestamp = print_time_t_in_utc_format(time_t(unix_secs));
    }

    netflow5_flow_record_t flow;

    flow.srcaddr   = "192.168.2." + std::to_string(source_host);
    flow.dstaddr   = "10.0.1." + std::to_string(destination_host);
    // Gateway of source subnet
    flow.nexthop   = "192.168.2.1";
    flow.input_if  = 1;
    flow.output_if = 2;
    flow.packets   = packets;
    flow.bytes     = bytes;
    flow.first     = 1000;
    flow.last      = 2000;
    flow.srcport   = srcport;
    flow.dstport   = dstport;
    flow.tcp_flags = synthetic_flow_tcp_flags;
    flow.protocol  = protocol;
    flow.tos       = 0;
    flow.src_as    = synthetic_flow_src_as;
    flow.dst_as    = synthetic_flow_dst_as;
    flow.src_mask  = 24;
    flow.dst_mask  = 24;

    packet.flows.push_back(flow);

    // Unsigned overflow brings us back to zero after 2^32 - 1 packets
    flow_sequence++;

    return packet;
}
