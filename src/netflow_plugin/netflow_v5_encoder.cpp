#include "netflow_v5_encoder.hpp"

#include <limits>

#include "../all_logcpp_libraries.hpp"
#include "../dynamic_binary_buffer.hpp"
#include "../fast_library.hpp"

#include "netflow_v5.hpp"

extern log4cpp::Category& logger;

uint32_t convert_flow_address_for_encoding(const std::string& address) {
    uint32_t address_as_integer = 0;

    if (!convert_ip_as_string_to_host_byte_order_uint_safe(address, address_as_integer)) {
        if (logger.getPriority() == log4cpp::Priority::DEBUG) {
            logger << log4cpp::Priority::DEBUG << "Cannot parse flow address '" << address << "' we will encode it as 0.0.0.0";
        }

        return 0;
    }

    return address_as_integer;
}

std::vector<uint8_t> encode_netflow5_packet(const netflow5_packet_t& packet) {
    // Count field is only 16 bit long
    if (packet.flows.size() > std::numeric_limits<uint16_t>::max()) {
        logger << log4cpp::Priority::ERROR << "Too many flows for single Netflow v5 packet: " << packet.flows.size();
        return {};
    }

    if (packet.header.count != packet.flows.size() && logger.getPriority() == log4cpp::Priority::DEBUG) {
        logger << log4cpp::Priority::DEBUG << "Header count " << packet.header.count << " does not match "
               << packet.flows.size() << " flows, we will use number of flows";
    }

    dynamic_binary_buffer_t buffer;

    if (!buffer.set_maximum_buffer_size_in_bytes(NETFLOW5_PACKET_SIZE(packet.flows.size()))) {
        logger << log4cpp::Priority::ERROR << "Cannot allocate buffer for Netflow v5 packet";
        return {};
    }

    netflow5_header_t wire_header;

    wire_header.version           = packet.header.version;
    wire_header.count             = uint16_t(packet.flows.size());
    wire_header.sys_uptime        = packet.header.sys_uptime;
    wire_header.unix_secs         = packet.header.unix_secs;
    wire_header.unix_nsecs        = packet.header.unix_nsecs;
    wire_header.flow_sequence     = packet.header.flow_sequence;
    wire_header.engine_type       = packet.header.engine_type;
    wire_header.engine_id         = packet.header.engine_id;
    wire_header.sampling_interval = packet.header.sampling_interval;

    wire_header.host_byte_order_to_network_byte_order();
    buffer.append_data_as_object_ptr(&wire_header);

    for (const auto& flow : packet.flows) {
        netflow5_flow_t wire_flow;

        wire_flow.srcaddr   = convert_flow_address_for_encoding(flow.srcaddr);
        wire_flow.dstaddr   = convert_flow_address_for_encoding(flow.dstaddr);
        wire_flow.nexthop   = convert_flow_address_for_encoding(flow.nexthop);
        wire_flow.input_if  = flow.input_if;
        wire_flow.output_if = flow.output_if;
        wire_flow.packets   = flow.packets;
        wire_flow.bytes     = flow.bytes;
        wire_flow.first     = flow.first;
        wire_flow.last      = flow.last;
        wire_flow.srcport   = flow.srcport;
        wire_flow.dstport   = flow.dstport;
        wire_flow.pad1      = flow.pad1;
        wire_flow.tcp_flags = flow.tcp_flags;
        wire_flow.protocol  = flow.protocol;
        wire_flow.tos       = flow.tos;
        wire_flow.src_as    = flow.src_as;
        wire_flow.dst_as    = flow.dst_as;
        wire_flow.src_mask  = flow.src_mask;
        wire_flow.dst_mask  = flow.dst_mask;
        wire_flow.pad2      = flow.pad2;

        wire_flow.host_byte_order_to_network_byte_order();
        buffer.append_data_as_object_ptr(&wire_flow);
    }

    // Buffer was allocated for exact packet size and we do not expect overflow here
    if (buffer.is_failed()) {
        logger << log4cpp::Priority::ERROR << "Failed to serialize Netflow v5 packet, we wrote only "
               << buffer.get_used_size() << " bytes";
        return {};
    }

    return buffer.get_used_data();
}
