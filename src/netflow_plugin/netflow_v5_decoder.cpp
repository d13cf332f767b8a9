#include "netflow_v5_decoder.hpp"

#include <algorithm>
#include <cstring>
#include <utility>

#include "../all_logcpp_libraries.hpp"
#include "../fast_library.hpp"

#include "netflow_v5.hpp"

extern log4cpp::Category& logger;

std::string netflow5_decoder_log_prefix = "netflow5_decoder ";

std::string get_netflow5_decode_error_as_string(netflow5_decode_error_t error) {
    switch (error) {
    case netflow5_decode_error_t::none:
        return "none";
    case netflow5_decode_error_t::too_short:
        return "too_short";
    case netflow5_decode_error_t::field_read_error:
        return "field_read_error";
    case netflow5_decode_error_t::truncated_record:
        return "truncated_record";
    }

    return "unknown";
}

// Copies wire structure from specified offset and converts it to host byte order
// It checks bounds on every call even if caller already did it
template <typename wire_type>
bool read_netflow5_wire_object(const uint8_t* data, size_t data_length, size_t offset, wire_type& wire_object) {
    if (offset > data_length || data_length - offset < sizeof(wire_type)) {
        return false;
    }

    memcpy(&wire_object, data + offset, sizeof(wire_type));
    wire_object.network_to_host_byte_order();

    return true;
}

void convert_netflow5_header_to_packet_header(const netflow5_header_t& wire_header, netflow5_packet_header_t& header) {
    header.version           = wire_header.version;
    header.count             = wire_header.count;
    header.sys_uptime        = wire_header.sys_uptime;
    header.unix_secs         = wire_header.unix_secs;
    header.unix_nsecs        = wire_header.unix_nsecs;
    header.flow_sequence     = wire_header.flow_sequence;
    header.engine_type       = wire_header.engine_type;
    header.engine_id         = wire_header.engine_id;
    header.sampling_interval = wire_header.sampling_interval;

    // Zero export time means that exporter did not set it and we must not show 1970
    if (wire_header.unix_secs > 0) {
        header.timestamp = print_time_t_in_utc_format(time_t(wire_header.unix_secs));
    } else {
        header.timestamp.reset();
    }
}

void convert_netflow5_flow_to_flow_record(const netflow5_flow_t& wire_flow, netflow5_flow_record_t& flow) {
    flow.srcaddr   = convert_ip_as_host_byte_order_uint_to_string(wire_flow.srcaddr);
    flow.dstaddr   = convert_ip_as_host_byte_order_uint_to_string(wire_flow.dstaddr);
    flow.nexthop   = convert_ip_as_host_byte_order_uint_to_string(wire_flow.nexthop);
    flow.input_if  = wire_flow.input_if;
    flow.output_if = wire_flow.output_if;
    flow.packets   = wire_flow.packets;
    flow.bytes     = wire_flow.bytes;
    flow.first     = wire_flow.first;
    flow.last      = wire_flow.last;
    flow.srcport   = wire_flow.srcport;
    flow.dstport   = wire_flow.dstport;
    flow.pad1      = wire_flow.pad1;
    flow.tcp_flags = wire_flow.tcp_flags;
    flow.protocol  = wire_flow.protocol;
    flow.tos       = wire_flow.tos;
    flow.src_as    = wire_flow.src_as;
    flow.dst_as    = wire_flow.dst_as;
    flow.src_mask  = wire_flow.src_mask;
    flow.dst_mask  = wire_flow.dst_mask;
    flow.pad2      = wire_flow.pad2;
}

bool decode_netflow5_packet(const uint8_t* data,
                            size_t data_length,
                            const std::string& source_address,
                            uint16_t source_port,
                            uint32_t packet_number,
                            netflow5_packet_t& packet,
                            netflow5_decode_error_t& error) {
    if (data == nullptr || data_length < netflow5_header_size) {
        error = netflow5_decode_error_t::too_short;
        return false;
    }

    netflow5_header_t wire_header;

    if (!read_netflow5_wire_object(data, data_length, 0, wire_header)) {
        error = netflow5_decode_error_t::field_read_error;
        return false;
    }

    // We build everything in local copy to keep caller's packet untouched on failure
    netflow5_packet_t decoded_packet;

    convert_netflow5_header_to_packet_header(wire_header, decoded_packet.header);

    decoded_packet.source_address = source_address;
    decoded_packet.source_port    = source_port;
    decoded_packet.packet_number  = packet_number;

    // Header may claim more flows than we actually have in packet
    size_t complete_records_in_buffer = (data_length - netflow5_header_size) / netflow5_flow_record_size;
    size_t number_of_flows            = std::min(size_t(wire_header.count), complete_records_in_buffer);

    if (number_of_flows != wire_header.count && logger.getPriority() == log4cpp::Priority::DEBUG) {
        logger << log4cpp::Priority::DEBUG << netflow5_decoder_log_prefix << "header claims " << wire_header.count
               << " flows but packet from " << source_address << " carries only " << complete_records_in_buffer;
    }

    decoded_packet.flows.reserve(number_of_flows);

    for (size_t i = 0; i < number_of_flows; i++) {
        size_t offset = NETFLOW5_PACKET_SIZE(i);

        // Check packet bounds
        if (offset + netflow5_flow_record_size > data_length) {
            error = netflow5_decode_error_t::truncated_record;
            return false;
        }

        netflow5_flow_t wire_flow;

        if (!read_netflow5_wire_object(data, data_length, offset, wire_flow)) {
            error = netflow5_decode_error_t::field_read_error;
            return false;
        }

        netflow5_flow_record_t flow;
        convert_netflow5_flow_to_flow_record(wire_flow, flow);

        decoded_packet.flows.push_back(flow);
    }

    packet = std::move(decoded_packet);
    error  = netflow5_decode_error_t::none;

    return true;
}
