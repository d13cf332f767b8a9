#include "netflow_v5_packet.hpp"

#include <iomanip>
#include <sstream>

#include "../iana_ip_protocols.hpp"

std::string netflow5_packet_header_t::print() const {
    std::stringstream buffer;

    buffer << "NetflowHeader(version=" << version << ", count=" << count << ", sequence=" << flow_sequence << ")";

    return buffer.str();
}

std::string netflow5_flow_record_t::get_protocol_name() const {
    return get_ip_protocol_name_by_number(protocol);
}

std::string netflow5_flow_record_t::print() const {
    std::stringstream buffer;

    buffer << "FlowRecord(" << srcaddr << ":" << srcport << " -> " << dstaddr << ":" << dstport
           << ", proto=" << unsigned(protocol) << ", packets=" << packets << ")";

    return buffer.str();
}

std::string netflow5_packet_t::print() const {
    std::stringstream buffer;

    buffer << "NetflowPacket(#" << packet_number << ", from " << source_address << ":" << source_port << ", "
           << flows.size() << " flows)";

    return buffer.str();
}

std::string print_netflow5_packet(const netflow5_packet_t& packet) {
    std::stringstream buffer;

    std::string separator(70, '=');

    buffer << "\n" << separator << "\n";
    buffer << "Netflow Packet #" << packet.packet_number << " received from " << packet.source_address << ":"
           << packet.source_port << "\n";
    buffer << " Timestamp: " << packet.header.timestamp.value_or("Invalid timestamp") << "\n";
    buffer << "Version: " << packet.header.version << ", Flow count: " << packet.header.count << "\n";
    buffer << " Sequence: " << packet.header.flow_sequence << "\n";
    buffer << "  System uptime: " << packet.header.sys_uptime << " ms\n";

    for (size_t i = 0; i < packet.flows.size(); i++) {
        const netflow5_flow_record_t& flow = packet.flows[i];

        buffer << "\n Flow " << i + 1 << ":\n";
        buffer << "   Source: " << flow.srcaddr << ":" << flow.srcport << "\n";
        buffer << "   Destination: " << flow.dstaddr << ":" << flow.dstport << "\n";
        buffer << "   Protocol: " << flow.get_protocol_name() << " (" << unsigned(flow.protocol) << ")\n";
        buffer << "   Packets: " << flow.packets << ", Bytes: " << flow.bytes << "\n";
        buffer << "   TCP Flags: 0x" << std::hex << std::setw(2) << std::setfill('0') << unsigned(flow.tcp_flags)
               << std::dec << std::setfill(' ') << "\n";
        buffer << "   AS Path: " << flow.src_as << " -> " << flow.dst_as << "\n";
        buffer << "   Next Hop: " << flow.nexthop << "\n";
    }

    buffer << separator << "\n";

    return buffer.str();
}
