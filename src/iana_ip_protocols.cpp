#include "iana_ip_protocols.hpp"

#include <type_traits>

std::string get_ip_protocol_name_by_number(uint8_t protocol_number) {
    switch (static_cast<ip_protocol_t>(protocol_number)) {
    case ip_protocol_t::ICMP:
        return "ICMP";
        break;
    case ip_protocol_t::TCP:
        return "TCP";
        break;
    case ip_protocol_t::UDP:
        return "UDP";
        break;
    case ip_protocol_t::GRE:
        return "GRE";
        break;
    case ip_protocol_t::ESP:
        return "ESP";
        break;
    case ip_protocol_t::AH:
        return "AH";
        break;
    case ip_protocol_t::OSPF:
        return "OSPF";
        break;
    }

    // We use unsigned here because otherwise it will be interpreted as char
    return "Unknown(" + std::to_string(unsigned(protocol_number)) + ")";
}

uint8_t get_ip_protocol_enum_as_number(ip_protocol_t ip_protocol_enum) {
    return static_cast<std::underlying_type<ip_protocol_t>::type>(ip_protocol_enum);
}
