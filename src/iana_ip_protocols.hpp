#pragma once

#include <cstdint>
#include <string>

// IANA protocol numbers which we can name in reports
// https://www.iana.org/assignments/protocol-numbers/protocol-numbers.xhtml
enum class ip_protocol_t : uint8_t {
    ICMP = 1,
    TCP  = 6,
    UDP  = 17,
    GRE  = 47,
    ESP  = 50,
    AH   = 51,
    OSPF = 89,
};

// Returns protocol name or Unknown(N) for protocols we do not know
std::string get_ip_protocol_name_by_number(uint8_t protocol_number);

uint8_t get_ip_protocol_enum_as_number(ip_protocol_t ip_protocol_enum);
