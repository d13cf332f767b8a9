#pragma once

#include <cstdint>
#include <ctime>
#include <string>

// IPv4 helpers, integers are in host byte order
std::string convert_ip_as_host_byte_order_uint_to_string(uint32_t ip_as_integer);
bool convert_ip_as_string_to_host_byte_order_uint_safe(const std::string& ip, uint32_t& ip_as_integer);

std::string print_time_t_in_utc_format(time_t current_time);

bool convert_string_to_positive_integer_safe(const std::string& line, int& value);
bool file_is_appendable(const std::string& path);
