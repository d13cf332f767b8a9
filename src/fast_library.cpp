#include "fast_library.hpp"

#include <arpa/inet.h>

#include <cctype>
#include <fstream>
#include <stdexcept>

#include "fast_endianless.hpp"

#include <fmt/compile.h>
#include <fmt/format.h>

std::string convert_ip_as_host_byte_order_uint_to_string(uint32_t ip_as_integer) {
    // Most significant byte goes first in dotted-quad form
    return fmt::format(FMT_COMPILE("{}.{}.{}.{}"), (ip_as_integer >> 24) & 0xFF, (ip_as_integer >> 16) & 0xFF,
                       (ip_as_integer >> 8) & 0xFF, ip_as_integer & 0xFF);
}

bool convert_ip_as_string_to_host_byte_order_uint_safe(const std::string& ip, uint32_t& ip_as_integer) {
    struct in_addr ip_addr;

    // inet_pton returns 1 only for well formed dotted-quad addresses
    if (inet_pton(AF_INET, ip.c_str(), &ip_addr) != 1) {
        return false;
    }

    ip_as_integer = fast_ntoh(uint32_t(ip_addr.s_addr));
    return true;
}

std::string print_time_t_in_utc_format(time_t current_time) {
    struct tm timeinfo;
    char buffer[80];

    if (gmtime_r(&current_time, &timeinfo) == nullptr) {
        return "";
    }

    strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S UTC", &timeinfo);

    return std::string(buffer);
}

bool convert_string_to_positive_integer_safe(const std::string& line, int& value) {
    int temp_value        = 0;
    size_t parsed_symbols = 0;

    // std::stoi skips leading spaces and accepts sign, we do not
    if (line.empty() || !isdigit(static_cast<unsigned char>(line[0]))) {
        return false;
    }

    try {
        temp_value = std::stoi(line, &parsed_symbols);
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }

    // Trailing garbage like in "2055abc"
    if (parsed_symbols != line.size()) {
        return false;
    }

    if (temp_value >= 0) {
        value = temp_value;
        return true;
    } else {
        // We do not expect negative values here
        return false;
    }
}

bool file_is_appendable(const std::string& path) {
    std::ofstream check_appendable_file;

    check_appendable_file.open(path.c_str(), std::ios::app);

    if (check_appendable_file.is_open()) {
        // all fine, just close file
        check_appendable_file.close();

        return true;
    } else {
        return false;
    }
}
