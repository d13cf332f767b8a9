#include "netflow_exchange_configuration.hpp"

#include <cstdlib>

#include "all_logcpp_libraries.hpp"
#include "fast_library.hpp"

extern log4cpp::Category& logger;

// Returns true only when variable exists
bool read_environment_variable(const std::string& name, std::string& value) {
    const char* raw_value = getenv(name.c_str());

    if (raw_value == nullptr) {
        return false;
    }

    value = raw_value;
    return true;
}

bool read_udp_port_from_string(const std::string& port_as_string, unsigned int& port) {
    int port_as_integer = 0;

    if (!convert_string_to_positive_integer_safe(port_as_string, port_as_integer)) {
        return false;
    }

    if (port_as_integer < 1 || port_as_integer > 65535) {
        return false;
    }

    port = port_as_integer;
    return true;
}

bool load_configuration_from_environment(netflow_exchange_configuration_t& configuration) {
    std::string value;

    if (read_environment_variable("RECEIVER_HOST", value) && !value.empty()) {
        configuration.receiver_host = value;
    }

    if (read_environment_variable("RECEIVER_PORT", value)) {
        if (!read_udp_port_from_string(value, configuration.receiver_port)) {
            logger << log4cpp::Priority::ERROR << "Cannot parse RECEIVER_PORT value '" << value << "' as UDP port";
            return false;
        }
    }

    if (read_environment_variable("LISTEN_HOST", value) && !value.empty()) {
        configuration.listen_host = value;
    }

    if (read_environment_variable("LISTEN_PORT", value)) {
        if (!read_udp_port_from_string(value, configuration.listen_port)) {
            logger << log4cpp::Priority::ERROR << "Cannot parse LISTEN_PORT value '" << value << "' as UDP port";
            return false;
        }
    }

    if (read_environment_variable("LOGGING_LEVEL", value)) {
        configuration.logging_level = value;
    }

    return true;
}
