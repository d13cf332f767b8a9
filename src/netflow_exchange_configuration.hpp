#pragma once

#include <string>

#include "netflow_exchange_configuration_scheme.hpp"

// Reads RECEIVER_HOST, RECEIVER_PORT, LISTEN_HOST, LISTEN_PORT and LOGGING_LEVEL
// Variables which are not set keep their defaults
bool load_configuration_from_environment(netflow_exchange_configuration_t& configuration);

// Accepts only integers in range 1..65535
bool read_udp_port_from_string(const std::string& port_as_string, unsigned int& port);
