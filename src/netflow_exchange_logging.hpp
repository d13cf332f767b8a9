#pragma once

#include <string>

#include "netflow_exchange_configuration_scheme.hpp"

// Adds console or file appender to root category
bool init_logging(const netflow_exchange_configuration_t& configuration);

void reconfigure_logging_level(const std::string& logging_level);
