#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "netflow_plugin/netflow_v5.hpp"

class netflow_exchange_configuration_t {
    public:
    // Sender
    std::string receiver_host{ "receiver" };
    unsigned int receiver_port{ netflow5_default_port };

    // All delays use seconds
    unsigned int startup_delay{ 5 };
    unsigned int resolution_retry_delay{ 5 };
    unsigned int send_failure_delay{ 2 };
    unsigned int cooldown_min{ 1 };
    unsigned int cooldown_max{ 5 };

    // Fixed seed makes synthetic traffic reproducible
    std::optional<uint64_t> random_seed{};

    // Receiver
    std::string listen_host{ "0.0.0.0" };
    unsigned int listen_port{ netflow5_default_port };
    unsigned int stats_print_period{ 10 };

    // Logging
    std::string logging_level{ "info" };
    bool log_to_console{ true };
    std::string log_file_path{ "/var/log/netflow_exchange.log" };
};
