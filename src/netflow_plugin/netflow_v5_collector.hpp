#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "../netflow_exchange_types.hpp"

#include "netflow_v5_metrics.hpp"

// Everything collector keeps between datagrams
class netflow5_collector_state_t {
    public:
    netflow5_collector_counters_t counters{};

    // Number for next successfully decoded packet, starts from 1
    uint32_t next_packet_number = 1;
};

// Decodes one datagram and passes it to handler. Returns false when datagram was dropped
bool process_netflow5_datagram(const uint8_t* data,
                               size_t data_length,
                               const std::string& client_address_in_string_format,
                               uint16_t client_port,
                               netflow5_collector_state_t& collector_state,
                               const process_netflow5_packet_pointer& process_packet);

std::vector<system_counter_t> get_netflow_v5_stats(const netflow5_collector_counters_t& counters);

// One line summary for periodic logging
std::string print_netflow5_collector_stats(const netflow5_collector_counters_t& counters);

// Resolves host (name or IPv4 address, empty means any) and binds UDP socket with 1 second receive timeout
// Socket is returned only on success
bool bind_netflow5_udp_socket(const std::string& netflow_host, unsigned int netflow_port, int& sockfd);

// Listens on UDP port forever. Returns false only when we cannot start listening
bool start_netflow5_collector(const std::string& netflow_host,
                              unsigned int netflow_port,
                              unsigned int stats_print_period,
                              const process_netflow5_packet_pointer& process_packet);
