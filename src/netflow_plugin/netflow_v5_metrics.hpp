#pragma once

#include <cstdint>

// Counters of single collector instance
class netflow5_collector_counters_t {
    public:
    // Total number of UDP datagrams received
    uint64_t total_packets = 0;

    // Datagrams decoded successfully
    uint64_t decoded_packets = 0;

    // Flows in decoded datagrams
    uint64_t total_flows = 0;

    // Decoder failures by kind
    uint64_t too_short_packets = 0;
    uint64_t field_read_errors = 0;
    uint64_t truncated_records = 0;

    // Datagrams which carry fewer flows than header claims
    uint64_t flow_count_mismatches = 0;

    uint64_t get_decode_failures() const {
        return too_short_packets + field_read_errors + truncated_records;
    }
};
