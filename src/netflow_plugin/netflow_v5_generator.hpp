#pragma once

#include <cstdint>
#include <random>

#include "netflow_v5_packet.hpp"

// Random number source for synthetic traffic. We pass it explicitly to make generation reproducible with fixed seed
class netflow5_random_source_t {
    public:
    // Seeds from std::random_device
    netflow5_random_source_t();
    explicit netflow5_random_source_t(uint64_t seed_value);

    void seed(uint64_t seed_value);

    // Uniform integer in [min, max], both ends included
    uint32_t randint(uint32_t min, uint32_t max);

    private:
    std::mt19937_64 gen_;
};

// Builds synthetic single flow Netflow v5 packets and maintains flow sequence for one exporter
class netflow5_synthetic_generator_t {
    public:
    netflow5_synthetic_generator_t() = default;

    // Continues sequence of exporter which already sent some packets
    explicit netflow5_synthetic_generator_t(uint32_t initial_flow_sequence) : flow_sequence(initial_flow_sequence) {
    }

    netflow5_packet_t generate_packet(netflow5_random_source_t& random_source, uint32_t unix_secs);

    // Sequence which will be assigned to next generated packet
    uint32_t get_next_flow_sequence() const {
        return flow_sequence;
    }

    private:
    // Starts from 1 and wraps only on 32 bit boundary
    uint32_t flow_sequence = 1;
};
