#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>

#include "../netflow_exchange_configuration_scheme.hpp"

#include "netflow_v5_generator.hpp"

// Idle -> Resolving -> Sending -> Cooldown -> Resolving -> ...
enum class netflow5_sender_state_t { idle, resolving, sending, cooldown };

// Outcome of single delivery cycle
enum class netflow5_delivery_result_t { sent, resolution_failure, transmission_failure };

std::string get_netflow5_sender_state_as_string(netflow5_sender_state_t state);
std::string get_netflow5_delivery_result_as_string(netflow5_delivery_result_t result);

typedef boost::asio::ip::udp::endpoint netflow5_endpoint_t;

// Resolves host to list of IPv4 endpoints. Returns false when lookup failed
typedef std::function<bool(const std::string& host, uint16_t port, std::vector<netflow5_endpoint_t>& endpoints, std::string& error_text)>
    netflow5_resolver_t;

// Sends single datagram. Returns false when send failed
typedef std::function<bool(const std::vector<uint8_t>& datagram, const netflow5_endpoint_t& endpoint, std::string& error_text)>
    netflow5_transmitter_t;

typedef std::function<void(unsigned int seconds)> netflow5_sleep_function_t;

// Best effort exporter of synthetic Netflow v5 packets over UDP
// All waits are fixed, failed packets are dropped and never sent again
class netflow5_sender_t {
    public:
    netflow5_sender_t(const netflow_exchange_configuration_t& configuration, netflow5_random_source_t& random_source);

    // Opens UDP socket which we use for whole process lifetime
    bool open_socket();

    void set_resolver(netflow5_resolver_t resolver) {
        this->resolver = resolver;
    }

    void set_transmitter(netflow5_transmitter_t transmitter) {
        this->transmitter = transmitter;
    }

    void set_sleep_function(netflow5_sleep_function_t sleep_function) {
        this->sleep_function = sleep_function;
    }

    // Startup delay and then delivery cycles forever
    void run();

    // Resolving, sending and cooldown or wait after failure
    netflow5_delivery_result_t run_iteration();

    netflow5_sender_state_t get_state() const {
        return state;
    }

    uint64_t get_sent_packets() const {
        return sent_packets;
    }

    uint32_t get_next_flow_sequence() const {
        return generator.get_next_flow_sequence();
    }

    private:
    bool resolve_with_asio(const std::string& host, uint16_t port, std::vector<netflow5_endpoint_t>& endpoints, std::string& error_text);

    bool send_with_asio(const std::vector<uint8_t>& datagram, const netflow5_endpoint_t& endpoint, std::string& error_text);

    netflow_exchange_configuration_t configuration;
    netflow5_random_source_t& random_source;
    netflow5_synthetic_generator_t generator;

    boost::asio::io_context io_context;
    boost::asio::ip::udp::socket socket;

    netflow5_resolver_t resolver;
    netflow5_transmitter_t transmitter;
    netflow5_sleep_function_t sleep_function;

    netflow5_sender_state_t state = netflow5_sender_state_t::idle;
    uint64_t sent_packets         = 0;
};
