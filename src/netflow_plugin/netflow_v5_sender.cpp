#include "netflow_v5_sender.hpp"

#include <algorithm>
#include <ctime>

#include <boost/asio/buffer.hpp>
#include <boost/asio/ip/address_v4.hpp>
#include <boost/system/error_code.hpp>
#include <boost/thread.hpp>

#include "../all_logcpp_libraries.hpp"

#include "netflow_v5_encoder.hpp"

extern log4cpp::Category& logger;

std::string get_netflow5_sender_state_as_string(netflow5_sender_state_t state) {
    switch (state) {
    case netflow5_sender_state_t::idle:
        return "idle";
    case netflow5_sender_state_t::resolving:
        return "resolving";
    case netflow5_sender_state_t::sending:
        return "sending";
    case netflow5_sender_state_t::cooldown:
        return "cooldown";
    }

    return "unknown";
}

std::string get_netflow5_delivery_result_as_string(netflow5_delivery_result_t result) {
    switch (result) {
    case netflow5_delivery_result_t::sent:
        return "sent";
    case netflow5_delivery_result_t::resolution_failure:
        return "resolution_failure";
    case netflow5_delivery_result_t::transmission_failure:
        return "transmission_failure";
    }

    return "unknown";
}

netflow5_sender_t::netflow5_sender_t(const netflow_exchange_configuration_t& configuration, netflow5_random_source_t& random_source)
    : configuration(configuration), random_source(random_source), socket(io_context) {

    resolver = [this](const std::string& host, uint16_t port, std::vector<netflow5_endpoint_t>& endpoints, std::string& error_text) {
        return resolve_with_asio(host, port, endpoints, error_text);
    };

    transmitter = [this](const std::vector<uint8_t>& datagram, const netflow5_endpoint_t& endpoint, std::string& error_text) {
        return send_with_asio(datagram, endpoint, error_text);
    };

    sleep_function = [](unsigned int seconds) {
        // Available only from boost 1.54: boost::this_thread::sleep_for( boost::chrono::seconds(seconds) );
        boost::this_thread::sleep(boost::posix_time::seconds(seconds));
    };
}

bool netflow5_sender_t::open_socket() {
    boost::system::error_code ec;

    socket.open(boost::asio::ip::udp::v4(), ec);

    if (ec) {
        logger << log4cpp::Priority::ERROR << "Failed to open UDP socket: " << ec.message();
        return false;
    }

    // Any local address and port
    socket.bind(netflow5_endpoint_t(boost::asio::ip::address_v4::any(), 0), ec);

    if (ec) {
        logger << log4cpp::Priority::ERROR << "Failed to bind UDP socket: " << ec.message();
        return false;
    }

    return true;
}

bool netflow5_sender_t::resolve_with_asio(const std::string& host,
                                          uint16_t port,
                                          std::vector<netflow5_endpoint_t>& endpoints,
                                          std::string& error_text) {
    boost::asio::ip::udp::resolver udp_resolver(io_context);
    boost::system::error_code ec;

    // We do not support IPv6
    auto results = udp_resolver.resolve(boost::asio::ip::udp::v4(), host, std::to_string(port), ec);

    if (ec) {
        error_text = ec.message();
        return false;
    }

    for (const auto& entry : results) {
        endpoints.push_back(entry.endpoint());
    }

    return true;
}

bool netflow5_sender_t::send_with_asio(const std::vector<uint8_t>& datagram, const netflow5_endpoint_t& endpoint, std::string& error_text) {
    if (!socket.is_open()) {
        error_text = "socket is not open";
        return false;
    }

    boost::system::error_code ec;
    socket.send_to(boost::asio::buffer(datagram), endpoint, 0, ec);

    if (ec) {
        error_text = ec.message();
        return false;
    }

    return true;
}

void netflow5_sender_t::run() {
    logger << log4cpp::Priority::INFO << "Starting netflow sender to " << configuration.receiver_host << ":"
           << configuration.receiver_port;

    state = netflow5_sender_state_t::idle;

    // Give receiver some time to come up
    sleep_function(configuration.startup_delay);

    while (true) {
        netflow5_delivery_result_t result = run_iteration();

        if (logger.getPriority() == log4cpp::Priority::DEBUG) {
            logger << log4cpp::Priority::DEBUG << "Delivery cycle finished with result "
                   << get_netflow5_delivery_result_as_string(result);
        }
    }
}

netflow5_delivery_result_t netflow5_sender_t::run_iteration() {
    state = netflow5_sender_state_t::resolving;

    // We resolve on every cycle as receiver may change its address
    std::vector<netflow5_endpoint_t> endpoints;
    std::string error_text;

    if (!resolver(configuration.receiver_host, uint16_t(configuration.receiver_port), endpoints, error_text)) {
        logger << log4cpp::Priority::ERROR << "DNS resolution error for " << configuration.receiver_host << ": " << error_text;
        logger << log4cpp::Priority::ERROR << "Retrying in " << configuration.resolution_retry_delay << " seconds";

        sleep_function(configuration.resolution_retry_delay);
        return netflow5_delivery_result_t::resolution_failure;
    }

    if (endpoints.empty()) {
        logger << log4cpp::Priority::ERROR << "No IP addresses found for " << configuration.receiver_host;
        logger << log4cpp::Priority::ERROR << "Retrying in " << configuration.resolution_retry_delay << " seconds";

        sleep_function(configuration.resolution_retry_delay);
        return netflow5_delivery_result_t::resolution_failure;
    }

    state = netflow5_sender_state_t::sending;

    // Packet consumes flow sequence even if we fail to send it
    netflow5_packet_t packet = generator.generate_packet(random_source, uint32_t(time(NULL)));
    std::vector<uint8_t> datagram = encode_netflow5_packet(packet);

    if (!transmitter(datagram, endpoints.front(), error_text)) {
        logger << log4cpp::Priority::ERROR << "Error sending packet to " << endpoints.front() << ": " << error_text;

        sleep_function(configuration.send_failure_delay);

        // Next cycle starts from resolution and sends new packet
        state = netflow5_sender_state_t::resolving;
        return netflow5_delivery_result_t::transmission_failure;
    }

    sent_packets++;

    logger << log4cpp::Priority::INFO << "Sent packet " << sent_packets << " to " << configuration.receiver_host << ":"
           << configuration.receiver_port << " sequence: " << packet.header.flow_sequence << " size: " << datagram.size()
           << " bytes";

    state = netflow5_sender_state_t::cooldown;

    unsigned int cooldown_min = std::min(configuration.cooldown_min, configuration.cooldown_max);
    unsigned int cooldown_max = std::max(configuration.cooldown_min, configuration.cooldown_max);

    sleep_function(random_source.randint(cooldown_min, cooldown_max));

    return netflow5_delivery_result_t::sent;
}
