/* Netflow v5 collector body */

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <ctime>
#include <sstream>

#include "../all_logcpp_libraries.hpp"
#include "../fast_library.hpp"

#include "netflow_v5.hpp"
#include "netflow_v5_collector.hpp"
#include "netflow_v5_decoder.hpp"
#include "netflow_v5_packet.hpp"

// Get it from main programme
extern log4cpp::Category& logger;

std::vector<system_counter_t> get_netflow_v5_stats(const netflow5_collector_counters_t& counters) {
    std::vector<system_counter_t> system_counter;

    system_counter.push_back(system_counter_t("netflow_v5_total_packets", counters.total_packets, metric_type_t::counter,
                                              "Total number of Netflow v5 UDP packets received"));

    system_counter.push_back(system_counter_t("netflow_v5_decoded_packets", counters.decoded_packets, metric_type_t::counter,
                                              "Number of Netflow v5 packets decoded successfully"));

    system_counter.push_back(system_counter_t("netflow_v5_total_flows", counters.total_flows, metric_type_t::counter,
                                              "Total number of Netflow v5 flows (multiple in each packet)"));

    system_counter.push_back(system_counter_t("netflow_v5_too_short_packets", counters.too_short_packets,
                                              metric_type_t::counter, "Packets which cannot fit Netflow v5 header"));

    system_counter.push_back(system_counter_t("netflow_v5_field_read_errors", counters.field_read_errors,
                                              metric_type_t::counter, "Packets which end in the middle of field"));

    system_counter.push_back(system_counter_t("netflow_v5_truncated_records", counters.truncated_records, metric_type_t::counter,
                                              "Packets with flow record shorter than 48 bytes"));

    system_counter.push_back(system_counter_t("netflow_v5_flow_count_mismatches", counters.flow_count_mismatches,
                                              metric_type_t::counter,
                                              "Packets which carry fewer flows than declared in header"));

    return system_counter;
}

bool process_netflow5_datagram(const uint8_t* data,
                               size_t data_length,
                               const std::string& client_address_in_string_format,
                               uint16_t client_port,
                               netflow5_collector_state_t& collector_state,
                               const process_netflow5_packet_pointer& process_packet) {
    netflow5_collector_counters_t& counters = collector_state.counters;

    counters.total_packets++;

    netflow5_packet_t packet;
    netflow5_decode_error_t decode_error = netflow5_decode_error_t::none;

    bool decode_result = decode_netflow5_packet(data, data_length, client_address_in_string_format, client_port,
                                                collector_state.next_packet_number, packet, decode_error);

    if (!decode_result) {
        if (decode_error == netflow5_decode_error_t::too_short) {
            counters.too_short_packets++;
        } else if (decode_error == netflow5_decode_error_t::field_read_error) {
            counters.field_read_errors++;
        } else if (decode_error == netflow5_decode_error_t::truncated_record) {
            counters.truncated_records++;
        }

        logger << log4cpp::Priority::ERROR << "Cannot decode Netflow v5 packet of " << data_length << " bytes from "
               << client_address_in_string_format << ":" << client_port
               << " error: " << get_netflow5_decode_error_as_string(decode_error);

        return false;
    }

    if (packet.header.version != netflow5_protocol_version) {
        // We still process it as v5 layout, some exporters put garbage here
        logger << log4cpp::Priority::WARN << "Unexpected Netflow version " << packet.header.version << " from "
               << client_address_in_string_format;
    }

    if (packet.flows.size() != packet.header.count) {
        counters.flow_count_mismatches++;
    }

    counters.decoded_packets++;
    counters.total_flows += packet.flows.size();
    collector_state.next_packet_number++;

    if (logger.getPriority() == log4cpp::Priority::DEBUG) {
        logger << log4cpp::Priority::DEBUG << packet.print() << " " << packet.header.print();
    }

    if (process_packet) {
        process_packet(packet);
    }

    return true;
}

std::string print_netflow5_collector_stats(const netflow5_collector_counters_t& counters) {
    std::stringstream buffer;

    buffer << "Stats: Total=" << counters.total_packets << ", Decoded=" << counters.decoded_packets
           << ", Failed=" << counters.get_decode_failures() << ", Flows=" << counters.total_flows;

    return buffer.str();
}

bool bind_netflow5_udp_socket(const std::string& netflow_host, unsigned int netflow_port, int& sockfd) {
    struct addrinfo hints;
    memset(&hints, 0, sizeof hints);

    // We do not support IPv6 here
    hints.ai_family   = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;
    // This flag will generate wildcard IP address if we not specified certain IP address for binding
    // Host names are allowed and resolved here
    hints.ai_flags = AI_PASSIVE;

    struct addrinfo* servinfo = NULL;

    const char* address_for_binding = NULL;

    if (!netflow_host.empty()) {
        address_for_binding = netflow_host.c_str();
    }

    std::string port_as_string = std::to_string(netflow_port);

    int getaddrinfo_result = getaddrinfo(address_for_binding, port_as_string.c_str(), &hints, &servinfo);

    if (getaddrinfo_result != 0) {
        logger << log4cpp::Priority::ERROR << "Netflow getaddrinfo function failed with code: " << getaddrinfo_result
               << " error: " << gai_strerror(getaddrinfo_result) << " please check listen host";
        return false;
    }

    int new_sockfd = socket(servinfo->ai_family, servinfo->ai_socktype, servinfo->ai_protocol);

    if (new_sockfd < 0) {
        logger << log4cpp::Priority::ERROR << "Cannot create UDP socket errno:" << errno << " error: " << strerror(errno);
        freeaddrinfo(servinfo);
        return false;
    }

    int bind_result = bind(new_sockfd, servinfo->ai_addr, servinfo->ai_addrlen);

    if (bind_result) {
        logger << log4cpp::Priority::ERROR << "Can't listen on port: " << netflow_port << " on host " << netflow_host
               << " errno:" << errno << " error: " << strerror(errno);
        freeaddrinfo(servinfo);
        close(new_sockfd);
        return false;
    }

    freeaddrinfo(servinfo);

    // We should specify timeout there to print stats even when nobody sends us data
    struct timeval tv;
    tv.tv_sec  = 1; /* X Secs Timeout */
    tv.tv_usec = 0; // Not init'ing this can cause strange errors

    if (setsockopt(new_sockfd, SOL_SOCKET, SO_RCVTIMEO, (char*)&tv, sizeof(struct timeval)) != 0) {
        logger << log4cpp::Priority::WARN << "Cannot set receive timeout, stats will be printed only on new packets";
    }

    sockfd = new_sockfd;
    return true;
}

bool start_netflow5_collector(const std::string& netflow_host,
                              unsigned int netflow_port,
                              unsigned int stats_print_period,
                              const process_netflow5_packet_pointer& process_packet) {
    logger << log4cpp::Priority::INFO << "netflow collector will listen on " << netflow_host << ":" << netflow_port
           << " udp port";

    const unsigned int udp_buffer_size = 65536;
    std::vector<uint8_t> udp_buffer(udp_buffer_size);

    int sockfd = -1;

    if (!bind_netflow5_udp_socket(netflow_host, netflow_port, sockfd)) {
        return false;
    }

    logger << log4cpp::Priority::INFO << "Receiver listening on " << netflow_host << ":" << netflow_port;

    netflow5_collector_state_t collector_state;
    time_t last_stats_print_time = time(NULL);

    while (true) {
        struct sockaddr_storage client_address;
        // It's MUST
        memset(&client_address, 0, sizeof(struct sockaddr_storage));
        socklen_t address_len = sizeof(struct sockaddr_storage);

        ssize_t received_bytes =
            recvfrom(sockfd, udp_buffer.data(), udp_buffer.size(), 0, (struct sockaddr*)&client_address, &address_len);

        if (received_bytes >= 0) {
            // Pass host and port as numbers without any conversion
            int getnameinfo_flags = NI_NUMERICSERV | NI_NUMERICHOST;
            char host[NI_MAXHOST];
            char service[NI_MAXSERV];

            int result = getnameinfo((struct sockaddr*)&client_address, address_len, host, NI_MAXHOST, service,
                                     NI_MAXSERV, getnameinfo_flags);

            std::string client_address_in_string_format = "unknown";
            int client_port                              = 0;

            if (result == 0) {
                client_address_in_string_format = std::string(host);

                if (!convert_string_to_positive_integer_safe(std::string(service), client_port)) {
                    client_port = 0;
                }
            } else {
                logger << log4cpp::Priority::ERROR << "getnameinfo failed with error: " << gai_strerror(result);
            }

            // Failures are logged and counted inside, we just continue with next datagram
            process_netflow5_datagram(udp_buffer.data(), size_t(received_bytes), client_address_in_string_format,
                                      uint16_t(client_port), collector_state, process_packet);
        } else {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                // We got timeout, it's OK!
            } else if (errno != EINTR) {
                logger << log4cpp::Priority::ERROR << "netflow data receive failed with error number: " << errno << " "
                       << "error name: " << strerror(errno);
            }
        }

        time_t current_time = time(NULL);

        if (stats_print_period > 0 && current_time - last_stats_print_time >= time_t(stats_print_period)) {
            last_stats_print_time = current_time;

            if (collector_state.counters.total_packets > 0) {
                logger << log4cpp::Priority::INFO << print_netflow5_collector_stats(collector_state.counters);
            }
        }
    }
}
