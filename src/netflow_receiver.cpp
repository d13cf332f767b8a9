/* Netflow v5 receiver which prints every decoded packet */

#include <cstdlib>
#include <iostream>
#include <string>

#include <boost/program_options.hpp>

#include "all_logcpp_libraries.hpp"

#include "netflow_exchange_configuration.hpp"
#include "netflow_exchange_logging.hpp"

#include "netflow_plugin/netflow_v5_collector.hpp"
#include "netflow_plugin/netflow_v5_packet.hpp"

log4cpp::Category& logger = log4cpp::Category::getRoot();

std::string netflow_exchange_version = "1.0.0";

netflow_exchange_configuration_t netflow_exchange_global_configuration;

void print_netflow5_packet_to_stdout(const netflow5_packet_t& packet) {
    std::cout << print_netflow5_packet(packet) << std::flush;
}

int main(int argc, char** argv) {
    namespace po = boost::program_options;

    po::variables_map vm;

    try {
        // clang-format off
        po::options_description desc("Allowed options");
        desc.add_options()
		("help", "produce help message")
		("version", "show version")
		("log_file", po::value<std::string>(), "set path to custom log file, switches logging from console to file")
		("log_to_console", "switches all logging to console")
		("logging_level", po::value<std::string>(), "debug, info, warn or error")
		("listen_host", po::value<std::string>(), "IPv4 address for binding")
		("listen_port", po::value<unsigned int>(), "UDP port for Netflow");
        // clang-format on

        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        if (vm.count("help")) {
            std::cout << desc << std::endl;
            exit(EXIT_SUCCESS);
        }

        if (vm.count("version")) {
            std::cout << "Version: " << netflow_exchange_version << std::endl;
            exit(EXIT_SUCCESS);
        }
    } catch (po::error& e) {
        std::cerr << "ERROR: " << e.what() << std::endl << std::endl;
        exit(EXIT_FAILURE);
    }

    if (vm.count("log_file")) {
        netflow_exchange_global_configuration.log_file_path  = vm["log_file"].as<std::string>();
        netflow_exchange_global_configuration.log_to_console = false;
    }

    if (vm.count("log_to_console")) {
        netflow_exchange_global_configuration.log_to_console = true;
    }

    if (!init_logging(netflow_exchange_global_configuration)) {
        exit(EXIT_FAILURE);
    }

    logger << log4cpp::Priority::INFO << "=== Netflow Receiver ===";

    if (!load_configuration_from_environment(netflow_exchange_global_configuration)) {
        logger << log4cpp::Priority::ERROR << "Cannot load configuration from environment";
        exit(EXIT_FAILURE);
    }

    // Command line has priority over environment
    if (vm.count("logging_level")) {
        netflow_exchange_global_configuration.logging_level = vm["logging_level"].as<std::string>();
    }

    if (vm.count("listen_host")) {
        netflow_exchange_global_configuration.listen_host = vm["listen_host"].as<std::string>();
    }

    if (vm.count("listen_port")) {
        unsigned int listen_port = vm["listen_port"].as<unsigned int>();

        if (listen_port < 1 || listen_port > 65535) {
            logger << log4cpp::Priority::ERROR << "Listen port must be in range 1..65535, we got " << listen_port;
            exit(EXIT_FAILURE);
        }

        netflow_exchange_global_configuration.listen_port = listen_port;
    }

    reconfigure_logging_level(netflow_exchange_global_configuration.logging_level);

    bool collector_result = start_netflow5_collector(netflow_exchange_global_configuration.listen_host,
                                                     netflow_exchange_global_configuration.listen_port,
                                                     netflow_exchange_global_configuration.stats_print_period,
                                                     print_netflow5_packet_to_stdout);

    if (!collector_result) {
        logger << log4cpp::Priority::ERROR << "Netflow collector could not start";
        exit(EXIT_FAILURE);
    }

    return EXIT_SUCCESS;
}
