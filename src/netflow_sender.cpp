/* Netflow v5 exporter of synthetic traffic */

#include <cstdlib>
#include <iostream>
#include <string>

#include <boost/program_options.hpp>

#include "all_logcpp_libraries.hpp"

#include "netflow_exchange_configuration.hpp"
#include "netflow_exchange_logging.hpp"

#include "netflow_plugin/netflow_v5_generator.hpp"
#include "netflow_plugin/netflow_v5_sender.hpp"

log4cpp::Category& logger = log4cpp::Category::getRoot();

std::string netflow_exchange_version = "1.0.0";

netflow_exchange_configuration_t netflow_exchange_global_configuration;

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
		("receiver_host", po::value<std::string>(), "host name or IP of Netflow receiver")
		("receiver_port", po::value<unsigned int>(), "UDP port of Netflow receiver")
		("seed", po::value<uint64_t>(), "seed for synthetic traffic generator");
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

    logger << log4cpp::Priority::INFO << "=== Netflow Sender ===";

    if (!load_configuration_from_environment(netflow_exchange_global_configuration)) {
        logger << log4cpp::Priority::ERROR << "Cannot load configuration from environment";
        exit(EXIT_FAILURE);
    }

    // Command line has priority over environment
    if (vm.count("logging_level")) {
        netflow_exchange_global_configuration.logging_level = vm["logging_level"].as<std::string>();
    }

    if (vm.count("receiver_host")) {
        netflow_exchange_global_configuration.receiver_host = vm["receiver_host"].as<std::string>();
    }

    if (vm.count("receiver_port")) {
        unsigned int receiver_port = vm["receiver_port"].as<unsigned int>();

        if (receiver_port < 1 || receiver_port > 65535) {
            logger << log4cpp::Priority::ERROR << "Receiver port must be in range 1..65535, we got " << receiver_port;
            exit(EXIT_FAILURE);
        }

        netflow_exchange_global_configuration.receiver_port = receiver_port;
    }

    if (vm.count("seed")) {
        netflow_exchange_global_configuration.random_seed = vm["seed"].as<uint64_t>();
    }

    reconfigure_logging_level(netflow_exchange_global_configuration.logging_level);

    netflow5_random_source_t random_source;

    if (netflow_exchange_global_configuration.random_seed.has_value()) {
        random_source.seed(netflow_exchange_global_configuration.random_seed.value());
        logger << log4cpp::Priority::INFO << "We use fixed random seed "
               << netflow_exchange_global_configuration.random_seed.value();
    }

    netflow5_sender_t sender(netflow_exchange_global_configuration, random_source);

    if (!sender.open_socket()) {
        exit(EXIT_FAILURE);
    }

    sender.run();

    return EXIT_SUCCESS;
}
