#include "netflow_exchange_logging.hpp"

#include <cstdio>
#include <iostream>

#include <unistd.h>

#include "all_logcpp_libraries.hpp"
#include "fast_library.hpp"

extern log4cpp::Category& logger;

bool init_logging(const netflow_exchange_configuration_t& configuration) {
    logger.setPriority(log4cpp::Priority::INFO);

    // In this case we log everything to console
    if (configuration.log_to_console) {
        log4cpp::PatternLayout* layout = new log4cpp::PatternLayout();
        layout->setConversionPattern("[%p] %m%n");

        // We duplicate stdout because it will be closed by log4cpp on object termination and we do not need it
        log4cpp::Appender* console_appender = new log4cpp::FileAppender("stdout", ::dup(fileno(stdout)));
        console_appender->setLayout(layout);
        logger.addAppender(console_appender);
    } else {
        log4cpp::PatternLayout* layout = new log4cpp::PatternLayout();
        layout->setConversionPattern("%d [%p] %m%n");

        // So log4cpp will never notify you if it could not write to log file due to permissions issues
        // We will check it manually
        if (!file_is_appendable(configuration.log_file_path)) {
            std::cerr << "Can't open log file " << configuration.log_file_path
                      << " for writing! Please check file and folder permissions" << std::endl;

            delete layout;
            return false;
        }

        log4cpp::Appender* appender = new log4cpp::FileAppender("default", configuration.log_file_path);
        appender->setLayout(layout);
        logger.addAppender(appender);
    }

    reconfigure_logging_level(configuration.logging_level);

    logger << log4cpp::Priority::INFO << "Logger initialized";
    return true;
}

void reconfigure_logging_level(const std::string& logging_level) {
    // Configure logging level
    log4cpp::Priority::Value priority = log4cpp::Priority::INFO;

    if (logging_level == "debug") {
        priority = log4cpp::Priority::DEBUG;
    } else if (logging_level == "info" || logging_level == "") {
        priority = log4cpp::Priority::INFO;
    } else if (logging_level == "warn") {
        priority = log4cpp::Priority::WARN;
    } else if (logging_level == "error") {
        priority = log4cpp::Priority::ERROR;
    } else {
        logger << log4cpp::Priority::ERROR << "Unknown logging level: " << logging_level;
    }

    logger.setPriority(priority);
}
