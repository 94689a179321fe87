/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License
 * 2.0 and the following additional limitation. Functionality enabled by the
 * files subject to the Elastic License 2.0 may only be used in production when
 * invoked by an Elasticsearch process with a license key installed that permits
 * use of machine learning features. You may not use this file except in
 * compliance with the Elastic License 2.0 and the foregoing additional
 * limitation.
 */
#include "CCmdLineParser.h"

#include <boost/program_options.hpp>

#include <iostream>

#ifndef ECOSENSE_VERSION
#define ECOSENSE_VERSION "development build"
#endif

namespace ecosense {
namespace analyze {

const std::string CCmdLineParser::DESCRIPTION = "Usage: analyze --resource <electricity|water> [options]\n"
                                                "Options:";

bool CCmdLineParser::parse(int argc, const char* const* argv, SOptions& options) {
    try {
        boost::program_options::options_description desc(DESCRIPTION);
        // clang-format off
        desc.add_options()
            ("help", "Display this information and exit")
            ("version", "Display version information and exit")
            ("resource", boost::program_options::value<std::string>(),
                        "The resource to analyze - electricity or water")
            ("input", boost::program_options::value<std::string>(),
                        "Optional CSV file to read input from - not present means read from STDIN")
            ("output", boost::program_options::value<std::string>(),
                        "Optional file to write output to - not present means write to STDOUT")
            ("config", boost::program_options::value<std::string>(),
                        "Optional analysis config file")
            ("percentile", boost::program_options::value<double>(),
                        "Optional anomaly threshold percentile - default is 75")
            ("nightHours", boost::program_options::value<std::string>(),
                        "Optional comma separated night-time hours - default is 22,23,0,1,2,3,4,5")
            ("anomalies", boost::program_options::value<std::string>(),
                        "Optional CSV file to write the anomalous records to")
            ("dailyStats", boost::program_options::value<std::string>(),
                        "Optional CSV file to write daily statistics to")
            ("report", "Write the sustainability report after the JSON results")
            ("facility", boost::program_options::value<std::string>(),
                        "Optional facility to restrict the sustainability report to")
            ("logFile", boost::program_options::value<std::string>(),
                        "Optional file to log to as well as STDERR")
            ("logProperties", boost::program_options::value<std::string>(),
                        "Optional logger properties file")
            ("logLevel", boost::program_options::value<core::CLogger::ELevel>(),
                        "Optional logging level - one of TRACE, DEBUG, INFO, WARN, ERROR, FATAL")
        ;
        // clang-format on

        boost::program_options::variables_map vm;
        boost::program_options::store(
            boost::program_options::parse_command_line(argc, argv, desc), vm);
        boost::program_options::notify(vm);

        if (vm.count("help") > 0) {
            std::cerr << desc << std::endl;
            return false;
        }
        if (vm.count("version") > 0) {
            std::cerr << "EcoSense analyze " << ECOSENSE_VERSION << std::endl;
            return false;
        }
        if (vm.count("resource") == 0) {
            std::cerr << "Error processing command line: --resource is required" << std::endl
                      << desc << std::endl;
            return false;
        }
        options.s_Resource = vm["resource"].as<std::string>();
        if (options.s_Resource != "electricity" && options.s_Resource != "water") {
            std::cerr << "Error processing command line: unknown resource '"
                      << options.s_Resource << "'" << std::endl;
            return false;
        }
        if (vm.count("input") > 0) {
            options.s_InputFileName = vm["input"].as<std::string>();
        }
        if (vm.count("output") > 0) {
            options.s_OutputFileName = vm["output"].as<std::string>();
        }
        if (vm.count("config") > 0) {
            options.s_ConfigFile = vm["config"].as<std::string>();
        }
        if (vm.count("percentile") > 0) {
            options.s_Percentile = vm["percentile"].as<double>();
        }
        if (vm.count("nightHours") > 0) {
            options.s_NightHours = vm["nightHours"].as<std::string>();
        }
        if (vm.count("anomalies") > 0) {
            options.s_AnomaliesFileName = vm["anomalies"].as<std::string>();
        }
        if (vm.count("dailyStats") > 0) {
            options.s_DailyStatsFileName = vm["dailyStats"].as<std::string>();
        }
        if (vm.count("report") > 0) {
            options.s_Report = true;
        }
        if (vm.count("facility") > 0) {
            options.s_Facility = vm["facility"].as<std::string>();
            options.s_Report = true;
        }
        if (vm.count("logFile") > 0) {
            options.s_LogFile = vm["logFile"].as<std::string>();
        }
        if (vm.count("logProperties") > 0) {
            options.s_LogProperties = vm["logProperties"].as<std::string>();
        }
        if (vm.count("logLevel") > 0) {
            options.s_LogLevel = vm["logLevel"].as<core::CLogger::ELevel>();
        }
    } catch (std::exception& e) {
        std::cerr << "Error processing command line: " << e.what() << std::endl;
        return false;
    }

    return true;
}
}
}
