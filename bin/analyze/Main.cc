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
//! \brief
//! Analyzes the electricity or water consumption of a set of facilities.
//!
//! DESCRIPTION:\n
//! Expects a CSV file of consumption readings, with a header row, on
//! STDIN or in the file named by --input.  Writes the analysis as JSON
//! to STDOUT or the file named by --output, optionally followed by the
//! sustainability report.  The anomalous records and per day statistics
//! can also be written to CSV files.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Standalone program.
//!
#include <core/CLogger.h>
#include <core/CoreTypes.h>

#include <analysis/CAnalysisErrors.h>
#include <analysis/CAnalyzerConfig.h>
#include <analysis/CDailyStatistics.h>
#include <analysis/CRawTable.h>
#include <analysis/CResourceAnalyzer.h>

#include <api/CAnalysisJsonWriter.h>
#include <api/CAnomalyCsvWriter.h>
#include <api/CCsvInputParser.h>
#include <api/CDailyStatisticsCsvWriter.h>
#include <api/CIoManager.h>
#include <api/CSustainabilityReportWriter.h>

#include "CCmdLineParser.h"

#include <boost/optional.hpp>

#include <string>

#include <stdlib.h>

int main(int argc, char** argv) {
    // Read command line options
    ecosense::analyze::CCmdLineParser::SOptions options;
    if (ecosense::analyze::CCmdLineParser::parse(argc, argv, options) == false) {
        return EXIT_FAILURE;
    }

    // Construct the IO manager before reconfiguring the logger, as it performs
    // std::ios actions that only work before first use
    ecosense::api::CIoManager ioMgr{options.s_InputFileName, options.s_OutputFileName};

    if (ecosense::core::CLogger::instance().reconfigure(options.s_LogFile,
                                                        options.s_LogProperties) == false) {
        LOG_FATAL(<< "Could not reconfigure logging");
        return EXIT_FAILURE;
    }
    if (options.s_LogLevel &&
        ecosense::core::CLogger::instance().setLoggingLevel(*options.s_LogLevel) == false) {
        LOG_FATAL(<< "Could not set logging level");
        return EXIT_FAILURE;
    }

    ecosense::analysis::CAnalyzerConfig config{ecosense::analysis::CAnalyzerConfig::defaultConfig()};
    if (!options.s_ConfigFile.empty() && config.init(options.s_ConfigFile) == false) {
        LOG_FATAL(<< "Analysis config file '" << options.s_ConfigFile << "' could not be loaded");
        return EXIT_FAILURE;
    }
    if (options.s_Percentile && config.anomalyPercentile(*options.s_Percentile) == false) {
        LOG_FATAL(<< "Invalid anomaly percentile " << *options.s_Percentile);
        return EXIT_FAILURE;
    }
    if (!options.s_NightHours.empty()) {
        ecosense::analysis::CAnalyzerConfig::TIntSet nightHours;
        if (ecosense::analysis::CAnalyzerConfig::parseNightHours(options.s_NightHours,
                                                                 nightHours) == false ||
            config.nightHours(nightHours) == false) {
            LOG_FATAL(<< "Invalid night-time hours '" << options.s_NightHours << "'");
            return EXIT_FAILURE;
        }
    }
    LOG_DEBUG(<< "Using " << config.print());

    if (ioMgr.initIo() == false) {
        LOG_FATAL(<< "Failed to initialise IO");
        return EXIT_FAILURE;
    }

    ecosense::analysis::CRawTable table;
    ecosense::api::CCsvInputParser inputParser{ioMgr.inputStream()};
    if (inputParser.readStreamIntoTable(table) == false) {
        LOG_FATAL(<< "Failed to read CSV input");
        return EXIT_FAILURE;
    }

    const ecosense::analysis::CResourceAnalyzer analyzer{
        options.s_Resource == "water"
            ? ecosense::analysis::CResourceAnalyzer::water(config)
            : ecosense::analysis::CResourceAnalyzer::electricity(config)};

    // The empty data set is a normal result, but bad data isn't
    using TOptionalAnalysisResult = boost::optional<ecosense::analysis::CAnalysisResult>;
    const TOptionalAnalysisResult analysis{[&analyzer, &table]() -> TOptionalAnalysisResult {
        try {
            return analyzer.analyze(table);
        } catch (const ecosense::analysis::CAnalysisError& e) {
            LOG_ERROR(<< "Failed to analyze " << analyzer.resource().name()
                      << " consumption: " << e.what());
        }
        return boost::none;
    }()};
    if (!analysis) {
        LOG_FATAL(<< "Analysis failed");
        return EXIT_FAILURE;
    }
    const ecosense::analysis::CAnalysisResult& result{*analysis};

    ecosense::api::CAnalysisJsonWriter jsonWriter{ioMgr.outputStream()};
    if (jsonWriter.write(result) == false) {
        LOG_FATAL(<< "Failed to write results");
        return EXIT_FAILURE;
    }

    if (options.s_Report) {
        if (result.isError()) {
            LOG_WARN(<< "No sustainability report: " << result.errorReason());
        } else {
            ecosense::api::CSustainabilityReportWriter reportWriter{ioMgr.outputStream()};
            if (reportWriter.write(result, options.s_Facility) == false) {
                LOG_FATAL(<< "Failed to write sustainability report");
                return EXIT_FAILURE;
            }
        }
    }

    if (!options.s_AnomaliesFileName.empty()) {
        ecosense::api::CIoManager::TOStreamP strm{
            ecosense::api::CIoManager::openOutputFile(options.s_AnomaliesFileName)};
        if (strm == nullptr) {
            LOG_FATAL(<< "Failed to open anomalies file");
            return EXIT_FAILURE;
        }
        ecosense::api::CAnomalyCsvWriter anomalyWriter{*strm};
        if (anomalyWriter.write(result) == false) {
            LOG_FATAL(<< "Failed to write anomalies to " << options.s_AnomaliesFileName);
            return EXIT_FAILURE;
        }
    }

    if (!options.s_DailyStatsFileName.empty()) {
        ecosense::api::CIoManager::TOStreamP strm{
            ecosense::api::CIoManager::openOutputFile(options.s_DailyStatsFileName)};
        if (strm == nullptr) {
            LOG_FATAL(<< "Failed to open daily statistics file");
            return EXIT_FAILURE;
        }
        ecosense::api::CDailyStatisticsCsvWriter dailyWriter{*strm};
        if (dailyWriter.write(result.isError()
                                  ? ecosense::analysis::CDailyStatistics::TDayVec{}
                                  : ecosense::analysis::CDailyStatistics::compute(
                                        result.records())) == false) {
            LOG_FATAL(<< "Failed to write daily statistics to " << options.s_DailyStatsFileName);
            return EXIT_FAILURE;
        }
    }

    // This message makes it easier to spot process crashes in a log file - if
    // this isn't present in the log for a given PID and there's no other log
    // message indicating early exit then the process has probably core dumped
    LOG_DEBUG(<< "EcoSense analyze exiting");

    return EXIT_SUCCESS;
}
