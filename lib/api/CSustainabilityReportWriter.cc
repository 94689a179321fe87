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
#include <api/CSustainabilityReportWriter.h>

#include <core/CLogger.h>
#include <core/CStringUtils.h>
#include <core/CTimeUtils.h>

#include <analysis/CAnalysisResult.h>
#include <analysis/CTrendEstimator.h>

#include <ostream>
#include <sstream>

namespace ecosense {
namespace api {
namespace {
const std::string RULE(50, '=');
}

// Initialise statics
const std::string CSustainabilityReportWriter::ALL_FACILITIES{"All Facilities"};

CSustainabilityReportWriter::CSustainabilityReportWriter(std::ostream& strmOut)
    : m_StrmOut{strmOut} {
}

bool CSustainabilityReportWriter::write(const analysis::CAnalysisResult& result) {
    return this->write(result, std::string{});
}

bool CSustainabilityReportWriter::write(const analysis::CAnalysisResult& result,
                                        const std::string& facility) {
    std::string text;
    if (report(result, facility, core::CTimeUtils::now(), text) == false) {
        return false;
    }
    m_StrmOut << text;
    m_StrmOut.flush();
    if (m_StrmOut.good() == false) {
        LOG_ERROR(<< "Failed to write sustainability report");
        return false;
    }
    return true;
}

bool CSustainabilityReportWriter::report(const analysis::CAnalysisResult& result,
                                         const std::string& facility,
                                         core_t::TTime analysisTime,
                                         std::string& text) {
    if (result.isError()) {
        LOG_ERROR(<< "Can't report on a failed analysis: " << result.errorReason());
        return false;
    }

    std::size_t anomalies{result.anomaliesDetected()};
    analysis_t::ETrend trend{result.trend()};

    if (facility.empty() == false) {
        auto rollup = result.facilities().find(facility);
        if (rollup == result.facilities().end()) {
            LOG_ERROR(<< "No " << result.resource().name() << " data for facility '"
                      << facility << "'");
            return false;
        }
        anomalies = rollup->second.s_AnomalyCount;

        analysis::CTrendEstimator::TDoubleVec series;
        for (const auto& record : result.records()) {
            if (record.facility() == facility) {
                series.push_back(record.value());
            }
        }
        trend = analysis::CTrendEstimator::estimate(series);
    }

    std::ostringstream strm;
    strm << RULE << core_t::LINE_ENDING
         << "SUSTAINABILITY ANALYSIS REPORT" << core_t::LINE_ENDING
         << RULE << core_t::LINE_ENDING
         << "Facility: " << (facility.empty() ? ALL_FACILITIES : facility) << core_t::LINE_ENDING
         << "Resource Type: " << core::CStringUtils::toUpper(result.resource().name())
         << core_t::LINE_ENDING
         << "Analysis Date: " << core::CTimeUtils::toLocalString(analysisTime)
         << core_t::LINE_ENDING << core_t::LINE_ENDING
         << "Anomalies Detected: " << anomalies << core_t::LINE_ENDING
         << "Alert Threshold: "
         << core::CStringUtils::typeToStringFixed(result.anomalyThreshold(), 2)
         << core_t::LINE_ENDING
         << "Trend: " << core::CStringUtils::toUpper(analysis_t::print(trend))
         << core_t::LINE_ENDING << RULE << core_t::LINE_ENDING;
    text = strm.str();

    return true;
}
}
}
