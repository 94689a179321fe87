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
#include <api/CAnalysisJsonWriter.h>

#include <core/CLogger.h>

#include <analysis/CAnalysisResult.h>

#include <cmath>
#include <cstdint>
#include <ostream>

namespace json = boost::json;

namespace ecosense {
namespace api {
namespace {

// JSON field names
const std::string ERROR_REASON{"error"};
const std::string ANOMALIES_DETECTED{"anomalies_detected"};
const std::string ANOMALY_THRESHOLD{"anomaly_threshold"};
const std::string CONSUMPTION_TREND{"consumption_trend"};
const std::string FACILITY_ANALYSIS{"facility_analysis"};
const std::string ANOMALIES{"anomalies"};
const std::string ANOMALY_PERCENTAGE{"anomaly_percentage"};
const std::string HIGH_NIGHT_CONSUMPTION_COUNT{"high_night_consumption_count"};
const std::string NIGHT_CONSUMPTION_PERCENTAGE{"night_consumption_percentage"};
const std::string ISSUE_SEVERITY{"issue_severity"};
const std::string HIGH_ANOMALY_COUNT{"high_anomaly_count"};
const std::string FACILITIES_AT_RISK{"facilities_at_risk"};
const std::string LEAK_PROBABILITY{"leak_probability"};
const std::string RECOMMENDED_INSPECTION{"recommended_inspection"};

std::int64_t toInt64(std::size_t count) {
    return static_cast<std::int64_t>(count);
}

json::array toArray(const analysis::SLeakRiskReport::TStrVec& strings) {
    json::array result;
    result.reserve(strings.size());
    for (const auto& s : strings) {
        result.emplace_back(s);
    }
    return result;
}

//! Converts whichever issue report the result holds to JSON.
class CIssueReportJsonVisitor : public boost::static_visitor<json::object> {
public:
    json::object operator()(const analysis::SNightIdleReport& report) const {
        json::object result;
        result[HIGH_NIGHT_CONSUMPTION_COUNT] = toInt64(report.s_HighNightConsumptionCount);
        result[NIGHT_CONSUMPTION_PERCENTAGE] =
            CAnalysisJsonWriter::round(report.s_NightConsumptionPercentage);
        result[ISSUE_SEVERITY] = analysis_t::print(report.s_IssueSeverity);
        return result;
    }

    json::object operator()(const analysis::SLeakRiskReport& report) const {
        json::object result;
        result[HIGH_ANOMALY_COUNT] = toInt64(report.s_HighAnomalyCount);
        result[FACILITIES_AT_RISK] = toArray(report.s_FacilitiesAtRisk);
        result[LEAK_PROBABILITY] = analysis_t::print(report.s_LeakProbability);
        result[RECOMMENDED_INSPECTION] = toArray(report.s_FacilitiesAtRisk);
        return result;
    }
};
}

// Initialise statics
const int CAnalysisJsonWriter::DECIMAL_PLACES{2};

CAnalysisJsonWriter::CAnalysisJsonWriter(std::ostream& strmOut) : m_StrmOut{strmOut} {
}

bool CAnalysisJsonWriter::write(const analysis::CAnalysisResult& result) {
    m_StrmOut << json::serialize(toJson(result)) << '\n';
    m_StrmOut.flush();
    if (m_StrmOut.good() == false) {
        LOG_ERROR(<< "Failed to write " << result.resource().name() << " analysis result");
        return false;
    }
    return true;
}

json::object CAnalysisJsonWriter::toJson(const analysis::CAnalysisResult& result) {
    json::object doc;

    if (result.isError()) {
        doc[ERROR_REASON] = result.errorReason();
        return doc;
    }

    const analysis::CResourceType& resource{result.resource()};

    doc[resource.unitKey("total_consumption")] = round(result.totalConsumption());
    doc[resource.unitKey("average_consumption")] = round(result.averageConsumption());
    doc[resource.unitKey("peak_consumption")] = round(result.peakConsumption());
    doc[resource.unitKey("night_consumption")] = round(result.nightConsumption());
    doc[ANOMALIES_DETECTED] = toInt64(result.anomaliesDetected());
    doc[ANOMALY_THRESHOLD] = round(result.anomalyThreshold());
    doc[CONSUMPTION_TREND] = analysis_t::print(result.trend());

    json::object facilities;
    for (const auto& facility : result.facilities()) {
        json::object rollup;
        rollup[resource.unitKey("total")] = round(facility.second.s_Total);
        rollup[resource.unitKey("avg")] = round(facility.second.s_Average);
        rollup[ANOMALIES] = toInt64(facility.second.s_AnomalyCount);
        facilities[facility.first] = std::move(rollup);
    }
    doc[FACILITY_ANALYSIS] = std::move(facilities);

    doc[resource.issueReportName()] =
        boost::apply_visitor(CIssueReportJsonVisitor{}, result.issues());

    doc[ANOMALY_PERCENTAGE] = round(result.anomalyPercentage());

    return doc;
}

double CAnalysisJsonWriter::round(double value) {
    static const double SCALE{std::pow(10.0, DECIMAL_PLACES)};
    return std::round(value * SCALE) / SCALE;
}
}
}
