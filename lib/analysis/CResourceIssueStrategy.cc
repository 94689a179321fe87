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
#include <analysis/CResourceIssueStrategy.h>

#include <core/CLogger.h>

#include <map>

namespace ecosense {
namespace analysis {

// Initialise statics
const std::size_t CNightIdleStrategy::HIGH_SEVERITY_COUNT{10};
const std::size_t CNightIdleStrategy::MEDIUM_SEVERITY_COUNT{5};
const std::size_t CLeakRiskStrategy::AT_RISK_ANOMALY_COUNT{5};

TIssueReport CNightIdleStrategy::detect(const TConsumptionRecordVec& records, double threshold) const {
    SNightIdleReport report;

    double total{0.0};
    double night{0.0};
    for (const auto& record : records) {
        total += record.value();
        if (record.isNightTime()) {
            night += record.value();
            if (record.value() > threshold) {
                ++report.s_HighNightConsumptionCount;
            }
        }
    }

    report.s_NightConsumptionPercentage = total > 0.0 ? night / total * 100.0 : 0.0;
    report.s_IssueSeverity = severity(report.s_HighNightConsumptionCount);

    LOG_DEBUG(<< report.s_HighNightConsumptionCount << " high night-time records, severity "
              << report.s_IssueSeverity);

    return report;
}

std::string CNightIdleStrategy::description() const {
    return "night idle";
}

analysis_t::EIssueSeverity CNightIdleStrategy::severity(std::size_t count) {
    if (count > HIGH_SEVERITY_COUNT) {
        return analysis_t::E_High;
    }
    if (count > MEDIUM_SEVERITY_COUNT) {
        return analysis_t::E_Medium;
    }
    return analysis_t::E_Low;
}

TIssueReport CLeakRiskStrategy::detect(const TConsumptionRecordVec& records, double /*threshold*/) const {
    SLeakRiskReport report;

    std::map<std::string, std::size_t> anomaliesByFacility;
    for (const auto& record : records) {
        if (record.isAnomaly()) {
            ++report.s_HighAnomalyCount;
            ++anomaliesByFacility[record.facility()];
        }
    }

    for (const auto& facility : anomaliesByFacility) {
        if (facility.second > AT_RISK_ANOMALY_COUNT) {
            report.s_FacilitiesAtRisk.push_back(facility.first);
        }
    }
    report.s_LeakProbability = report.s_FacilitiesAtRisk.empty() ? analysis_t::E_Low
                                                                 : analysis_t::E_High;

    LOG_DEBUG(<< report.s_FacilitiesAtRisk.size() << " facilities at risk of leaks, probability "
              << report.s_LeakProbability);

    return report;
}

std::string CLeakRiskStrategy::description() const {
    return "leak risk";
}
}
}
