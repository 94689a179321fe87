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
#include <analysis/CAnalysisResult.h>

#include <core/CLogger.h>

#include <maths/CBasicStatistics.h>

namespace ecosense {
namespace analysis {
namespace {
const std::string EMPTY_STRING;
}

// Initialise statics
const std::string CAnalysisResult::NO_DATA_REASON{"No data available"};

CAnalysisResult::CAnalysisResult(CResourceType resource,
                                 double threshold,
                                 analysis_t::ETrend trend,
                                 TStrFacilityRollupMap facilities,
                                 TIssueReport issues,
                                 TConsumptionRecordVec records)
    : m_Resource{std::move(resource)}, m_AnomalyThreshold{threshold}, m_Trend{trend},
      m_Facilities{std::move(facilities)}, m_Issues{std::move(issues)},
      m_Records{std::move(records)} {

    maths::CBasicStatistics::CMinMax range;
    for (const auto& record : m_Records) {
        m_TotalConsumption += record.value();
        range.add(record.value());
        if (record.isNightTime()) {
            m_NightConsumption += record.value();
        }
        if (record.isAnomaly()) {
            ++m_AnomaliesDetected;
        }
    }
    if (m_Records.empty() == false) {
        m_AverageConsumption = m_TotalConsumption / static_cast<double>(m_Records.size());
        m_PeakConsumption = range.max();
    }
}

CAnalysisResult::CAnalysisResult(CResourceType resource, std::string reason)
    : m_Resource{std::move(resource)}, m_ErrorReason{std::move(reason)} {
}

CAnalysisResult CAnalysisResult::error(CResourceType resource, std::string reason) {
    return CAnalysisResult{std::move(resource), std::move(reason)};
}

const CResourceType& CAnalysisResult::resource() const {
    return m_Resource;
}

bool CAnalysisResult::isError() const {
    return m_ErrorReason.is_initialized();
}

const std::string& CAnalysisResult::errorReason() const {
    return m_ErrorReason ? *m_ErrorReason : EMPTY_STRING;
}

double CAnalysisResult::totalConsumption() const {
    this->checkNotError();
    return m_TotalConsumption;
}

double CAnalysisResult::averageConsumption() const {
    this->checkNotError();
    return m_AverageConsumption;
}

double CAnalysisResult::peakConsumption() const {
    this->checkNotError();
    return m_PeakConsumption;
}

double CAnalysisResult::nightConsumption() const {
    this->checkNotError();
    return m_NightConsumption;
}

std::size_t CAnalysisResult::anomaliesDetected() const {
    this->checkNotError();
    return m_AnomaliesDetected;
}

double CAnalysisResult::anomalyThreshold() const {
    this->checkNotError();
    return m_AnomalyThreshold;
}

double CAnalysisResult::anomalyPercentage() const {
    this->checkNotError();
    if (m_Records.empty()) {
        return 0.0;
    }
    return static_cast<double>(m_AnomaliesDetected) / static_cast<double>(m_Records.size()) * 100.0;
}

analysis_t::ETrend CAnalysisResult::trend() const {
    this->checkNotError();
    return m_Trend;
}

const TStrFacilityRollupMap& CAnalysisResult::facilities() const {
    this->checkNotError();
    return m_Facilities;
}

const TIssueReport& CAnalysisResult::issues() const {
    this->checkNotError();
    return m_Issues;
}

const TConsumptionRecordVec& CAnalysisResult::records() const {
    this->checkNotError();
    return m_Records;
}

void CAnalysisResult::checkNotError() const {
    if (m_ErrorReason) {
        LOG_ABORT(<< "Statistics requested from an error result: " << *m_ErrorReason);
    }
}
}
}
