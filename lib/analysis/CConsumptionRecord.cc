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
#include <analysis/CConsumptionRecord.h>

#include <core/CLogger.h>

namespace ecosense {
namespace analysis {

CConsumptionRecord::CConsumptionRecord(core_t::TTime time, int hour, std::string facility, double value)
    : m_Time{time}, m_Hour{hour}, m_Facility{std::move(facility)}, m_Value{value} {
}

core_t::TTime CConsumptionRecord::time() const {
    return m_Time;
}

int CConsumptionRecord::hour() const {
    return m_Hour;
}

const std::string& CConsumptionRecord::facility() const {
    return m_Facility;
}

double CConsumptionRecord::value() const {
    return m_Value;
}

void CConsumptionRecord::flagAnomaly(bool isAnomaly, double severity) {
    m_IsAnomaly = isAnomaly;
    m_AnomalySeverity = severity;
}

void CConsumptionRecord::flagNightTime(bool isNightTime) {
    m_IsNightTime = isNightTime;
}

bool CConsumptionRecord::hasAnomalyFlags() const {
    return m_IsAnomaly.is_initialized();
}

bool CConsumptionRecord::hasNightTimeFlag() const {
    return m_IsNightTime.is_initialized();
}

bool CConsumptionRecord::isAnomaly() const {
    if (!m_IsAnomaly) {
        LOG_ABORT(<< "Anomaly flag read for " << m_Facility << " before detection ran");
    }
    return *m_IsAnomaly;
}

double CConsumptionRecord::anomalySeverity() const {
    if (!m_AnomalySeverity) {
        LOG_ABORT(<< "Anomaly severity read for " << m_Facility << " before detection ran");
    }
    return *m_AnomalySeverity;
}

bool CConsumptionRecord::isNightTime() const {
    if (!m_IsNightTime) {
        LOG_ABORT(<< "Night-time flag read for " << m_Facility << " before classification ran");
    }
    return *m_IsNightTime;
}
}
}
