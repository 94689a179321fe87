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
#include <analysis/CAnomalyDetector.h>

#include <core/CLogger.h>

#include <maths/CBasicStatistics.h>

#include <analysis/CAnalysisErrors.h>

#include <sstream>

namespace ecosense {
namespace analysis {

CAnomalyDetector::CAnomalyDetector(double percentile) : m_Percentile{percentile} {
}

double CAnomalyDetector::detect(TConsumptionRecordVec& records) const {
    if (records.empty()) {
        throw CEmptyDatasetError{"No records to detect anomalies in"};
    }
    if (!(m_Percentile >= 0.0 && m_Percentile <= 100.0)) {
        std::ostringstream message;
        message << "Anomaly percentile " << m_Percentile << " is outside [0, 100]";
        throw CDomainError{message.str()};
    }

    maths::CBasicStatistics::TDoubleVec values;
    values.reserve(records.size());
    maths::CBasicStatistics::TMeanVarAccumulator moments;
    for (const auto& record : records) {
        values.push_back(record.value());
        moments.add(record.value());
    }

    double threshold{0.0};
    if (maths::CBasicStatistics::percentile(std::move(values), m_Percentile, threshold) == false) {
        throw CDomainError{"Failed to compute the anomaly threshold"};
    }

    double mean{moments.mean()};
    double sd{moments.standardDeviation()};
    LOG_DEBUG(<< "Anomaly threshold " << threshold << " at percentile " << m_Percentile
              << ", moments " << moments.print());

    std::size_t anomalies{0};
    for (auto& record : records) {
        double severity{0.0};
        if (sd > 0.0) {
            severity = (record.value() - mean) / sd;
        } else if (record.value() != mean) {
            std::ostringstream message;
            message << "Severity of " << record.value() << " is undefined for a series with mean "
                    << mean << " and zero standard deviation";
            throw CDomainError{message.str()};
        }
        bool isAnomaly{record.value() > threshold};
        anomalies += isAnomaly ? 1 : 0;
        record.flagAnomaly(isAnomaly, severity);
    }

    LOG_DEBUG(<< anomalies << " of " << records.size() << " records are anomalous");

    return threshold;
}

double CAnomalyDetector::percentile() const {
    return m_Percentile;
}
}
}
