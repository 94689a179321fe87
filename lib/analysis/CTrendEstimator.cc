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
#include <analysis/CTrendEstimator.h>

#include <core/CLogger.h>

#include <maths/CBasicStatistics.h>

namespace ecosense {
namespace analysis {

// Initialise statics
const double CTrendEstimator::CHANGE_PERCENTAGE{5.0};

analysis_t::ETrend CTrendEstimator::estimate(const TDoubleVec& series) {
    if (series.size() < 2) {
        return analysis_t::E_InsufficientData;
    }

    double change{changePercentage(series)};
    LOG_TRACE(<< "Second half changed by " << change << "%");

    if (change > CHANGE_PERCENTAGE) {
        return analysis_t::E_Increasing;
    }
    if (change < -CHANGE_PERCENTAGE) {
        return analysis_t::E_Decreasing;
    }
    return analysis_t::E_Stable;
}

analysis_t::ETrend CTrendEstimator::estimate(const TConsumptionRecordVec& records) {
    TDoubleVec series;
    series.reserve(records.size());
    for (const auto& record : records) {
        series.push_back(record.value());
    }
    return estimate(series);
}

double CTrendEstimator::changePercentage(const TDoubleVec& series) {
    if (series.size() < 2) {
        return 0.0;
    }
    auto middle = series.begin() + series.size() / 2;
    double firstMean{maths::CBasicStatistics::mean(TDoubleVec(series.begin(), middle))};
    double secondMean{maths::CBasicStatistics::mean(TDoubleVec(middle, series.end()))};
    if (firstMean == 0.0) {
        return 0.0;
    }
    return (secondMean - firstMean) / firstMean * 100.0;
}
}
}
