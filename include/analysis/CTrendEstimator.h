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
#ifndef INCLUDED_ecosense_analysis_CTrendEstimator_h
#define INCLUDED_ecosense_analysis_CTrendEstimator_h

#include <analysis/AnalysisTypes.h>
#include <analysis/CConsumptionRecord.h>
#include <analysis/ImportExport.h>

#include <vector>

namespace ecosense {
namespace analysis {

//! \brief
//! Classifies the direction of a consumption series.
//!
//! DESCRIPTION:\n
//! Splits the series at index n / 2, so for odd n the first half is the
//! shorter, and compares the means of the two halves.  A change of more
//! than 5% of the first half's mean is increasing or decreasing, anything
//! else is stable.  Fewer than two values is insufficient data.
//!
//! A first half mean of zero is reported as stable: zero baseline
//! consumption has no discernible trend.
//!
//! IMPLEMENTATION DECISIONS:\n
//! The series is split in the order given.  The records are not sorted
//! by time first, so for a table that isn't in chronological order the
//! halves are not earlier and later readings.
//!
class ANALYSIS_EXPORT CTrendEstimator {
public:
    using TDoubleVec = std::vector<double>;

    //! The percentage change between the halves needed for a trend.
    static const double CHANGE_PERCENTAGE;

public:
    CTrendEstimator() = delete;

    static analysis_t::ETrend estimate(const TDoubleVec& series);

    //! Estimate the trend of the records' values in record order.
    static analysis_t::ETrend estimate(const TConsumptionRecordVec& records);

    //! The percentage change of the second half's mean relative to the
    //! first half's, or zero if the first half's mean is zero.
    static double changePercentage(const TDoubleVec& series);
};
}
}

#endif // INCLUDED_ecosense_analysis_CTrendEstimator_h
