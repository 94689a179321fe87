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
#ifndef INCLUDED_ecosense_analysis_CDailyStatistics_h
#define INCLUDED_ecosense_analysis_CDailyStatistics_h

#include <core/CoreTypes.h>

#include <analysis/CConsumptionRecord.h>
#include <analysis/ImportExport.h>

#include <boost/optional.hpp>

#include <vector>

namespace ecosense {
namespace analysis {

//! \brief
//! Summarises consumption per calendar day.
//!
//! DESCRIPTION:\n
//! Groups records by the UTC day of their time and computes the sum,
//! mean, minimum, maximum and sample standard deviation of each day's
//! values.  Days are returned in chronological order and days with no
//! records are omitted.
//!
class ANALYSIS_EXPORT CDailyStatistics {
public:
    //! \brief The statistics of one day.
    struct ANALYSIS_EXPORT SDay {
        //! Midnight at the start of the day.
        core_t::TTime s_Day{0};
        std::size_t s_Count{0};
        double s_Sum{0.0};
        double s_Mean{0.0};
        double s_Min{0.0};
        double s_Max{0.0};
        //! Undefined for a day with a single record.
        boost::optional<double> s_StandardDeviation;
    };

    using TDayVec = std::vector<SDay>;

public:
    CDailyStatistics() = delete;

    static TDayVec compute(const TConsumptionRecordVec& records);
};
}
}

#endif // INCLUDED_ecosense_analysis_CDailyStatistics_h
