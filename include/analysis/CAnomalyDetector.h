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
#ifndef INCLUDED_ecosense_analysis_CAnomalyDetector_h
#define INCLUDED_ecosense_analysis_CAnomalyDetector_h

#include <analysis/CConsumptionRecord.h>
#include <analysis/ImportExport.h>

namespace ecosense {
namespace analysis {

//! \brief
//! Flags the records whose value is above a percentile of the record set.
//!
//! DESCRIPTION:\n
//! The threshold is the linearly interpolated p'th percentile of the
//! values.  A record is anomalous if its value is strictly greater than
//! the threshold, so a value equal to the threshold never is.
//!
//! Every record, anomalous or not, also gets a severity, which is the
//! standard score of its value: the difference from the mean in units
//! of the sample standard deviation.  This is neither clipped nor made
//! positive, so it can be used to rank records.
//!
//! IMPLEMENTATION DECISIONS:\n
//! If the standard deviation is zero the standard score is only defined
//! for values equal to the mean, where it is zero.  Since the mean and
//! standard deviation are computed with recurrence relations a constant
//! series gets exactly zero spread and a mean exactly equal to its value,
//! so the undefined case can only be reached through rounding and is
//! reported as a CDomainError rather than a NaN.
//!
class ANALYSIS_EXPORT CAnomalyDetector {
public:
    explicit CAnomalyDetector(double percentile);

    //! Set the anomaly flags of every record and return the threshold.
    //!
    //! \throws CEmptyDatasetError if \p records is empty.
    //! \throws CDomainError if the percentile is outside [0, 100] or a
    //! severity is undefined.
    double detect(TConsumptionRecordVec& records) const;

    double percentile() const;

private:
    double m_Percentile;
};
}
}

#endif // INCLUDED_ecosense_analysis_CAnomalyDetector_h
