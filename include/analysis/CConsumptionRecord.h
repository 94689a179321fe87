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
#ifndef INCLUDED_ecosense_analysis_CConsumptionRecord_h
#define INCLUDED_ecosense_analysis_CConsumptionRecord_h

#include <core/CoreTypes.h>

#include <analysis/ImportExport.h>

#include <boost/optional.hpp>

#include <string>
#include <vector>

namespace ecosense {
namespace analysis {

//! \brief
//! One normalized consumption reading.
//!
//! DESCRIPTION:\n
//! The time, hour of day, facility and consumption value of a row of the
//! input table, plus the flags attached by the anomaly detector and the
//! night-time classifier.
//!
//! IMPLEMENTATION DECISIONS:\n
//! The flags depend on the whole record set, for example the anomaly
//! threshold, so they are unset until the detector that owns them has
//! run over every record.  Reading a flag before then is a programming
//! error and aborts.
//!
class ANALYSIS_EXPORT CConsumptionRecord {
public:
    CConsumptionRecord(core_t::TTime time, int hour, std::string facility, double value);

    core_t::TTime time() const;
    int hour() const;
    const std::string& facility() const;
    double value() const;

    //! Set the anomaly flag and standard score.
    void flagAnomaly(bool isAnomaly, double severity);

    //! Set the night-time flag.
    void flagNightTime(bool isNightTime);

    //! Has flagAnomaly() been called?
    bool hasAnomalyFlags() const;

    //! Has flagNightTime() been called?
    bool hasNightTimeFlag() const;

    //! Is the value above the anomaly threshold?
    bool isAnomaly() const;

    //! The standard score of the value within its record set.
    double anomalySeverity() const;

    //! Is the hour in the night-time window?
    bool isNightTime() const;

private:
    core_t::TTime m_Time;
    int m_Hour;
    std::string m_Facility;
    double m_Value;
    boost::optional<bool> m_IsAnomaly;
    boost::optional<double> m_AnomalySeverity;
    boost::optional<bool> m_IsNightTime;
};

using TConsumptionRecordVec = std::vector<CConsumptionRecord>;
}
}

#endif // INCLUDED_ecosense_analysis_CConsumptionRecord_h
