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
#ifndef INCLUDED_ecosense_analysis_CNightTimeClassifier_h
#define INCLUDED_ecosense_analysis_CNightTimeClassifier_h

#include <analysis/CConsumptionRecord.h>
#include <analysis/ImportExport.h>

#include <set>

namespace ecosense {
namespace analysis {

//! \brief
//! Flags the records whose hour is in the night-time window.
//!
//! DESCRIPTION:\n
//! The window is a set of hours of the day, by default 22:00 to 05:59.
//! Classification only depends on a record's hour.
//!
class ANALYSIS_EXPORT CNightTimeClassifier {
public:
    using TIntSet = std::set<int>;

public:
    explicit CNightTimeClassifier(TIntSet nightHours = defaultNightHours());

    //! The hours 22, 23, 0, 1, 2, 3, 4 and 5.
    static TIntSet defaultNightHours();

    //! Is \p hour in the window?
    bool isNightTime(int hour) const;

    //! Set the night-time flag of every record.
    void classify(TConsumptionRecordVec& records) const;

    const TIntSet& nightHours() const;

private:
    TIntSet m_NightHours;
};
}
}

#endif // INCLUDED_ecosense_analysis_CNightTimeClassifier_h
