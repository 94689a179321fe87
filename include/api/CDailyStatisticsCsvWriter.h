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
#ifndef INCLUDED_ecosense_api_CDailyStatisticsCsvWriter_h
#define INCLUDED_ecosense_api_CDailyStatisticsCsvWriter_h

#include <analysis/CDailyStatistics.h>

#include <api/CCsvOutputWriter.h>
#include <api/ImportExport.h>

#include <iosfwd>

namespace ecosense {
namespace api {

//! \brief
//! Writes per day consumption statistics as CSV.
//!
//! DESCRIPTION:\n
//! Columns are date, count, sum, mean, min, max and std.  The standard
//! deviation is left empty for days with a single reading.
//!
class API_EXPORT CDailyStatisticsCsvWriter {
public:
    explicit CDailyStatisticsCsvWriter(std::ostream& strmOut);

    bool write(const analysis::CDailyStatistics::TDayVec& days);

private:
    CCsvOutputWriter m_Writer;
};
}
}

#endif // INCLUDED_ecosense_api_CDailyStatisticsCsvWriter_h
