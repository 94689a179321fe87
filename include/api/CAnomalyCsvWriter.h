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
#ifndef INCLUDED_ecosense_api_CAnomalyCsvWriter_h
#define INCLUDED_ecosense_api_CAnomalyCsvWriter_h

#include <api/CCsvOutputWriter.h>
#include <api/ImportExport.h>

#include <iosfwd>

namespace ecosense {
namespace analysis {
class CAnalysisResult;
}
namespace api {

//! \brief
//! Writes the anomalous records of an analysis as CSV.
//!
//! DESCRIPTION:\n
//! Columns are date, facility, the resource's value column, hour,
//! anomaly_severity and is_night_time.  Rows are in descending order of
//! value, ties in input order.  The date is written in UTC as
//! YYYY-MM-DD HH:MM:SS and the severity to 2 decimal places.
//!
class API_EXPORT CAnomalyCsvWriter {
public:
    explicit CAnomalyCsvWriter(std::ostream& strmOut);

    //! Write the header and one row per anomaly.  Nothing is written for
    //! an error result.
    bool write(const analysis::CAnalysisResult& result);

private:
    CCsvOutputWriter m_Writer;
};
}
}

#endif // INCLUDED_ecosense_api_CAnomalyCsvWriter_h
