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
#ifndef INCLUDED_ecosense_api_CSustainabilityReportWriter_h
#define INCLUDED_ecosense_api_CSustainabilityReportWriter_h

#include <core/CoreTypes.h>

#include <api/ImportExport.h>

#include <iosfwd>
#include <string>

namespace ecosense {
namespace analysis {
class CAnalysisResult;
}
namespace api {

//! \brief
//! Writes the plain text sustainability report.
//!
//! DESCRIPTION:\n
//! <pre>
//! ==================================================
//! SUSTAINABILITY ANALYSIS REPORT
//! ==================================================
//! Facility: All Facilities
//! Resource Type: ELECTRICITY
//! Analysis Date: 2024-03-01 17:45:02
//!
//! Anomalies Detected: 10
//! Alert Threshold: 100.00
//! Trend: DECREASING
//! ==================================================
//! </pre>
//!
//! For a single facility the anomaly count and trend are that facility's
//! own, and the threshold is still the one computed over all facilities.
//!
class API_EXPORT CSustainabilityReportWriter {
public:
    //! Facility name shown when reporting on the whole data set.
    static const std::string ALL_FACILITIES;

public:
    explicit CSustainabilityReportWriter(std::ostream& strmOut);

    //! Write the report for every facility in \p result.
    bool write(const analysis::CAnalysisResult& result);

    //! Write the report for \p facility.  Fails if \p result has no
    //! records for it.
    bool write(const analysis::CAnalysisResult& result, const std::string& facility);

    //! Build the report text, dated \p analysisTime.  An empty \p facility
    //! means all facilities.
    static bool report(const analysis::CAnalysisResult& result,
                       const std::string& facility,
                       core_t::TTime analysisTime,
                       std::string& text);

private:
    std::ostream& m_StrmOut;
};
}
}

#endif // INCLUDED_ecosense_api_CSustainabilityReportWriter_h
