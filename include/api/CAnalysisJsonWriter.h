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
#ifndef INCLUDED_ecosense_api_CAnalysisJsonWriter_h
#define INCLUDED_ecosense_api_CAnalysisJsonWriter_h

#include <api/ImportExport.h>

#include <boost/json.hpp>

#include <iosfwd>
#include <string>

namespace ecosense {
namespace analysis {
class CAnalysisResult;
}
namespace api {

//! \brief
//! Writes analysis results as JSON.
//!
//! DESCRIPTION:\n
//! One JSON document per result, followed by a newline.  For electricity:
//! <pre>
//! {"total_consumption_kwh": ..., "average_consumption_kwh": ...,
//!  "peak_consumption_kwh": ..., "night_consumption_kwh": ...,
//!  "anomalies_detected": ..., "anomaly_threshold": ...,
//!  "consumption_trend": "decreasing",
//!  "facility_analysis": {"Building A": {"total_kwh": ..., "avg_kwh": ..., "anomalies": ...}},
//!  "night_idle_issues": {"high_night_consumption_count": ...,
//!                        "night_consumption_percentage": ...,
//!                        "issue_severity": "MEDIUM"},
//!  "anomaly_percentage": ...}
//! </pre>
//! Water results use the "gallons" unit in the key names and report
//! "potential_leaks" instead of "night_idle_issues".  An error result is
//! written as {"error": "reason"}.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Consumption figures are rounded to 2 decimal places here and only
//! here.  The result object keeps full precision.
//!
class API_EXPORT CAnalysisJsonWriter {
public:
    //! Number of decimal places written for floating point figures.
    static const int DECIMAL_PLACES;

public:
    explicit CAnalysisJsonWriter(std::ostream& strmOut);

    CAnalysisJsonWriter(const CAnalysisJsonWriter&) = delete;
    CAnalysisJsonWriter& operator=(const CAnalysisJsonWriter&) = delete;

    //! Write \p result to the output stream.
    bool write(const analysis::CAnalysisResult& result);

    //! Get the JSON representation of \p result.
    static boost::json::object toJson(const analysis::CAnalysisResult& result);

    //! Round \p value to DECIMAL_PLACES decimal places.
    static double round(double value);

private:
    std::ostream& m_StrmOut;
};
}
}

#endif // INCLUDED_ecosense_api_CAnalysisJsonWriter_h
