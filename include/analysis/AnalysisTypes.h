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
#ifndef INCLUDED_ecosense_analysis_AnalysisTypes_h
#define INCLUDED_ecosense_analysis_AnalysisTypes_h

#include <analysis/ImportExport.h>

#include <iosfwd>
#include <string>

namespace ecosense {
namespace analysis_t {

//! Enumeration of the directions a consumption series can move in.
enum ETrend { E_Increasing, E_Decreasing, E_Stable, E_InsufficientData };

//! Get a string for the trend.
ANALYSIS_EXPORT
const std::string& print(ETrend trend);

//! Write the trend to a stream.
ANALYSIS_EXPORT
std::ostream& operator<<(std::ostream& o, ETrend trend);

//! Enumeration of the labels attached to resource specific issues,
//! used both for night idle severity and leak probability.
enum EIssueSeverity { E_Low, E_Medium, E_High };

//! Get a string for the severity.
ANALYSIS_EXPORT
const std::string& print(EIssueSeverity severity);

//! Write the severity to a stream.
ANALYSIS_EXPORT
std::ostream& operator<<(std::ostream& o, EIssueSeverity severity);
}
}

#endif // INCLUDED_ecosense_analysis_AnalysisTypes_h
