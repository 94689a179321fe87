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
#ifndef INCLUDED_ecosense_analysis_CAnalysisErrors_h
#define INCLUDED_ecosense_analysis_CAnalysisErrors_h

#include <stdexcept>
#include <string>

namespace ecosense {
namespace analysis {

//! \brief
//! Base of the errors that stop an analysis producing a result.
//!
//! DESCRIPTION:\n
//! Data problems are reported by throwing one of the derived classes.
//! Only CEmptyDatasetError is turned into a result, by the resource
//! analyzer, so callers that render results can show a message for an
//! empty table without having to catch anything.
//!
class CAnalysisError : public std::runtime_error {
public:
    explicit CAnalysisError(const std::string& message)
        : std::runtime_error{message} {}
};

//! \brief There are no rows to analyze.
class CEmptyDatasetError : public CAnalysisError {
public:
    explicit CEmptyDatasetError(const std::string& message)
        : CAnalysisError{message} {}
};

//! \brief A statistic is not defined for the data, for example the
//! standard score of a value in a series with zero spread.
class CDomainError : public CAnalysisError {
public:
    explicit CDomainError(const std::string& message)
        : CAnalysisError{message} {}
};

//! \brief A required column is missing or one of its values can't be
//! interpreted.
class CSchemaError : public CAnalysisError {
public:
    explicit CSchemaError(const std::string& message)
        : CAnalysisError{message} {}
};
}
}

#endif // INCLUDED_ecosense_analysis_CAnalysisErrors_h
