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
#ifndef INCLUDED_ecosense_analysis_CResourceIssueStrategy_h
#define INCLUDED_ecosense_analysis_CResourceIssueStrategy_h

#include <analysis/CConsumptionRecord.h>
#include <analysis/ImportExport.h>
#include <analysis/IssueReports.h>

#include <memory>
#include <string>

namespace ecosense {
namespace analysis {

//! \brief
//! Interface for detecting the issue specific to a resource.
//!
//! DESCRIPTION:\n
//! Each resource has its own policy for turning the flagged records into
//! an issue report, for example idle equipment for electricity and leaks
//! for water.  The policies look alike but are kept separate because what
//! they mean differs and they are expected to diverge.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Implementations have no state beyond their configuration and no side
//! effects, so one instance can be shared between analyzers.  The records
//! passed in must have been through both anomaly detection and night-time
//! classification.  Reading a flag that hasn't been set aborts.
//!
class ANALYSIS_EXPORT CResourceIssueStrategy {
public:
    virtual ~CResourceIssueStrategy() = default;

    //! Detect the issue in \p records, using the anomaly \p threshold.
    virtual TIssueReport detect(const TConsumptionRecordVec& records, double threshold) const = 0;

    //! A short name for logging.
    virtual std::string description() const = 0;
};

using TResourceIssueStrategyCPtr = std::shared_ptr<const CResourceIssueStrategy>;

//! \brief
//! Detects high electricity consumption during the night.
//!
//! DESCRIPTION:\n
//! Counts the night-time records above the anomaly threshold.  The
//! severity is HIGH for more than 10 of them, MEDIUM for more than 5
//! and otherwise LOW, regardless of how many records there are.
//!
class ANALYSIS_EXPORT CNightIdleStrategy : public CResourceIssueStrategy {
public:
    //! Counts above this are HIGH severity.
    static const std::size_t HIGH_SEVERITY_COUNT;
    //! Counts above this are at least MEDIUM severity.
    static const std::size_t MEDIUM_SEVERITY_COUNT;

public:
    TIssueReport detect(const TConsumptionRecordVec& records, double threshold) const override;
    std::string description() const override;

    //! The severity for \p count high night-time records.
    static analysis_t::EIssueSeverity severity(std::size_t count);
};

//! \brief
//! Detects facilities whose water consumption suggests a leak.
//!
//! DESCRIPTION:\n
//! Counts the anomalous records of each facility.  A facility with more
//! than 5 is at risk, and the leak probability is HIGH if any facility
//! is at risk and otherwise LOW.
//!
class ANALYSIS_EXPORT CLeakRiskStrategy : public CResourceIssueStrategy {
public:
    //! Facilities with more anomalies than this are at risk.
    static const std::size_t AT_RISK_ANOMALY_COUNT;

public:
    TIssueReport detect(const TConsumptionRecordVec& records, double threshold) const override;
    std::string description() const override;
};
}
}

#endif // INCLUDED_ecosense_analysis_CResourceIssueStrategy_h
