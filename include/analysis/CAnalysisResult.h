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
#ifndef INCLUDED_ecosense_analysis_CAnalysisResult_h
#define INCLUDED_ecosense_analysis_CAnalysisResult_h

#include <analysis/AnalysisTypes.h>
#include <analysis/CConsumptionRecord.h>
#include <analysis/CFacilityAggregator.h>
#include <analysis/CResourceType.h>
#include <analysis/ImportExport.h>
#include <analysis/IssueReports.h>

#include <boost/optional.hpp>

#include <string>

namespace ecosense {
namespace analysis {

//! \brief
//! The outcome of analyzing one table of consumption records.
//!
//! DESCRIPTION:\n
//! Either the full set of statistics or an error reason.  The statistics
//! are held at full precision, rounding is for the writers.  The flagged
//! records are kept so the anomalies can be listed.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Immutable once constructed.  Accessing the statistics of an error
//! result is a programming error.
//!
class ANALYSIS_EXPORT CAnalysisResult {
public:
    //! Reason given when there are no records.
    static const std::string NO_DATA_REASON;

public:
    CAnalysisResult(CResourceType resource,
                    double threshold,
                    analysis_t::ETrend trend,
                    TStrFacilityRollupMap facilities,
                    TIssueReport issues,
                    TConsumptionRecordVec records);

    //! Create an error result.
    static CAnalysisResult error(CResourceType resource, std::string reason);

    const CResourceType& resource() const;

    bool isError() const;
    //! Empty unless isError().
    const std::string& errorReason() const;

    double totalConsumption() const;
    double averageConsumption() const;
    double peakConsumption() const;
    double nightConsumption() const;
    std::size_t anomaliesDetected() const;
    double anomalyThreshold() const;
    //! Anomalous records as a percentage of all records.
    double anomalyPercentage() const;
    analysis_t::ETrend trend() const;
    const TStrFacilityRollupMap& facilities() const;
    const TIssueReport& issues() const;
    //! The records in input order.
    const TConsumptionRecordVec& records() const;

private:
    CAnalysisResult(CResourceType resource, std::string reason);

    void checkNotError() const;

private:
    CResourceType m_Resource;
    boost::optional<std::string> m_ErrorReason;
    double m_TotalConsumption{0.0};
    double m_AverageConsumption{0.0};
    double m_PeakConsumption{0.0};
    double m_NightConsumption{0.0};
    std::size_t m_AnomaliesDetected{0};
    double m_AnomalyThreshold{0.0};
    analysis_t::ETrend m_Trend{analysis_t::E_InsufficientData};
    TStrFacilityRollupMap m_Facilities;
    TIssueReport m_Issues;
    TConsumptionRecordVec m_Records;
};
}
}

#endif // INCLUDED_ecosense_analysis_CAnalysisResult_h
