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
#ifndef INCLUDED_ecosense_analysis_CResourceAnalyzer_h
#define INCLUDED_ecosense_analysis_CResourceAnalyzer_h

#include <analysis/CAnalysisResult.h>
#include <analysis/CConsumptionRecord.h>
#include <analysis/CNightTimeClassifier.h>
#include <analysis/CRecordNormalizer.h>
#include <analysis/CResourceIssueStrategy.h>
#include <analysis/CResourceType.h>
#include <analysis/ImportExport.h>

#include <functional>
#include <vector>

namespace ecosense {
namespace analysis {
class CAnalyzerConfig;
class CRawTable;

//! \brief
//! Analyzes the consumption of one kind of resource.
//!
//! DESCRIPTION:\n
//! Runs the analysis pipeline over a raw table:
//! -# normalize the rows to records,
//! -# flag anomalies and compute the anomaly threshold,
//! -# flag night-time records,
//! -# estimate the trend, roll up by facility and detect the resource
//!    specific issue, all from the fully flagged records.
//!
//! The flags are all attached before the last step starts, which only
//! reads the records.
//!
//! IMPLEMENTATION DECISIONS:\n
//! One engine serves every resource.  What differs between resources is
//! the value column, the result key names and the issue detection policy,
//! which are supplied as a CResourceType and a CResourceIssueStrategy.
//!
//! Nothing is cached between calls to analyze().
//!
class ANALYSIS_EXPORT CResourceAnalyzer {
public:
    using TConsumptionRecordCRefVec = std::vector<std::reference_wrapper<const CConsumptionRecord>>;

public:
    CResourceAnalyzer(CResourceType resource,
                      TResourceIssueStrategyCPtr issueStrategy,
                      const CAnalyzerConfig& config);

    //! An electricity analyzer looking for night idle issues.
    static CResourceAnalyzer electricity(const CAnalyzerConfig& config);

    //! A water analyzer looking for leaks.
    static CResourceAnalyzer water(const CAnalyzerConfig& config);

    //! Analyze \p table at the configured anomaly percentile.
    //!
    //! An empty table gives an error result rather than an exception.
    //!
    //! \throws CSchemaError if a required column is missing or a value
    //! is bad.
    //! \throws CDomainError if a statistic is undefined.
    CAnalysisResult analyze(const CRawTable& table) const;

    //! As above at anomaly percentile \p percentile.
    CAnalysisResult analyze(const CRawTable& table, double percentile) const;

    //! Get the anomalous records of \p result, highest value first.
    //! Records with equal values stay in input order.
    static TConsumptionRecordCRefVec anomalies(const CAnalysisResult& result);

    const CResourceType& resource() const;
    double anomalyPercentile() const;

private:
    CResourceType m_Resource;
    TResourceIssueStrategyCPtr m_IssueStrategy;
    CRecordNormalizer m_Normalizer;
    CNightTimeClassifier m_NightTimeClassifier;
    double m_AnomalyPercentile;
};
}
}

#endif // INCLUDED_ecosense_analysis_CResourceAnalyzer_h
