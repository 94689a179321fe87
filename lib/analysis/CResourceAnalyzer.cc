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
#include <analysis/CResourceAnalyzer.h>

#include <core/CLogger.h>

#include <analysis/CAnalysisErrors.h>
#include <analysis/CAnalyzerConfig.h>
#include <analysis/CAnomalyDetector.h>
#include <analysis/CFacilityAggregator.h>
#include <analysis/CRawTable.h>
#include <analysis/CTrendEstimator.h>

#include <algorithm>
#include <memory>

namespace ecosense {
namespace analysis {

CResourceAnalyzer::CResourceAnalyzer(CResourceType resource,
                                     TResourceIssueStrategyCPtr issueStrategy,
                                     const CAnalyzerConfig& config)
    : m_Resource{std::move(resource)}, m_IssueStrategy{std::move(issueStrategy)},
      m_Normalizer{config.timeField(), config.facilityField(), m_Resource.valueField()},
      m_NightTimeClassifier{config.nightHours()},
      m_AnomalyPercentile{config.anomalyPercentile()} {
    if (m_IssueStrategy == nullptr) {
        LOG_ABORT(<< "No issue strategy for " << m_Resource.name());
    }
}

CResourceAnalyzer CResourceAnalyzer::electricity(const CAnalyzerConfig& config) {
    return CResourceAnalyzer{CResourceType::electricity(config.electricityValueField()),
                             std::make_shared<CNightIdleStrategy>(), config};
}

CResourceAnalyzer CResourceAnalyzer::water(const CAnalyzerConfig& config) {
    return CResourceAnalyzer{CResourceType::water(config.waterValueField()),
                             std::make_shared<CLeakRiskStrategy>(), config};
}

CAnalysisResult CResourceAnalyzer::analyze(const CRawTable& table) const {
    return this->analyze(table, m_AnomalyPercentile);
}

CAnalysisResult CResourceAnalyzer::analyze(const CRawTable& table, double percentile) const {
    LOG_DEBUG(<< "Analyzing " << table.numberRows() << " rows of " << m_Resource.name()
              << " consumption");
    try {
        if (table.empty()) {
            throw CEmptyDatasetError{"The " + m_Resource.name() + " table has no rows"};
        }

        TConsumptionRecordVec records{m_Normalizer.normalize(table)};

        double threshold{CAnomalyDetector{percentile}.detect(records)};
        m_NightTimeClassifier.classify(records);

        // Everything below only reads the records
        const TConsumptionRecordVec& flagged = records;
        analysis_t::ETrend trend{CTrendEstimator::estimate(flagged)};
        TStrFacilityRollupMap facilities{CFacilityAggregator::aggregate(flagged)};
        TIssueReport issues{m_IssueStrategy->detect(flagged, threshold)};

        LOG_DEBUG(<< m_Resource.name() << " trend is " << trend << ", "
                  << m_IssueStrategy->description() << " detection done");

        return CAnalysisResult{m_Resource,
                               threshold,
                               trend,
                               std::move(facilities),
                               std::move(issues),
                               std::move(records)};
    } catch (const CEmptyDatasetError& e) {
        LOG_DEBUG(<< e.what());
        return CAnalysisResult::error(m_Resource, CAnalysisResult::NO_DATA_REASON);
    }
}

CResourceAnalyzer::TConsumptionRecordCRefVec
CResourceAnalyzer::anomalies(const CAnalysisResult& result) {
    TConsumptionRecordCRefVec anomalies;
    if (result.isError()) {
        return anomalies;
    }
    for (const auto& record : result.records()) {
        if (record.isAnomaly()) {
            anomalies.emplace_back(record);
        }
    }
    std::stable_sort(anomalies.begin(), anomalies.end(),
                     [](const CConsumptionRecord& lhs, const CConsumptionRecord& rhs) {
                         return lhs.value() > rhs.value();
                     });
    return anomalies;
}

const CResourceType& CResourceAnalyzer::resource() const {
    return m_Resource;
}

double CResourceAnalyzer::anomalyPercentile() const {
    return m_AnomalyPercentile;
}
}
}
