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
#include <analysis/CFacilityAggregator.h>

#include <core/CLogger.h>

namespace ecosense {
namespace analysis {

TStrFacilityRollupMap CFacilityAggregator::aggregate(const TConsumptionRecordVec& records) {
    TStrFacilityRollupMap result;
    for (const auto& record : records) {
        SFacilityRollup& rollup = result[record.facility()];
        rollup.s_Total += record.value();
        rollup.s_AnomalyCount += record.isAnomaly() ? 1 : 0;
        ++rollup.s_Count;
    }
    for (auto& facility : result) {
        SFacilityRollup& rollup = facility.second;
        rollup.s_Average = rollup.s_Total / static_cast<double>(rollup.s_Count);
    }
    LOG_DEBUG(<< "Aggregated " << records.size() << " records over " << result.size()
              << " facilities");
    return result;
}
}
}
