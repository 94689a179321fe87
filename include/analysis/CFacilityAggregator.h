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
#ifndef INCLUDED_ecosense_analysis_CFacilityAggregator_h
#define INCLUDED_ecosense_analysis_CFacilityAggregator_h

#include <analysis/CConsumptionRecord.h>
#include <analysis/ImportExport.h>

#include <map>
#include <string>

namespace ecosense {
namespace analysis {

//! \brief The consumption of one facility.
struct ANALYSIS_EXPORT SFacilityRollup {
    //! Sum of the facility's values.
    double s_Total{0.0};
    //! Mean of the facility's values.
    double s_Average{0.0};
    //! Number of the facility's records flagged as anomalous.
    std::size_t s_AnomalyCount{0};
    //! Number of the facility's records.
    std::size_t s_Count{0};
};

using TStrFacilityRollupMap = std::map<std::string, SFacilityRollup>;

//! \brief
//! Rolls the records up by facility.
//!
//! DESCRIPTION:\n
//! Only facilities that have at least one record appear in the result.
//! The records must have been through anomaly detection.
//!
class ANALYSIS_EXPORT CFacilityAggregator {
public:
    CFacilityAggregator() = delete;

    static TStrFacilityRollupMap aggregate(const TConsumptionRecordVec& records);
};
}
}

#endif // INCLUDED_ecosense_analysis_CFacilityAggregator_h
