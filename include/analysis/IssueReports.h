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
#ifndef INCLUDED_ecosense_analysis_IssueReports_h
#define INCLUDED_ecosense_analysis_IssueReports_h

#include <analysis/AnalysisTypes.h>

#include <boost/variant.hpp>

#include <string>
#include <vector>

namespace ecosense {
namespace analysis {

//! \brief Unexplained high electricity consumption at night.
struct SNightIdleReport {
    //! Number of night-time records above the anomaly threshold.
    std::size_t s_HighNightConsumptionCount{0};
    //! Percentage of the total consumption that was at night.
    double s_NightConsumptionPercentage{0.0};
    analysis_t::EIssueSeverity s_IssueSeverity{analysis_t::E_Low};
};

//! \brief Facilities whose water consumption suggests a leak.
struct SLeakRiskReport {
    using TStrVec = std::vector<std::string>;

    //! Number of anomalous records over all facilities.
    std::size_t s_HighAnomalyCount{0};
    //! Facilities with too many anomalous records, in name order.
    TStrVec s_FacilitiesAtRisk;
    analysis_t::EIssueSeverity s_LeakProbability{analysis_t::E_Low};
};

//! The report of whichever issue detector a resource uses.
using TIssueReport = boost::variant<SNightIdleReport, SLeakRiskReport>;
}
}

#endif // INCLUDED_ecosense_analysis_IssueReports_h
