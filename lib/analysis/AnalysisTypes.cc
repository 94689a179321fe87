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
#include <analysis/AnalysisTypes.h>

#include <ostream>

namespace ecosense {
namespace analysis_t {
namespace {

const std::string TREND_NAMES[] = {std::string("increasing"), std::string("decreasing"),
                                   std::string("stable"), std::string("insufficient_data")};

const std::string ISSUE_SEVERITY_NAMES[] = {std::string("LOW"), std::string("MEDIUM"),
                                            std::string("HIGH")};

const std::string BAD_VALUE{"-"};
}

const std::string& print(ETrend trend) {
    if (trend < E_Increasing || trend > E_InsufficientData) {
        return BAD_VALUE;
    }
    return TREND_NAMES[trend];
}

std::ostream& operator<<(std::ostream& o, ETrend trend) {
    return o << print(trend);
}

const std::string& print(EIssueSeverity severity) {
    if (severity < E_Low || severity > E_High) {
        return BAD_VALUE;
    }
    return ISSUE_SEVERITY_NAMES[severity];
}

std::ostream& operator<<(std::ostream& o, EIssueSeverity severity) {
    return o << print(severity);
}
}
}
