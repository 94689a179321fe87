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
#include <analysis/CResourceType.h>

namespace ecosense {
namespace analysis {

// Initialise statics
const std::string CResourceType::ELECTRICITY{"electricity"};
const std::string CResourceType::WATER{"water"};
const std::string CResourceType::DEFAULT_ELECTRICITY_VALUE_FIELD{"consumption_kwh"};
const std::string CResourceType::DEFAULT_WATER_VALUE_FIELD{"consumption_gallons"};

CResourceType::CResourceType(std::string name, std::string valueField, std::string unit, std::string issueReportName)
    : m_Name{std::move(name)}, m_ValueField{std::move(valueField)},
      m_Unit{std::move(unit)}, m_IssueReportName{std::move(issueReportName)} {
}

CResourceType CResourceType::electricity(const std::string& valueField) {
    return CResourceType{ELECTRICITY, valueField, "kwh", "night_idle_issues"};
}

CResourceType CResourceType::water(const std::string& valueField) {
    return CResourceType{WATER, valueField, "gallons", "potential_leaks"};
}

const std::string& CResourceType::name() const {
    return m_Name;
}

const std::string& CResourceType::valueField() const {
    return m_ValueField;
}

const std::string& CResourceType::unit() const {
    return m_Unit;
}

const std::string& CResourceType::issueReportName() const {
    return m_IssueReportName;
}

std::string CResourceType::unitKey(const std::string& prefix) const {
    return prefix + '_' + m_Unit;
}
}
}
