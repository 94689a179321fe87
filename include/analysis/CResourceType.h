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
#ifndef INCLUDED_ecosense_analysis_CResourceType_h
#define INCLUDED_ecosense_analysis_CResourceType_h

#include <analysis/ImportExport.h>

#include <string>

namespace ecosense {
namespace analysis {

//! \brief
//! Describes a kind of resource whose consumption can be analyzed.
//!
//! DESCRIPTION:\n
//! The resource's name, the input column holding its consumption, the
//! unit that suffixes result keys and the key of its issue report.
//!
class ANALYSIS_EXPORT CResourceType {
public:
    static const std::string ELECTRICITY;
    static const std::string WATER;
    static const std::string DEFAULT_ELECTRICITY_VALUE_FIELD;
    static const std::string DEFAULT_WATER_VALUE_FIELD;

public:
    CResourceType(std::string name, std::string valueField, std::string unit, std::string issueReportName);

    //! Electricity, measured in kWh, with night idle issues.
    static CResourceType electricity(const std::string& valueField = DEFAULT_ELECTRICITY_VALUE_FIELD);

    //! Water, measured in gallons, with leak issues.
    static CResourceType water(const std::string& valueField = DEFAULT_WATER_VALUE_FIELD);

    const std::string& name() const;
    const std::string& valueField() const;
    const std::string& unit() const;
    const std::string& issueReportName() const;

    //! Get \p prefix suffixed with the unit, e.g. total_consumption_kwh.
    std::string unitKey(const std::string& prefix) const;

private:
    std::string m_Name;
    std::string m_ValueField;
    std::string m_Unit;
    std::string m_IssueReportName;
};
}
}

#endif // INCLUDED_ecosense_analysis_CResourceType_h
