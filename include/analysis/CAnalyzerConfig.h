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
#ifndef INCLUDED_ecosense_analysis_CAnalyzerConfig_h
#define INCLUDED_ecosense_analysis_CAnalyzerConfig_h

#include <core/CLogger.h>
#include <core/CStringUtils.h>

#include <analysis/ImportExport.h>

#include <boost/property_tree/ptree.hpp>

#include <iosfwd>
#include <set>
#include <string>

namespace ecosense {
namespace analysis {

//! \brief
//! Holds the settings for consumption analysis.
//!
//! DESCRIPTION:\n
//! The anomaly percentile, the night-time hours and the names of the
//! input columns.  Defaults can be overridden by an ini file:
//!
//! <pre>
//! [anomaly]
//! percentile = 75
//! [nighttime]
//! hours = 22,23,0,1,2,3,4,5
//! [input]
//! timefield = date
//! facilityfield = facility
//! [electricity]
//! valuefield = consumption_kwh
//! [water]
//! valuefield = consumption_gallons
//! </pre>
//!
//! IMPLEMENTATION DECISIONS:\n
//! A config that fails to load or validate leaves the object unchanged,
//! so a caller can report the error and carry on with the defaults or
//! stop.
//!
class ANALYSIS_EXPORT CAnalyzerConfig {
public:
    using TIntSet = std::set<int>;

public:
    static const double DEFAULT_PERCENTILE;
    static const std::string DEFAULT_TIME_FIELD;
    static const std::string DEFAULT_FACILITY_FIELD;

public:
    //! Construct with the default settings.
    CAnalyzerConfig();

    //! Get the default settings.
    static CAnalyzerConfig defaultConfig();

    //! Initialise from an ini file.
    bool init(const std::string& configFile);

    //! Initialise from an ini format stream.
    bool init(std::istream& strm);

    //! Set the anomaly percentile, which must be in [0, 100].
    bool anomalyPercentile(double percentile);
    double anomalyPercentile() const;

    //! Set the night-time hours, which must be a non-empty set of hours
    //! in [0, 23].
    bool nightHours(const TIntSet& hours);
    const TIntSet& nightHours() const;

    //! Parse a comma separated list of hours, e.g. 22,23,0,1.
    static bool parseNightHours(const std::string& hours, TIntSet& result);

    const std::string& timeField() const;
    const std::string& facilityField() const;
    const std::string& electricityValueField() const;
    const std::string& waterValueField() const;

    //! Get a one line description.
    std::string print() const;

private:
    static bool isValidPercentile(double percentile);
    static bool isValidNightHours(const TIntSet& hours);

    //! Read the setting at \p iniPath, if present, into \p value.
    template<typename FIELDTYPE>
    static bool processSetting(const boost::property_tree::ptree& propTree,
                               const std::string& iniPath,
                               FIELDTYPE& value) {
        auto valueStr = propTree.get_optional<std::string>(iniPath);
        if (!valueStr) {
            LOG_DEBUG(<< "Using default value (" << value << ") for unspecified setting " << iniPath);
            return true;
        }
        std::string trimmed{*valueStr};
        core::CStringUtils::trimWhitespace(trimmed);
        // Use our own string-to-type conversion, because what's built
        // into the boost::property_tree is too lax
        if (core::CStringUtils::stringToType(trimmed, value) == false) {
            LOG_ERROR(<< "Invalid value for setting " << iniPath << " : " << *valueStr);
            return false;
        }
        return true;
    }

    //! String settings must be non-empty.
    static bool processSetting(const boost::property_tree::ptree& propTree,
                               const std::string& iniPath,
                               std::string& value);

private:
    double m_AnomalyPercentile;
    TIntSet m_NightHours;
    std::string m_TimeField;
    std::string m_FacilityField;
    std::string m_ElectricityValueField;
    std::string m_WaterValueField;
};
}
}

#endif // INCLUDED_ecosense_analysis_CAnalyzerConfig_h
