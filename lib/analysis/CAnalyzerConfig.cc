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
#include <analysis/CAnalyzerConfig.h>

#include <core/CStreamUtils.h>

#include <analysis/CNightTimeClassifier.h>
#include <analysis/CResourceType.h>

#include <boost/property_tree/ini_parser.hpp>

#include <fstream>
#include <sstream>

namespace ecosense {
namespace analysis {

// Initialise statics
const double CAnalyzerConfig::DEFAULT_PERCENTILE{75.0};
const std::string CAnalyzerConfig::DEFAULT_TIME_FIELD{"date"};
const std::string CAnalyzerConfig::DEFAULT_FACILITY_FIELD{"facility"};

CAnalyzerConfig::CAnalyzerConfig()
    : m_AnomalyPercentile{DEFAULT_PERCENTILE},
      m_NightHours{CNightTimeClassifier::defaultNightHours()},
      m_TimeField{DEFAULT_TIME_FIELD}, m_FacilityField{DEFAULT_FACILITY_FIELD},
      m_ElectricityValueField{CResourceType::DEFAULT_ELECTRICITY_VALUE_FIELD},
      m_WaterValueField{CResourceType::DEFAULT_WATER_VALUE_FIELD} {
}

CAnalyzerConfig CAnalyzerConfig::defaultConfig() {
    return CAnalyzerConfig{};
}

bool CAnalyzerConfig::init(const std::string& configFile) {
    std::ifstream strm(configFile.c_str());
    if (!strm.is_open()) {
        LOG_ERROR(<< "Error opening config file " << configFile);
        return false;
    }
    if (this->init(strm) == false) {
        LOG_ERROR(<< "Error processing config file " << configFile);
        return false;
    }
    return true;
}

bool CAnalyzerConfig::init(std::istream& strm) {
    boost::property_tree::ptree propTree;
    try {
        core::CStreamUtils::skipUtf8Bom(strm);
        boost::property_tree::ini_parser::read_ini(strm, propTree);
    } catch (boost::property_tree::ptree_error& e) {
        LOG_ERROR(<< "Error reading config: " << e.what());
        return false;
    }

    // Work on a copy so nothing changes unless every setting is good
    CAnalyzerConfig candidate{*this};

    if (processSetting(propTree, "anomaly.percentile", candidate.m_AnomalyPercentile) == false ||
        processSetting(propTree, "input.timefield", candidate.m_TimeField) == false ||
        processSetting(propTree, "input.facilityfield", candidate.m_FacilityField) == false ||
        processSetting(propTree, "electricity.valuefield",
                       candidate.m_ElectricityValueField) == false ||
        processSetting(propTree, "water.valuefield", candidate.m_WaterValueField) == false) {
        return false;
    }

    if (isValidPercentile(candidate.m_AnomalyPercentile) == false) {
        LOG_ERROR(<< "Invalid value for setting anomaly.percentile : "
                  << candidate.m_AnomalyPercentile << " is outside [0, 100]");
        return false;
    }

    auto hoursStr = propTree.get_optional<std::string>("nighttime.hours");
    if (hoursStr) {
        if (parseNightHours(*hoursStr, candidate.m_NightHours) == false) {
            LOG_ERROR(<< "Invalid value for setting nighttime.hours : " << *hoursStr);
            return false;
        }
    }

    *this = std::move(candidate);

    LOG_DEBUG(<< "Analyzer config " << this->print());

    return true;
}

bool CAnalyzerConfig::anomalyPercentile(double percentile) {
    if (isValidPercentile(percentile) == false) {
        LOG_ERROR(<< "Anomaly percentile " << percentile << " is outside [0, 100]");
        return false;
    }
    m_AnomalyPercentile = percentile;
    return true;
}

double CAnalyzerConfig::anomalyPercentile() const {
    return m_AnomalyPercentile;
}

bool CAnalyzerConfig::nightHours(const TIntSet& hours) {
    if (isValidNightHours(hours) == false) {
        LOG_ERROR(<< "Night-time hours must be a non-empty set of hours in [0, 23]");
        return false;
    }
    m_NightHours = hours;
    return true;
}

const CAnalyzerConfig::TIntSet& CAnalyzerConfig::nightHours() const {
    return m_NightHours;
}

bool CAnalyzerConfig::parseNightHours(const std::string& hours, TIntSet& result) {
    TIntSet parsed;
    for (auto token : core::CStringUtils::split(hours, ',')) {
        core::CStringUtils::trimWhitespace(token);
        int hour{0};
        if (core::CStringUtils::stringToType(token, hour) == false) {
            return false;
        }
        parsed.insert(hour);
    }
    if (isValidNightHours(parsed) == false) {
        LOG_ERROR(<< "'" << hours << "' is not a list of hours in [0, 23]");
        return false;
    }
    result = std::move(parsed);
    return true;
}

const std::string& CAnalyzerConfig::timeField() const {
    return m_TimeField;
}

const std::string& CAnalyzerConfig::facilityField() const {
    return m_FacilityField;
}

const std::string& CAnalyzerConfig::electricityValueField() const {
    return m_ElectricityValueField;
}

const std::string& CAnalyzerConfig::waterValueField() const {
    return m_WaterValueField;
}

std::string CAnalyzerConfig::print() const {
    std::ostringstream result;
    result << "percentile = " << m_AnomalyPercentile << ", night hours = {";
    std::string separator;
    for (auto hour : m_NightHours) {
        result << separator << hour;
        separator = ",";
    }
    result << "}, fields = " << m_TimeField << ", " << m_FacilityField << ", "
           << m_ElectricityValueField << ", " << m_WaterValueField;
    return result.str();
}

bool CAnalyzerConfig::isValidPercentile(double percentile) {
    return percentile >= 0.0 && percentile <= 100.0;
}

bool CAnalyzerConfig::isValidNightHours(const TIntSet& hours) {
    if (hours.empty()) {
        return false;
    }
    return *hours.begin() >= 0 && *hours.rbegin() <= 23;
}

bool CAnalyzerConfig::processSetting(const boost::property_tree::ptree& propTree,
                                     const std::string& iniPath,
                                     std::string& value) {
    auto valueStr = propTree.get_optional<std::string>(iniPath);
    if (!valueStr) {
        LOG_DEBUG(<< "Using default value (" << value << ") for unspecified setting " << iniPath);
        return true;
    }
    std::string trimmed{*valueStr};
    core::CStringUtils::trimWhitespace(trimmed);
    if (trimmed.empty()) {
        LOG_ERROR(<< "Empty value for setting " << iniPath);
        return false;
    }
    value = std::move(trimmed);
    return true;
}
}
}
