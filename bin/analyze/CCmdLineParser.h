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
#ifndef INCLUDED_ecosense_analyze_CCmdLineParser_h
#define INCLUDED_ecosense_analyze_CCmdLineParser_h

#include <core/CLogger.h>

#include <boost/optional.hpp>

#include <string>

namespace ecosense {
namespace analyze {

//! \brief
//! Very simple command line parser.
//!
//! DESCRIPTION:\n
//! Very simple command line parser.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Put in a class rather than main to allow testing.
//!
class CCmdLineParser {
public:
    using TOptionalDouble = boost::optional<double>;
    using TOptionalLevel = boost::optional<core::CLogger::ELevel>;

    //! Everything the command line can set.
    struct SOptions {
        std::string s_Resource;
        std::string s_InputFileName;
        std::string s_OutputFileName;
        std::string s_ConfigFile;
        TOptionalDouble s_Percentile;
        std::string s_NightHours;
        std::string s_AnomaliesFileName;
        std::string s_DailyStatsFileName;
        bool s_Report{false};
        std::string s_Facility;
        std::string s_LogFile;
        std::string s_LogProperties;
        TOptionalLevel s_LogLevel;
    };

public:
    //! Parse the arguments and return options if appropriate.
    static bool parse(int argc, const char* const* argv, SOptions& options);

private:
    static const std::string DESCRIPTION;
};
}
}

#endif // INCLUDED_ecosense_analyze_CCmdLineParser_h
