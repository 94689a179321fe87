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
#include <api/CDailyStatisticsCsvWriter.h>

#include <core/CStringUtils.h>
#include <core/CTimeUtils.h>

namespace ecosense {
namespace api {
namespace {
std::string toString(double value) {
    return core::CStringUtils::typeToStringFixed(value, 2);
}
}

CDailyStatisticsCsvWriter::CDailyStatisticsCsvWriter(std::ostream& strmOut)
    : m_Writer{strmOut} {
}

bool CDailyStatisticsCsvWriter::write(const analysis::CDailyStatistics::TDayVec& days) {
    if (m_Writer.writeRow({"date", "count", "sum", "mean", "min", "max", "std"}) == false) {
        return false;
    }
    for (const auto& day : days) {
        if (m_Writer.writeRow({core::CTimeUtils::toIsoDate(day.s_Day),
                               core::CStringUtils::typeToString(
                                   static_cast<unsigned long>(day.s_Count)),
                               toString(day.s_Sum), toString(day.s_Mean),
                               toString(day.s_Min), toString(day.s_Max),
                               day.s_StandardDeviation ? toString(*day.s_StandardDeviation)
                                                       : std::string{}}) == false) {
            return false;
        }
    }
    return true;
}
}
}
