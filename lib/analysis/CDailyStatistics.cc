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
#include <analysis/CDailyStatistics.h>

#include <core/CLogger.h>
#include <core/CTimeUtils.h>

#include <maths/CBasicStatistics.h>

#include <map>
#include <utility>

namespace ecosense {
namespace analysis {

CDailyStatistics::TDayVec CDailyStatistics::compute(const TConsumptionRecordVec& records) {
    using TMeanVarMinMaxPr =
        std::pair<maths::CBasicStatistics::TMeanVarAccumulator, maths::CBasicStatistics::CMinMax>;
    using TTimeMomentsMap = std::map<core_t::TTime, TMeanVarMinMaxPr>;
    using TTimeDoubleMap = std::map<core_t::TTime, double>;

    TTimeMomentsMap moments;
    // Sum separately in input order so a day's total matches the total
    // over the same records elsewhere
    TTimeDoubleMap sums;
    for (const auto& record : records) {
        core_t::TTime day{core::CTimeUtils::startOfDay(record.time())};
        TMeanVarMinMaxPr& dayMoments = moments[day];
        dayMoments.first.add(record.value());
        dayMoments.second.add(record.value());
        sums[day] += record.value();
    }

    TDayVec result;
    result.reserve(moments.size());
    for (const auto& dayMoments : moments) {
        const auto& meanVar = dayMoments.second.first;
        const auto& minMax = dayMoments.second.second;
        SDay day;
        day.s_Day = dayMoments.first;
        day.s_Count = static_cast<std::size_t>(meanVar.count());
        day.s_Sum = sums[dayMoments.first];
        day.s_Mean = meanVar.mean();
        day.s_Min = minMax.min();
        day.s_Max = minMax.max();
        if (day.s_Count > 1) {
            day.s_StandardDeviation = meanVar.standardDeviation();
        }
        result.push_back(day);
    }

    LOG_DEBUG(<< "Computed statistics for " << result.size() << " days");

    return result;
}
}
}
