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
#include <analysis/CNightTimeClassifier.h>

#include <core/CLogger.h>

namespace ecosense {
namespace analysis {

CNightTimeClassifier::CNightTimeClassifier(TIntSet nightHours)
    : m_NightHours{std::move(nightHours)} {
}

CNightTimeClassifier::TIntSet CNightTimeClassifier::defaultNightHours() {
    return TIntSet{22, 23, 0, 1, 2, 3, 4, 5};
}

bool CNightTimeClassifier::isNightTime(int hour) const {
    return m_NightHours.count(hour) > 0;
}

void CNightTimeClassifier::classify(TConsumptionRecordVec& records) const {
    std::size_t night{0};
    for (auto& record : records) {
        bool isNightTime{this->isNightTime(record.hour())};
        night += isNightTime ? 1 : 0;
        record.flagNightTime(isNightTime);
    }
    LOG_DEBUG(<< night << " of " << records.size() << " records are at night");
}

const CNightTimeClassifier::TIntSet& CNightTimeClassifier::nightHours() const {
    return m_NightHours;
}
}
}
