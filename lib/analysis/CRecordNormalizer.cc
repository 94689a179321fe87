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
#include <analysis/CRecordNormalizer.h>

#include <core/CLogger.h>
#include <core/CStringUtils.h>
#include <core/CTimeUtils.h>

#include <analysis/CAnalysisErrors.h>
#include <analysis/CRawTable.h>

#include <cmath>
#include <sstream>

namespace ecosense {
namespace analysis {
namespace {
[[noreturn]] void badValue(const std::string& field,
                           std::size_t row,
                           const std::string& value,
                           const std::string& problem) {
    std::ostringstream message;
    message << "Invalid value '" << value << "' for field '" << field
            << "' in row " << row + 1 << ": " << problem;
    throw CSchemaError{message.str()};
}
}

CRecordNormalizer::CRecordNormalizer(std::string timeField,
                                     std::string facilityField,
                                     std::string valueField)
    : m_TimeField{std::move(timeField)}, m_FacilityField{std::move(facilityField)},
      m_ValueField{std::move(valueField)} {
}

TConsumptionRecordVec CRecordNormalizer::normalize(const CRawTable& table) const {
    std::size_t timeColumn{requiredColumn(table, m_TimeField)};
    std::size_t facilityColumn{requiredColumn(table, m_FacilityField)};
    std::size_t valueColumn{requiredColumn(table, m_ValueField)};

    TConsumptionRecordVec records;
    records.reserve(table.numberRows());

    for (std::size_t i = 0; i < table.numberRows(); ++i) {
        const std::string& timeStr{table.value(i, timeColumn)};
        core_t::TTime time{0};
        if (core::CTimeUtils::parseDateTime(timeStr, time) == false) {
            badValue(m_TimeField, i, timeStr, "not a recognised date/time");
        }

        std::string facility{table.value(i, facilityColumn)};
        core::CStringUtils::trimWhitespace(facility);
        if (facility.empty()) {
            badValue(m_FacilityField, i, table.value(i, facilityColumn), "facility is empty");
        }

        std::string valueStr{table.value(i, valueColumn)};
        core::CStringUtils::trimWhitespace(valueStr);
        double value{0.0};
        if (core::CStringUtils::stringToTypeSilent(valueStr, value) == false) {
            badValue(m_ValueField, i, valueStr, "not a number");
        }
        if (std::isfinite(value) == false) {
            badValue(m_ValueField, i, valueStr, "not finite");
        }
        if (value < 0.0) {
            badValue(m_ValueField, i, valueStr, "consumption can't be negative");
        }

        records.emplace_back(time, core::CTimeUtils::hourOfDay(time), std::move(facility), value);
    }

    LOG_DEBUG(<< "Normalized " << records.size() << " records using fields " << m_TimeField
              << ", " << m_FacilityField << " and " << m_ValueField);

    return records;
}

const std::string& CRecordNormalizer::timeField() const {
    return m_TimeField;
}

const std::string& CRecordNormalizer::facilityField() const {
    return m_FacilityField;
}

const std::string& CRecordNormalizer::valueField() const {
    return m_ValueField;
}

std::size_t CRecordNormalizer::requiredColumn(const CRawTable& table, const std::string& field) {
    auto column = table.columnIndex(field);
    if (!column) {
        throw CSchemaError{"Missing required column '" + field + "'"};
    }
    return *column;
}
}
}
