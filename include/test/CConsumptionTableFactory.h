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
#ifndef INCLUDED_ecosense_test_CConsumptionTableFactory_h
#define INCLUDED_ecosense_test_CConsumptionTableFactory_h

#include <core/CoreTypes.h>

#include <analysis/CRawTable.h>

#include <test/ImportExport.h>

#include <string>
#include <vector>

namespace ecosense {
namespace test {

//! \brief
//! Builds synthetic consumption tables for tests.
//!
//! DESCRIPTION:\n
//! Produces tables with the columns of the sample data sets:
//! timestamp, date, hour, the consumption column, facility and
//! day_of_week.  By default the date column holds the full date and
//! time so that hour-of-day classification sees the reading's hour.
//! Setting date only reproduces sample data whose date column has no
//! time of day.
//!
class TEST_EXPORT CConsumptionTableFactory {
public:
    using TDoubleVec = std::vector<double>;

    //! 2024-01-01T00:00:00Z
    static const core_t::TTime DEFAULT_START;

public:
    explicit CConsumptionTableFactory(std::string valueField,
                                      core_t::TTime start = DEFAULT_START);

    //! Write only the calendar date in the date column.
    CConsumptionTableFactory& dateOnly(bool dateOnly);

    //! Add a reading at \p hoursAfterStart hours after the start time.
    CConsumptionTableFactory& add(const std::string& facility, int hoursAfterStart, double value);

    //! Add one reading per hour for \p facility, the first at
    //! \p firstHour hours after the start time.
    CConsumptionTableFactory&
    addHourly(const std::string& facility, const TDoubleVec& values, int firstHour = 0);

    //! Get the table.
    analysis::CRawTable table() const;

    //! Get the table as CSV text with a header row.
    std::string csv() const;

    //! Shortcut for a single facility table of hourly readings.
    static analysis::CRawTable hourly(const std::string& valueField,
                                      const TDoubleVec& values,
                                      int firstHour = 0,
                                      const std::string& facility = "Building A");

private:
    using TStrVec = std::vector<std::string>;
    using TStrVecVec = std::vector<TStrVec>;

private:
    TStrVec fieldNames() const;

private:
    std::string m_ValueField;
    core_t::TTime m_Start;
    bool m_DateOnly;
    TStrVecVec m_Rows;
};
}
}

#endif // INCLUDED_ecosense_test_CConsumptionTableFactory_h
