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
#include <analysis/CAnalysisErrors.h>
#include <analysis/CRawTable.h>
#include <analysis/CRecordNormalizer.h>

#include <boost/test/unit_test.hpp>

#include <string>

BOOST_AUTO_TEST_SUITE(CRecordNormalizerTest)

using namespace ecosense;

namespace {
analysis::CRecordNormalizer electricityNormalizer() {
    return analysis::CRecordNormalizer{"date", "facility", "consumption_kwh"};
}

analysis::CRawTable table() {
    return analysis::CRawTable{{"date", "facility", "consumption_kwh", "day_of_week"}};
}

bool throwsSchemaErrorMentioning(const analysis::CRawTable& input, const std::string& text) {
    try {
        electricityNormalizer().normalize(input);
    } catch (const analysis::CSchemaError& e) {
        return std::string{e.what()}.find(text) != std::string::npos;
    }
    return false;
}
}

BOOST_AUTO_TEST_CASE(testNormalize) {
    analysis::CRawTable input{table()};
    input.addRow({"2024-03-01 22:00:00", "Building A", "512.5", "Friday"});
    input.addRow({"2024-03-02", " Hostel Block C ", "0", "Saturday"});
    input.addRow({"2024-03-02T05:45", "Building A", " 1e2 ", "Saturday"});

    analysis::TConsumptionRecordVec records{electricityNormalizer().normalize(input)};

    BOOST_REQUIRE_EQUAL(3, records.size());
    BOOST_REQUIRE_EQUAL(core_t::TTime{1709330400}, records[0].time());
    BOOST_REQUIRE_EQUAL(22, records[0].hour());
    BOOST_REQUIRE_EQUAL(std::string("Building A"), records[0].facility());
    BOOST_REQUIRE_EQUAL(512.5, records[0].value());

    // A date without a time of day is hour zero
    BOOST_REQUIRE_EQUAL(0, records[1].hour());
    BOOST_REQUIRE_EQUAL(std::string("Hostel Block C"), records[1].facility());
    BOOST_REQUIRE_EQUAL(0.0, records[1].value());

    BOOST_REQUIRE_EQUAL(5, records[2].hour());
    BOOST_REQUIRE_EQUAL(100.0, records[2].value());

    // Nothing is flagged yet
    BOOST_TEST_REQUIRE(records[0].hasAnomalyFlags() == false);
    BOOST_TEST_REQUIRE(records[0].hasNightTimeFlag() == false);
}

BOOST_AUTO_TEST_CASE(testMissingColumn) {
    analysis::CRawTable input{{"date", "facility", "consumption_gallons"}};
    input.addRow({"2024-03-01", "Building A", "12"});

    BOOST_TEST_REQUIRE(throwsSchemaErrorMentioning(input, "'consumption_kwh'"));

    analysis::CRawTable noFacility{{"date", "consumption_kwh"}};
    BOOST_TEST_REQUIRE(throwsSchemaErrorMentioning(noFacility, "'facility'"));
}

BOOST_AUTO_TEST_CASE(testBadValues) {
    {
        analysis::CRawTable input{table()};
        input.addRow({"2024-03-01", "Building A", "12", "Friday"});
        input.addRow({"01/03/2024", "Building A", "12", "Friday"});
        BOOST_TEST_REQUIRE(throwsSchemaErrorMentioning(input, "'date' in row 2"));
    }
    {
        analysis::CRawTable input{table()};
        input.addRow({"2024-03-01", "  ", "12", "Friday"});
        BOOST_TEST_REQUIRE(throwsSchemaErrorMentioning(input, "'facility' in row 1"));
    }
    {
        analysis::CRawTable input{table()};
        input.addRow({"2024-03-01", "Building A", "", "Friday"});
        BOOST_TEST_REQUIRE(throwsSchemaErrorMentioning(input, "not a number"));
    }
    {
        analysis::CRawTable input{table()};
        input.addRow({"2024-03-01", "Building A", "12 kWh", "Friday"});
        BOOST_TEST_REQUIRE(throwsSchemaErrorMentioning(input, "not a number"));
    }
    {
        analysis::CRawTable input{table()};
        input.addRow({"2024-03-01", "Building A", "nan", "Friday"});
        BOOST_TEST_REQUIRE(throwsSchemaErrorMentioning(input, "not finite"));
    }
    {
        analysis::CRawTable input{table()};
        input.addRow({"2024-03-01", "Building A", "-0.5", "Friday"});
        BOOST_TEST_REQUIRE(throwsSchemaErrorMentioning(input, "negative"));
    }
}

BOOST_AUTO_TEST_CASE(testOtherFieldNames) {
    analysis::CRawTable input{{"reading_time", "site", "usage"}};
    input.addRow({"2024-03-01 03:00", "Library Block", "42"});

    analysis::TConsumptionRecordVec records{
        analysis::CRecordNormalizer{"reading_time", "site", "usage"}.normalize(input)};

    BOOST_REQUIRE_EQUAL(1, records.size());
    BOOST_REQUIRE_EQUAL(3, records[0].hour());
    BOOST_REQUIRE_EQUAL(std::string("Library Block"), records[0].facility());
}

BOOST_AUTO_TEST_SUITE_END()
