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
#include <analysis/CRawTable.h>

#include <boost/test/unit_test.hpp>

#include <string>

BOOST_AUTO_TEST_SUITE(CRawTableTest)

using ecosense::analysis::CRawTable;

BOOST_AUTO_TEST_CASE(testColumns) {
    CRawTable table{{"date", "facility", "consumption_kwh", "facility"}};

    BOOST_REQUIRE_EQUAL(4, table.numberColumns());
    BOOST_TEST_REQUIRE(table.empty());
    BOOST_REQUIRE_EQUAL(0, *table.columnIndex("date"));
    BOOST_REQUIRE_EQUAL(2, *table.columnIndex("consumption_kwh"));
    // Repeated names resolve to the first column
    BOOST_REQUIRE_EQUAL(1, *table.columnIndex("facility"));
    BOOST_TEST_REQUIRE(!table.columnIndex("consumption_gallons"));
}

BOOST_AUTO_TEST_CASE(testRows) {
    CRawTable table{{"date", "facility", "consumption_kwh"}};

    BOOST_TEST_REQUIRE(table.addRow({"2024-01-01", "Building A", "12.5"}));
    BOOST_TEST_REQUIRE(table.addRow({"2024-01-02", "Building B", "7"}));
    BOOST_TEST_REQUIRE(table.addRow({"2024-01-03", "Building B"}) == false);
    BOOST_TEST_REQUIRE(table.addRow({"2024-01-03", "Building B", "1", "2"}) == false);

    BOOST_REQUIRE_EQUAL(2, table.numberRows());
    BOOST_TEST_REQUIRE(table.empty() == false);
    BOOST_REQUIRE_EQUAL(std::string("Building B"), table.value(1, 1));
    BOOST_REQUIRE_EQUAL(std::string("12.5"), table.row(0)[2]);

    // Field names are fixed once there are rows
    BOOST_TEST_REQUIRE(table.fieldNames({"a", "b", "c"}) == false);
    BOOST_REQUIRE_EQUAL(std::string("date"), table.fieldNames()[0]);
}

BOOST_AUTO_TEST_SUITE_END()
