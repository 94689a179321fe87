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
#include <analysis/CConsumptionRecord.h>
#include <analysis/CNightTimeClassifier.h>

#include <boost/test/unit_test.hpp>

BOOST_AUTO_TEST_SUITE(CNightTimeClassifierTest)

using namespace ecosense;

BOOST_AUTO_TEST_CASE(testDefaultWindow) {
    analysis::CNightTimeClassifier classifier;

    for (int hour = 0; hour < 24; ++hour) {
        bool expected{hour >= 22 || hour <= 5};
        BOOST_REQUIRE_EQUAL(expected, classifier.isNightTime(hour));
    }
    BOOST_REQUIRE_EQUAL(8, classifier.nightHours().size());
}

BOOST_AUTO_TEST_CASE(testCustomWindow) {
    analysis::CNightTimeClassifier classifier{{0, 1, 2}};

    BOOST_TEST_REQUIRE(classifier.isNightTime(1));
    BOOST_TEST_REQUIRE(classifier.isNightTime(22) == false);
}

BOOST_AUTO_TEST_CASE(testOnlyHourMatters) {
    analysis::TConsumptionRecordVec records;
    records.emplace_back(23 * core_t::HOUR, 23, "Building A", 10.0);
    records.emplace_back(core_t::DAY + 23 * core_t::HOUR, 23, "Cafeteria", 9000.0);
    records.emplace_back(12 * core_t::HOUR, 12, "Building A", 10.0);
    records.emplace_back(core_t::DAY + 12 * core_t::HOUR, 12, "Cafeteria", 0.0);

    analysis::CNightTimeClassifier{}.classify(records);

    BOOST_TEST_REQUIRE(records[0].isNightTime());
    BOOST_TEST_REQUIRE(records[1].isNightTime());
    BOOST_TEST_REQUIRE(records[2].isNightTime() == false);
    BOOST_TEST_REQUIRE(records[3].isNightTime() == false);
    // Classification doesn't touch the anomaly flags
    BOOST_TEST_REQUIRE(records[0].hasAnomalyFlags() == false);
}

BOOST_AUTO_TEST_SUITE_END()
