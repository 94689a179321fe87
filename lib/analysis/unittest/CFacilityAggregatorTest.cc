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
#include <analysis/CAnomalyDetector.h>
#include <analysis/CConsumptionRecord.h>
#include <analysis/CFacilityAggregator.h>

#include <boost/test/tools/floating_point_comparison.hpp>
#include <boost/test/unit_test.hpp>

#include <string>
#include <vector>

BOOST_AUTO_TEST_SUITE(CFacilityAggregatorTest)

using namespace ecosense;

BOOST_AUTO_TEST_CASE(testRollups) {
    analysis::TConsumptionRecordVec records;
    records.emplace_back(0, 0, "Building A", 100.0);
    records.emplace_back(0, 0, "Building B", 10.0);
    records.emplace_back(core_t::HOUR, 1, "Building A", 300.0);
    records.emplace_back(core_t::HOUR, 1, "Building B", 20.0);
    records.emplace_back(2 * core_t::HOUR, 2, "Building A", 200.0);

    // Threshold is 100
    analysis::CAnomalyDetector{50.0}.detect(records);

    analysis::TStrFacilityRollupMap rollups{analysis::CFacilityAggregator::aggregate(records)};

    BOOST_REQUIRE_EQUAL(2, rollups.size());
    const analysis::SFacilityRollup& a = rollups["Building A"];
    BOOST_REQUIRE_EQUAL(600.0, a.s_Total);
    BOOST_REQUIRE_EQUAL(200.0, a.s_Average);
    BOOST_REQUIRE_EQUAL(2, a.s_AnomalyCount);
    BOOST_REQUIRE_EQUAL(3, a.s_Count);
    const analysis::SFacilityRollup& b = rollups["Building B"];
    BOOST_REQUIRE_EQUAL(30.0, b.s_Total);
    BOOST_REQUIRE_EQUAL(15.0, b.s_Average);
    BOOST_REQUIRE_EQUAL(0, b.s_AnomalyCount);
}

BOOST_AUTO_TEST_CASE(testConservation) {
    std::vector<std::string> facilities{"Building A", "Building B", "Hostel Block C",
                                        "Lab Block D", "Library Block"};
    analysis::TConsumptionRecordVec records;
    double total{0.0};
    for (std::size_t i = 0; i < 500; ++i) {
        // Deterministic but uneven values and facility assignment
        double value{static_cast<double>((i * 7919) % 1000) / 10.0 + 0.37};
        const std::string& facility = facilities[(i * i) % 3 + (i % 7 == 0 ? 3 : 0)];
        records.emplace_back(static_cast<core_t::TTime>(i) * core_t::HOUR,
                             static_cast<int>(i % 24), facility, value);
        total += value;
    }
    analysis::CAnomalyDetector{75.0}.detect(records);

    analysis::TStrFacilityRollupMap rollups{analysis::CFacilityAggregator::aggregate(records)};

    double rolledUp{0.0};
    std::size_t count{0};
    for (const auto& rollup : rollups) {
        BOOST_TEST_REQUIRE(rollup.second.s_Count > 0);
        rolledUp += rollup.second.s_Total;
        count += rollup.second.s_Count;
    }
    BOOST_REQUIRE_CLOSE_FRACTION(total, rolledUp, 1e-12);
    BOOST_REQUIRE_EQUAL(records.size(), count);
    // Squares are never 2 mod 3, so nothing maps to Hostel Block C and
    // there's no bucket for it
    BOOST_REQUIRE_EQUAL(4, rollups.size());
    BOOST_TEST_REQUIRE(rollups.count("Hostel Block C") == 0);
}

BOOST_AUTO_TEST_CASE(testEmpty) {
    BOOST_TEST_REQUIRE(analysis::CFacilityAggregator::aggregate({}).empty());
}

BOOST_AUTO_TEST_SUITE_END()
