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
#include <analysis/AnalysisTypes.h>
#include <analysis/CConsumptionRecord.h>
#include <analysis/CTrendEstimator.h>

#include <boost/test/unit_test.hpp>

#include <vector>

BOOST_AUTO_TEST_SUITE(CTrendEstimatorTest)

using namespace ecosense;
using TDoubleVec = std::vector<double>;

BOOST_AUTO_TEST_CASE(testDirections) {
    BOOST_REQUIRE_EQUAL(analysis_t::E_Increasing,
                        analysis::CTrendEstimator::estimate(TDoubleVec{10, 10, 10, 20, 20, 20}));
    BOOST_REQUIRE_EQUAL(analysis_t::E_Decreasing,
                        analysis::CTrendEstimator::estimate(TDoubleVec{20, 20, 20, 10, 10, 10}));
    BOOST_REQUIRE_EQUAL(analysis_t::E_Stable,
                        analysis::CTrendEstimator::estimate(
                            TDoubleVec{10, 10, 10, 10.2, 10.2, 10.2}));
}

BOOST_AUTO_TEST_CASE(testBoundaries) {
    // Exactly 5% either way is stable
    BOOST_REQUIRE_EQUAL(analysis_t::E_Stable,
                        analysis::CTrendEstimator::estimate(TDoubleVec{100, 105}));
    BOOST_REQUIRE_EQUAL(analysis_t::E_Stable,
                        analysis::CTrendEstimator::estimate(TDoubleVec{100, 95}));
    BOOST_REQUIRE_EQUAL(analysis_t::E_Increasing,
                        analysis::CTrendEstimator::estimate(TDoubleVec{100, 106}));
    BOOST_REQUIRE_EQUAL(analysis_t::E_Decreasing,
                        analysis::CTrendEstimator::estimate(TDoubleVec{100, 94}));
}

BOOST_AUTO_TEST_CASE(testInsufficientData) {
    BOOST_REQUIRE_EQUAL(analysis_t::E_InsufficientData,
                        analysis::CTrendEstimator::estimate(TDoubleVec{}));
    BOOST_REQUIRE_EQUAL(analysis_t::E_InsufficientData,
                        analysis::CTrendEstimator::estimate(TDoubleVec{42}));
}

BOOST_AUTO_TEST_CASE(testZeroBaseline) {
    BOOST_REQUIRE_EQUAL(analysis_t::E_Stable,
                        analysis::CTrendEstimator::estimate(TDoubleVec{0, 0, 0, 5, 5, 5}));
    BOOST_REQUIRE_EQUAL(0.0, analysis::CTrendEstimator::changePercentage(
                                 TDoubleVec{0, 0, 0, 5, 5, 5}));
}

BOOST_AUTO_TEST_CASE(testOddLengthSplit) {
    // The first half is [10], the second [10, 40] with mean 25
    BOOST_REQUIRE_EQUAL(150.0, analysis::CTrendEstimator::changePercentage(TDoubleVec{10, 10, 40}));
    // The first half is [40], the second [10, 10]
    BOOST_REQUIRE_EQUAL(-75.0, analysis::CTrendEstimator::changePercentage(TDoubleVec{40, 10, 10}));
}

BOOST_AUTO_TEST_CASE(testRecordOrder) {
    // The split follows the order of the records, not their times
    analysis::TConsumptionRecordVec records;
    records.emplace_back(3 * core_t::HOUR, 3, "Building A", 20.0);
    records.emplace_back(4 * core_t::HOUR, 4, "Building A", 20.0);
    records.emplace_back(0 * core_t::HOUR, 0, "Building A", 10.0);
    records.emplace_back(1 * core_t::HOUR, 1, "Building A", 10.0);

    BOOST_REQUIRE_EQUAL(analysis_t::E_Decreasing, analysis::CTrendEstimator::estimate(records));
}

BOOST_AUTO_TEST_CASE(testPrint) {
    BOOST_REQUIRE_EQUAL(std::string("increasing"), analysis_t::print(analysis_t::E_Increasing));
    BOOST_REQUIRE_EQUAL(std::string("decreasing"), analysis_t::print(analysis_t::E_Decreasing));
    BOOST_REQUIRE_EQUAL(std::string("stable"), analysis_t::print(analysis_t::E_Stable));
    BOOST_REQUIRE_EQUAL(std::string("insufficient_data"),
                        analysis_t::print(analysis_t::E_InsufficientData));
}

BOOST_AUTO_TEST_SUITE_END()
