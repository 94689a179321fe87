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
#include <core/CTimeUtils.h>

#include <boost/test/unit_test.hpp>

#include <string>

BOOST_AUTO_TEST_SUITE(CTimeUtilsTest)

using ecosense::core::CTimeUtils;
using TTime = ecosense::core_t::TTime;

BOOST_AUTO_TEST_CASE(testParseDateTime) {
    // 2024-03-01T00:00:00Z
    const TTime midnight{1709251200};

    TTime t{0};
    BOOST_TEST_REQUIRE(CTimeUtils::parseDateTime("2024-03-01", t));
    BOOST_REQUIRE_EQUAL(midnight, t);

    BOOST_TEST_REQUIRE(CTimeUtils::parseDateTime("2024-03-01 22:00", t));
    BOOST_REQUIRE_EQUAL(midnight + 22 * 3600, t);

    BOOST_TEST_REQUIRE(CTimeUtils::parseDateTime("2024-03-01 05:30:15", t));
    BOOST_REQUIRE_EQUAL(midnight + 5 * 3600 + 30 * 60 + 15, t);

    BOOST_TEST_REQUIRE(CTimeUtils::parseDateTime("2024-03-01T23:59:59", t));
    BOOST_REQUIRE_EQUAL(midnight + 86399, t);

    BOOST_TEST_REQUIRE(CTimeUtils::parseDateTime(" 2024-03-01 ", t));
    BOOST_REQUIRE_EQUAL(midnight, t);
}

BOOST_AUTO_TEST_CASE(testParseInvalidDateTime) {
    TTime t{12345};
    BOOST_TEST_REQUIRE(CTimeUtils::parseDateTime("", t) == false);
    BOOST_TEST_REQUIRE(CTimeUtils::parseDateTime("yesterday", t) == false);
    BOOST_TEST_REQUIRE(CTimeUtils::parseDateTime("2024-02-31", t) == false);
    BOOST_TEST_REQUIRE(CTimeUtils::parseDateTime("2024-03-01 25:00", t) == false);
    BOOST_TEST_REQUIRE(CTimeUtils::parseDateTime("2024-03-01 10:00 extra", t) == false);
    BOOST_REQUIRE_EQUAL(TTime{12345}, t);

    BOOST_TEST_REQUIRE(CTimeUtils::strptime("%Y-%m-%d", "01/03/2024", t) == false);
}

BOOST_AUTO_TEST_CASE(testHourAndDay) {
    TTime t{0};
    BOOST_TEST_REQUIRE(CTimeUtils::parseDateTime("2024-03-01 22:15", t));
    BOOST_REQUIRE_EQUAL(22, CTimeUtils::hourOfDay(t));
    BOOST_REQUIRE_EQUAL(std::string("2024-03-01"), CTimeUtils::toIsoDate(t));
    BOOST_REQUIRE_EQUAL(std::string("2024-03-01 22:15:00"), CTimeUtils::toIsoDateTime(t));

    TTime day{0};
    BOOST_TEST_REQUIRE(CTimeUtils::parseDateTime("2024-03-01", day));
    BOOST_REQUIRE_EQUAL(day, CTimeUtils::startOfDay(t));
    BOOST_REQUIRE_EQUAL(0, CTimeUtils::hourOfDay(day));

    // Before the epoch
    BOOST_TEST_REQUIRE(CTimeUtils::parseDateTime("1969-12-31 23:00", t));
    BOOST_REQUIRE_EQUAL(23, CTimeUtils::hourOfDay(t));
    BOOST_REQUIRE_EQUAL(std::string("1969-12-31"), CTimeUtils::toIsoDate(t));
}

BOOST_AUTO_TEST_CASE(testToLocalString) {
    std::string now{CTimeUtils::toLocalString(CTimeUtils::now())};
    // YYYY-MM-DD HH:MM:SS
    BOOST_REQUIRE_EQUAL(19, now.length());
    BOOST_REQUIRE_EQUAL('-', now[4]);
    BOOST_REQUIRE_EQUAL(' ', now[10]);
    BOOST_REQUIRE_EQUAL(':', now[13]);
}

BOOST_AUTO_TEST_SUITE_END()
