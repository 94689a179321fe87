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
#include <core/CStreamUtils.h>

#include <boost/test/unit_test.hpp>

#include <sstream>
#include <string>

BOOST_AUTO_TEST_SUITE(CStreamUtilsTest)

BOOST_AUTO_TEST_CASE(testSkipUtf8Bom) {
    {
        std::istringstream strm{"\xEF\xBB\xBF"
                                "date,facility"};
        BOOST_TEST_REQUIRE(ecosense::core::CStreamUtils::skipUtf8Bom(strm));
        std::string line;
        std::getline(strm, line);
        BOOST_REQUIRE_EQUAL(std::string("date,facility"), line);
    }
    {
        std::istringstream strm{"date,facility"};
        BOOST_TEST_REQUIRE(ecosense::core::CStreamUtils::skipUtf8Bom(strm) == false);
        std::string line;
        std::getline(strm, line);
        BOOST_REQUIRE_EQUAL(std::string("date,facility"), line);
    }
    {
        std::istringstream strm{""};
        BOOST_TEST_REQUIRE(ecosense::core::CStreamUtils::skipUtf8Bom(strm) == false);
    }
}

BOOST_AUTO_TEST_SUITE_END()
