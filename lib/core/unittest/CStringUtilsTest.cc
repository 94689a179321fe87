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
#include <core/CStringUtils.h>

#include <boost/test/unit_test.hpp>

#include <string>

BOOST_AUTO_TEST_SUITE(CStringUtilsTest)

using ecosense::core::CStringUtils;

BOOST_AUTO_TEST_CASE(testStringToType) {
    {
        double d{0.0};
        BOOST_TEST_REQUIRE(CStringUtils::stringToType("152.75", d));
        BOOST_REQUIRE_EQUAL(152.75, d);
        BOOST_TEST_REQUIRE(CStringUtils::stringToType("-1e3", d));
        BOOST_REQUIRE_EQUAL(-1000.0, d);
        BOOST_TEST_REQUIRE(CStringUtils::stringToType("1e999", d) == false);
        BOOST_TEST_REQUIRE(CStringUtils::stringToType("12kwh", d) == false);
        BOOST_TEST_REQUIRE(CStringUtils::stringToType("", d) == false);
        BOOST_TEST_REQUIRE(CStringUtils::stringToTypeSilent("abc", d) == false);
        BOOST_REQUIRE_EQUAL(-1000.0, d);
    }
    {
        int i{0};
        BOOST_TEST_REQUIRE(CStringUtils::stringToType("23", i));
        BOOST_REQUIRE_EQUAL(23, i);
        BOOST_TEST_REQUIRE(CStringUtils::stringToType("-5", i));
        BOOST_REQUIRE_EQUAL(-5, i);
        BOOST_TEST_REQUIRE(CStringUtils::stringToType("2.5", i) == false);
        BOOST_TEST_REQUIRE(CStringUtils::stringToType("99999999999", i) == false);
    }
    {
        unsigned long u{0};
        BOOST_TEST_REQUIRE(CStringUtils::stringToType("42", u));
        BOOST_REQUIRE_EQUAL(42UL, u);
        BOOST_TEST_REQUIRE(CStringUtils::stringToType("-42", u) == false);
    }
    {
        bool b{false};
        BOOST_TEST_REQUIRE(CStringUtils::stringToType("TRUE", b));
        BOOST_TEST_REQUIRE(b);
        BOOST_TEST_REQUIRE(CStringUtils::stringToType("no", b));
        BOOST_TEST_REQUIRE(b == false);
        BOOST_TEST_REQUIRE(CStringUtils::stringToType("maybe", b) == false);
    }
}

BOOST_AUTO_TEST_CASE(testTypeToString) {
    BOOST_REQUIRE_EQUAL(std::string("17"), CStringUtils::typeToString(17));
    BOOST_REQUIRE_EQUAL(std::string("0.1"), CStringUtils::typeToString(0.1));
    BOOST_REQUIRE_EQUAL(std::string("100"), CStringUtils::typeToString(100.0));
    BOOST_REQUIRE_EQUAL(std::string("1234.57"), CStringUtils::typeToStringFixed(1234.5678, 2));
    BOOST_REQUIRE_EQUAL(std::string("100.00"), CStringUtils::typeToStringFixed(100.0, 2));
    BOOST_REQUIRE_EQUAL(std::string("3"), CStringUtils::typeToStringFixed(2.5001, 0));
}

BOOST_AUTO_TEST_CASE(testCase) {
    BOOST_REQUIRE_EQUAL(std::string("ELECTRICITY"), CStringUtils::toUpper("electricity"));
    BOOST_REQUIRE_EQUAL(std::string("stable"), CStringUtils::toLower("Stable"));
}

BOOST_AUTO_TEST_CASE(testTrim) {
    std::string str{"  \t Building A \r\n"};
    CStringUtils::trimWhitespace(str);
    BOOST_REQUIRE_EQUAL(std::string("Building A"), str);

    str = " \t ";
    CStringUtils::trimWhitespace(str);
    BOOST_TEST_REQUIRE(str.empty());

    str = "\"quoted\"";
    CStringUtils::trim("\"", str);
    BOOST_REQUIRE_EQUAL(std::string("quoted"), str);
}

BOOST_AUTO_TEST_CASE(testSplitAndJoin) {
    CStringUtils::TStrVec tokens{CStringUtils::split("22,23,,0", ',')};
    BOOST_REQUIRE_EQUAL(4, tokens.size());
    BOOST_REQUIRE_EQUAL(std::string("22"), tokens[0]);
    BOOST_REQUIRE_EQUAL(std::string(""), tokens[2]);
    BOOST_REQUIRE_EQUAL(std::string("0"), tokens[3]);

    BOOST_REQUIRE_EQUAL(std::string("22;23;;0"), CStringUtils::join(tokens, ";"));
    BOOST_REQUIRE_EQUAL(std::string(""), CStringUtils::join({}, ","));

    tokens = CStringUtils::split("", ',');
    BOOST_REQUIRE_EQUAL(1, tokens.size());
}

BOOST_AUTO_TEST_SUITE_END()
