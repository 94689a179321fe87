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
#include <core/CLogger.h>

#include <test/CTestTmpDir.h>

#include <boost/test/unit_test.hpp>

#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>

#include <stdio.h>

BOOST_AUTO_TEST_SUITE(CLoggerTest)

namespace {
class CTestFixture {
public:
    ~CTestFixture() {
        // Tests in this file can leave the logger in an unusual state, so reset it
        // after each test
        ecosense::core::CLogger::instance().reset();
    }
};

std::string freshLogFile(const std::string& name) {
    std::string fileName{ecosense::test::CTestTmpDir::tmpFile(name)};
    ::remove(fileName.c_str());
    return fileName;
}

std::string readFile(const std::string& fileName) {
    std::ifstream strm(fileName);
    return std::string{std::istreambuf_iterator<char>(strm), std::istreambuf_iterator<char>()};
}
}

BOOST_FIXTURE_TEST_CASE(testLogging, CTestFixture) {
    std::string t("Test message");

    LOG_TRACE(<< "Trace");
    LOG_AT_LEVEL(ecosense::core::CLogger::E_Trace, << "Dynamic TRACE " << 1);
    LOG_DEBUG(<< "Debug");
    LOG_AT_LEVEL(ecosense::core::CLogger::E_Debug, << "Dynamic DEBUG " << 2.0);
    LOG_INFO(<< "Info " << std::boolalpha << true);
    LOG_WARN(<< "Warn " << t);
    LOG_ERROR(<< "Error " << 1000 << ' ' << 0.23124F);
    LOG_FATAL(<< "Fatal - application to handle exit");
    try {
        LOG_ABORT(<< "Throwing exception " << 1221U << ' ' << 0.23124);

        BOOST_TEST_REQUIRE(false);
    } catch (std::runtime_error&) { BOOST_TEST_REQUIRE(true); }
}

BOOST_FIXTURE_TEST_CASE(testLogToFile, CTestFixture) {
    ecosense::core::CLogger& logger{ecosense::core::CLogger::instance()};
    std::string logFile{freshLogFile("testLogToFile.log")};

    BOOST_TEST_REQUIRE(logger.hasBeenReconfigured() == false);
    BOOST_TEST_REQUIRE(logger.reconfigure(logFile, ""));
    BOOST_TEST_REQUIRE(logger.hasBeenReconfigured());

    LOG_INFO(<< "Consumption loaded for " << 3 << " facilities");
    LOG_TRACE(<< "Below the default level");

    std::string logged{readFile(logFile)};
    BOOST_TEST_REQUIRE(logged.find("INFO CLoggerTest.cc@") != std::string::npos);
    BOOST_TEST_REQUIRE(logged.find("Consumption loaded for 3 facilities") != std::string::npos);
    BOOST_TEST_REQUIRE(logged.find("Below the default level") == std::string::npos);
}

BOOST_FIXTURE_TEST_CASE(testLogToUnwritableFile, CTestFixture) {
    ecosense::core::CLogger& logger{ecosense::core::CLogger::instance()};

    BOOST_TEST_REQUIRE(logger.reconfigureLogToFile("/nonexistent/dir/file.log") == false);
    BOOST_TEST_REQUIRE(logger.reconfigureFromFile("nonexistantfile") == false);
    BOOST_TEST_REQUIRE(logger.hasBeenReconfigured() == false);
}

BOOST_FIXTURE_TEST_CASE(testSetLevel, CTestFixture) {
    ecosense::core::CLogger& logger{ecosense::core::CLogger::instance()};
    std::string logFile{freshLogFile("testSetLevel.log")};
    BOOST_TEST_REQUIRE(logger.reconfigureLogToFile(logFile));

    BOOST_TEST_REQUIRE(logger.setLoggingLevel(ecosense::core::CLogger::E_Error));
    LOG_WARN(<< "Warning should be filtered");
    LOG_ERROR(<< "Error should be seen");

    BOOST_TEST_REQUIRE(logger.setLoggingLevel(ecosense::core::CLogger::E_Trace));
    LOG_TRACE(<< "Trace should be seen");

    std::string logged{readFile(logFile)};
    BOOST_TEST_REQUIRE(logged.find("Warning should be filtered") == std::string::npos);
    BOOST_TEST_REQUIRE(logged.find("Error should be seen") != std::string::npos);
    BOOST_TEST_REQUIRE(logged.find("Trace should be seen") != std::string::npos);
}

BOOST_FIXTURE_TEST_CASE(testReconfigureFromSettings, CTestFixture) {
    ecosense::core::CLogger& logger{ecosense::core::CLogger::instance()};
    std::string logFile{freshLogFile("testReconfigureFromSettings.log")};
    std::string settingsFile{ecosense::test::CTestTmpDir::tmpFile("boost.log.ini")};
    {
        std::ofstream settings(settingsFile);
        settings << "[Core]\n"
                 << "Filter=\"%Severity% >= WARN\"\n"
                 << "[Sinks.File]\n"
                 << "Destination=TextFile\n"
                 << "FileName=\"" << logFile << "\"\n"
                 << "AutoFlush=true\n"
                 << "Format=\"%Severity% %Message%\"\n";
    }

    BOOST_TEST_REQUIRE(logger.reconfigure("", settingsFile));
    BOOST_TEST_REQUIRE(logger.hasBeenReconfigured());

    LOG_INFO(<< "Info is below the configured level");
    LOG_ERROR(<< "Error is above the configured level");

    // Closes the file sink
    logger.reset();

    std::string logged{readFile(logFile)};
    BOOST_TEST_REQUIRE(logged.find("Info is below") == std::string::npos);
    BOOST_TEST_REQUIRE(logged.find("ERROR Error is above the configured level") !=
                       std::string::npos);
}

BOOST_AUTO_TEST_CASE(testLevelNames) {
    using TLevel = ecosense::core::CLogger::ELevel;

    BOOST_REQUIRE_EQUAL(std::string("TRACE"),
                        ecosense::core::CLogger::levelToString(ecosense::core::CLogger::E_Trace));
    BOOST_REQUIRE_EQUAL(std::string("FATAL"),
                        ecosense::core::CLogger::levelToString(ecosense::core::CLogger::E_Fatal));

    TLevel level{ecosense::core::CLogger::E_Debug};
    BOOST_TEST_REQUIRE(ecosense::core::CLogger::levelFromString("warn", level));
    BOOST_REQUIRE_EQUAL(ecosense::core::CLogger::E_Warn, level);
    BOOST_TEST_REQUIRE(ecosense::core::CLogger::levelFromString("Error", level));
    BOOST_REQUIRE_EQUAL(ecosense::core::CLogger::E_Error, level);
    BOOST_TEST_REQUIRE(ecosense::core::CLogger::levelFromString("verbose", level) == false);
    BOOST_REQUIRE_EQUAL(ecosense::core::CLogger::E_Error, level);

    std::istringstream strm{"info"};
    strm >> level;
    BOOST_TEST_REQUIRE(strm.fail() == false);
    BOOST_REQUIRE_EQUAL(ecosense::core::CLogger::E_Info, level);
}

BOOST_FIXTURE_TEST_CASE(testFatalErrorHandler, CTestFixture) {
    std::string handled;
    {
        ecosense::core::CLogger::CScopeSetFatalErrorHandler scope{
            [&handled](std::string message) { handled = std::move(message); }};
        HANDLE_FATAL(<< "Input error: " << 42)
    }
    BOOST_REQUIRE_EQUAL(std::string("Input error: 42"), handled);
}

BOOST_AUTO_TEST_SUITE_END()
