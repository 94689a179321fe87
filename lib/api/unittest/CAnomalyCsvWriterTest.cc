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
#include <analysis/CAnalyzerConfig.h>
#include <analysis/CConsumptionRecord.h>
#include <analysis/CDailyStatistics.h>
#include <analysis/CRawTable.h>
#include <analysis/CResourceAnalyzer.h>

#include <api/CAnomalyCsvWriter.h>
#include <api/CDailyStatisticsCsvWriter.h>

#include <test/CConsumptionTableFactory.h>

#include <boost/test/unit_test.hpp>

#include <sstream>
#include <string>

BOOST_AUTO_TEST_SUITE(CAnomalyCsvWriterTest)

using namespace ecosense;

BOOST_AUTO_TEST_CASE(testAnomalies) {
    analysis::CResourceAnalyzer analyzer{
        analysis::CResourceAnalyzer::electricity(analysis::CAnalyzerConfig::defaultConfig())};
    analysis::CAnalysisResult result{analyzer.analyze(
        test::CConsumptionTableFactory::hourly(
            "consumption_kwh", {100.0, 300.0, 200.0, 300.0, 50.0, 400.0}, 12),
        50.0)};

    std::ostringstream strm;
    api::CAnomalyCsvWriter writer{strm};
    BOOST_TEST_REQUIRE(writer.write(result));

    // Mean 225 and standard deviation 133.23
    BOOST_REQUIRE_EQUAL(std::string{"date,facility,consumption_kwh,hour,anomaly_severity,is_night_time\n"
                                    "2024-01-01 17:00:00,Building A,400,17,1.31,false\n"
                                    "2024-01-01 13:00:00,Building A,300,13,0.56,false\n"
                                    "2024-01-01 15:00:00,Building A,300,15,0.56,false\n"},
                        strm.str());
}

BOOST_AUTO_TEST_CASE(testQuotedFacilityAndNightTime) {
    test::CConsumptionTableFactory factory{"consumption_gallons"};
    factory.add("Library, Main", 23, 90.0).add("Library, Main", 12, 10.0).add("Gym", 13, 10.0);

    analysis::CResourceAnalyzer analyzer{
        analysis::CResourceAnalyzer::water(analysis::CAnalyzerConfig::defaultConfig())};
    analysis::CAnalysisResult result{analyzer.analyze(factory.table())};
    BOOST_REQUIRE_EQUAL(1, result.anomaliesDetected());

    std::ostringstream strm;
    api::CAnomalyCsvWriter writer{strm};
    BOOST_TEST_REQUIRE(writer.write(result));

    BOOST_REQUIRE_EQUAL(std::string{"date,facility,consumption_gallons,hour,anomaly_severity,is_night_time\n"
                                    "2024-01-01 23:00:00,\"Library, Main\",90,23,1.15,true\n"},
                        strm.str());
}

BOOST_AUTO_TEST_CASE(testErrorResult) {
    analysis::CResourceAnalyzer analyzer{
        analysis::CResourceAnalyzer::water(analysis::CAnalyzerConfig::defaultConfig())};

    std::ostringstream strm;
    api::CAnomalyCsvWriter writer{strm};
    BOOST_TEST_REQUIRE(writer.write(analyzer.analyze(analysis::CRawTable{})));
    BOOST_TEST_REQUIRE(strm.str().empty());
}

BOOST_AUTO_TEST_CASE(testDailyStatistics) {
    const core_t::TTime DAY1{1704067200};

    analysis::TConsumptionRecordVec records;
    records.emplace_back(DAY1 + 2 * core_t::HOUR, 2, "Building A", 1.0);
    records.emplace_back(DAY1 + 3 * core_t::HOUR, 3, "Building A", 2.0);
    records.emplace_back(DAY1 + 4 * core_t::HOUR, 4, "Building A", 3.0);
    records.emplace_back(DAY1 + core_t::DAY, 0, "Building A", 5.0);

    std::ostringstream strm;
    api::CDailyStatisticsCsvWriter writer{strm};
    BOOST_TEST_REQUIRE(writer.write(analysis::CDailyStatistics::compute(records)));

    BOOST_REQUIRE_EQUAL(std::string{"date,count,sum,mean,min,max,std\n"
                                    "2024-01-01,3,6.00,2.00,1.00,3.00,1.00\n"
                                    "2024-01-02,1,5.00,5.00,5.00,5.00,\n"},
                        strm.str());
}

BOOST_AUTO_TEST_SUITE_END()
