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
#include <api/CAnomalyCsvWriter.h>

#include <core/CLogger.h>
#include <core/CStringUtils.h>
#include <core/CTimeUtils.h>

#include <analysis/CAnalysisResult.h>
#include <analysis/CResourceAnalyzer.h>

namespace ecosense {
namespace api {

CAnomalyCsvWriter::CAnomalyCsvWriter(std::ostream& strmOut) : m_Writer{strmOut} {
}

bool CAnomalyCsvWriter::write(const analysis::CAnalysisResult& result) {
    if (result.isError()) {
        LOG_WARN(<< "No anomalies to write: " << result.errorReason());
        return true;
    }

    if (m_Writer.writeRow({"date", "facility", result.resource().valueField(), "hour",
                           "anomaly_severity", "is_night_time"}) == false) {
        return false;
    }

    std::size_t written{0};
    for (const analysis::CConsumptionRecord& record :
         analysis::CResourceAnalyzer::anomalies(result)) {
        if (m_Writer.writeRow({core::CTimeUtils::toIsoDateTime(record.time()),
                               record.facility(),
                               core::CStringUtils::typeToString(record.value()),
                               core::CStringUtils::typeToString(record.hour()),
                               core::CStringUtils::typeToStringFixed(record.anomalySeverity(), 2),
                               record.isNightTime() ? "true" : "false"}) == false) {
            return false;
        }
        ++written;
    }

    LOG_DEBUG(<< "Wrote " << written << " anomalies");

    return true;
}
}
}
