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

#include <core/CLogger.h>
#include <core/CStringUtils.h>

#include <string.h>
#include <time.h>

namespace ecosense {
namespace core {
namespace {
//! Formats tried by parseDateTime(), most specific first so that a
//! shorter format never matches the prefix of a longer value.
const char* const DATE_TIME_FORMATS[]{"%Y-%m-%d %H:%M:%S", "%Y-%m-%dT%H:%M:%S",
                                      "%Y-%m-%d %H:%M", "%Y-%m-%dT%H:%M", "%Y-%m-%d"};

bool strptimeImpl(bool silent,
                  const std::string& format,
                  const std::string& dateTime,
                  core_t::TTime& preTime) {
    struct tm parsed;
    ::memset(&parsed, 0, sizeof(parsed));
    parsed.tm_isdst = 0;

    const char* excess{::strptime(dateTime.c_str(), format.c_str(), &parsed)};
    if (excess == nullptr) {
        if (!silent) {
            LOG_ERROR(<< "Unable to parse " << dateTime << " using " << format);
        }
        return false;
    }
    if (*excess != '\0') {
        if (!silent) {
            LOG_ERROR(<< "Parsing " << dateTime << " using " << format
                      << " left excess characters '" << excess << "'");
        }
        return false;
    }

    struct tm requested(parsed);
    core_t::TTime result{::timegm(&parsed)};

    // timegm() normalises out of range fields, so check that it didn't
    // have to, otherwise 2024-02-31 would be accepted as 2024-03-02
    if (parsed.tm_year != requested.tm_year || parsed.tm_mon != requested.tm_mon ||
        parsed.tm_mday != requested.tm_mday || parsed.tm_hour != requested.tm_hour ||
        parsed.tm_min != requested.tm_min || parsed.tm_sec != requested.tm_sec) {
        if (!silent) {
            LOG_ERROR(<< dateTime << " is not a valid date/time");
        }
        return false;
    }

    preTime = result;
    return true;
}
}

core_t::TTime CTimeUtils::now() {
    return ::time(nullptr);
}

std::string CTimeUtils::toLocalString(core_t::TTime t) {
    return CTimeUtils::toStringCommon(t, "%Y-%m-%d %H:%M:%S", true);
}

std::string CTimeUtils::toIsoDate(core_t::TTime t) {
    return CTimeUtils::toStringCommon(t, "%Y-%m-%d", false);
}

std::string CTimeUtils::toIsoDateTime(core_t::TTime t) {
    return CTimeUtils::toStringCommon(t, "%Y-%m-%d %H:%M:%S", false);
}

bool CTimeUtils::strptime(const std::string& format,
                          const std::string& dateTime,
                          core_t::TTime& preTime) {
    return strptimeImpl(false, format, dateTime, preTime);
}

bool CTimeUtils::strptimeSilent(const std::string& format,
                                const std::string& dateTime,
                                core_t::TTime& preTime) {
    return strptimeImpl(true, format, dateTime, preTime);
}

bool CTimeUtils::parseDateTime(const std::string& dateTime, core_t::TTime& time) {
    std::string trimmed{dateTime};
    CStringUtils::trimWhitespace(trimmed);
    if (trimmed.empty()) {
        return false;
    }
    for (const char* format : DATE_TIME_FORMATS) {
        if (CTimeUtils::strptimeSilent(format, trimmed, time)) {
            return true;
        }
    }
    LOG_TRACE(<< "'" << dateTime << "' matches none of the supported date formats");
    return false;
}

int CTimeUtils::hourOfDay(core_t::TTime t) {
    core_t::TTime secondsIntoDay{t % core_t::DAY};
    if (secondsIntoDay < 0) {
        secondsIntoDay += core_t::DAY;
    }
    return static_cast<int>(secondsIntoDay / core_t::HOUR);
}

core_t::TTime CTimeUtils::startOfDay(core_t::TTime t) {
    core_t::TTime secondsIntoDay{t % core_t::DAY};
    if (secondsIntoDay < 0) {
        secondsIntoDay += core_t::DAY;
    }
    return t - secondsIntoDay;
}

std::string CTimeUtils::toStringCommon(core_t::TTime t, const char* format, bool local) {
    struct tm out;
    bool converted{local ? ::localtime_r(&t, &out) != nullptr
                         : ::gmtime_r(&t, &out) != nullptr};
    if (converted == false) {
        LOG_ERROR(<< "Failed to convert time " << t << " to broken down form");
        return std::string{};
    }

    char buf[64];
    size_t length{::strftime(buf, sizeof(buf), format, &out)};
    return std::string(buf, length);
}
}
}
