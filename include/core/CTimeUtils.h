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
#ifndef INCLUDED_ecosense_core_CTimeUtils_h
#define INCLUDED_ecosense_core_CTimeUtils_h

#include <core/CoreTypes.h>
#include <core/ImportExport.h>

#include <string>

namespace ecosense {
namespace core {

//! \brief
//! A holder of time utility methods.
//!
//! DESCRIPTION:\n
//! A holder of time utility methods.  All methods are static; an object of
//! this class should never be constructed.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Times read from input data carry no timezone, so they are interpreted
//! as UTC.  This means that hour-of-day and calendar day calculations give
//! the same answer as the wall clock value in the data regardless of the
//! timezone of the machine doing the analysis.
//!
class CORE_EXPORT CTimeUtils {
public:
    CTimeUtils() = delete;

    //! Current time in seconds since the epoch
    static core_t::TTime now();

    //! Date and time to string according to local convention,
    //! e.g. 2024-03-01 17:45:02
    static std::string toLocalString(core_t::TTime t);

    //! Calendar date of a UTC time, e.g. 2024-03-01
    static std::string toIsoDate(core_t::TTime t);

    //! Date and time of a UTC time, e.g. 2024-03-01 17:45:02
    static std::string toIsoDateTime(core_t::TTime t);

    //! strptime interface
    //! NOTE: the time returned here is a UTC value
    static bool strptime(const std::string& format,
                         const std::string& dateTime,
                         core_t::TTime& preTime);

    //! Same strptime interface as above, but doesn't print any error messages
    static bool strptimeSilent(const std::string& format,
                               const std::string& dateTime,
                               core_t::TTime& preTime);

    //! Parse a date with an optional time of day.  Accepts
    //! YYYY-MM-DD, YYYY-MM-DD HH:MM and YYYY-MM-DD HH:MM:SS, with
    //! either a space or T between the date and the time.
    static bool parseDateTime(const std::string& dateTime, core_t::TTime& time);

    //! The hour of the day, 0-23, of a UTC time.
    static int hourOfDay(core_t::TTime t);

    //! Midnight at the start of the UTC day containing \p t.
    static core_t::TTime startOfDay(core_t::TTime t);

private:
    //! Factor out common code from the string conversion methods
    static std::string toStringCommon(core_t::TTime t, const char* format, bool local);
};
}
}

#endif // INCLUDED_ecosense_core_CTimeUtils_h
