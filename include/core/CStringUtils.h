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
#ifndef INCLUDED_ecosense_core_CStringUtils_h
#define INCLUDED_ecosense_core_CStringUtils_h

#include <core/ImportExport.h>

#include <cstddef>
#include <string>
#include <vector>

namespace ecosense {
namespace core {

//! \brief
//! A holder of string utility methods.
//!
//! DESCRIPTION:\n
//! Conversions between strings and numbers, plus the handful of
//! string manipulations needed to read CSV and configuration values.
//!
//! IMPLEMENTATION DECISIONS:\n
//! The conversions are built on the C library strtoX functions
//! rather than streams, since they give precise control over what
//! counts as trailing garbage.  The non-silent versions of
//! stringToType() log an error describing why a conversion failed.
//!
class CORE_EXPORT CStringUtils {
public:
    using TStrVec = std::vector<std::string>;

    //! We should only have one definition of whitespace across the whole
    //! product - this definition matches std::isspace() in the "C" locale
    static const std::string WHITESPACE_CHARS;

public:
    CStringUtils() = delete;

    //! Convert a number to a string.
    static std::string typeToString(int i);
    static std::string typeToString(long i);
    static std::string typeToString(unsigned long i);
    static std::string typeToString(unsigned long long i);

    //! Convert a double to the shortest string that reads back to the
    //! same value.
    static std::string typeToString(double d);

    //! Convert a double to a string with exactly \p decimals digits after
    //! the decimal point.
    static std::string typeToStringFixed(double d, int decimals);

    //! Convert a string to a number, logging an error on failure.
    template<typename T>
    static bool stringToType(const std::string& str, T& ret) {
        return CStringUtils::_stringToType(false, str, ret);
    }

    //! As above but without logging.
    template<typename T>
    static bool stringToTypeSilent(const std::string& str, T& ret) {
        return CStringUtils::_stringToType(true, str, ret);
    }

    //! Convert a string to lower case
    static std::string toLower(std::string str);

    //! Convert a string to upper case
    static std::string toUpper(std::string str);

    //! Trim whitespace from the beginning and end of a string
    static void trimWhitespace(std::string& str);

    //! Trim certain characters from the beginning and end of a string
    static void trim(const std::string& toTrim, std::string& str);

    //! Split \p str at every occurrence of \p delim.  Empty tokens are
    //! kept, so "a,,b" gives three tokens.
    static TStrVec split(const std::string& str, char delim);

    //! Join strings using a delimiter.
    static std::string join(const TStrVec& strings, const std::string& delimiter);

private:
    static bool _stringToType(bool silent, const std::string& str, int& ret);
    static bool _stringToType(bool silent, const std::string& str, long& ret);
    static bool _stringToType(bool silent, const std::string& str, unsigned long& ret);
    static bool _stringToType(bool silent, const std::string& str, unsigned long long& ret);
    static bool _stringToType(bool silent, const std::string& str, double& ret);
    static bool _stringToType(bool silent, const std::string& str, bool& ret);
};
}
}

#endif // INCLUDED_ecosense_core_CStringUtils_h
