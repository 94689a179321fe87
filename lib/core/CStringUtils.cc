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

#include <core/CLogger.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

#include <errno.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

namespace ecosense {
namespace core {
namespace {

//! Shared error handling for the strtoX based conversions.  \p endPtr is
//! where the C library stopped reading and \p rangeError is whether it
//! reported ERANGE.
bool checkConversion(bool silent,
                     const std::string& str,
                     const char* endPtr,
                     bool rangeError,
                     const char* typeName) {
    if (rangeError) {
        if (!silent) {
            LOG_ERROR(<< "Unable to convert string '" << str << "' to " << typeName
                      << ": " << ::strerror(ERANGE));
        }
        return false;
    }
    if (endPtr == str.c_str()) {
        if (!silent) {
            LOG_ERROR(<< "Unable to convert string '" << str << "' to " << typeName
                      << ": no digits");
        }
        return false;
    }
    if (endPtr != nullptr && *endPtr != '\0') {
        if (!silent) {
            LOG_ERROR(<< "Unable to convert string '" << str << "' to " << typeName
                      << ": first invalid character " << endPtr);
        }
        return false;
    }
    return true;
}

bool checkNotEmpty(bool silent, const std::string& str, const char* typeName) {
    if (str.empty()) {
        if (!silent) {
            LOG_ERROR(<< "Unable to convert empty string to " << typeName);
        }
        return false;
    }
    return true;
}
}

// Initialise statics
const std::string CStringUtils::WHITESPACE_CHARS(" \t\r\n\v\f");

std::string CStringUtils::typeToString(int i) {
    return std::to_string(i);
}

std::string CStringUtils::typeToString(long i) {
    return std::to_string(i);
}

std::string CStringUtils::typeToString(unsigned long i) {
    return std::to_string(i);
}

std::string CStringUtils::typeToString(unsigned long long i) {
    return std::to_string(i);
}

std::string CStringUtils::typeToString(double d) {
    // 17 significant figures always round trips, but try the shorter
    // representations first so 0.1 doesn't print as 0.10000000000000001
    char buf[32];
    for (int precision = 15; precision <= 17; ++precision) {
        ::snprintf(buf, sizeof(buf), "%.*g", precision, d);
        if (::strtod(buf, nullptr) == d) {
            break;
        }
    }
    return buf;
}

std::string CStringUtils::typeToStringFixed(double d, int decimals) {
    // Fixed notation can need up to 309 digits before the decimal point
    char buf[512];
    ::snprintf(buf, sizeof(buf), "%.*f", std::max(decimals, 0), d);
    return buf;
}

std::string CStringUtils::toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return str;
}

std::string CStringUtils::toUpper(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return str;
}

void CStringUtils::trimWhitespace(std::string& str) {
    CStringUtils::trim(WHITESPACE_CHARS, str);
}

void CStringUtils::trim(const std::string& toTrim, std::string& str) {
    if (toTrim.empty() || str.empty()) {
        return;
    }

    std::string::size_type pos{str.find_last_not_of(toTrim)};
    if (pos == std::string::npos) {
        // Special case - entire string is being trimmed
        str.clear();
        return;
    }
    str.erase(pos + 1);

    pos = str.find_first_not_of(toTrim);
    if (pos != std::string::npos && pos > 0) {
        str.erase(0, pos);
    }
}

CStringUtils::TStrVec CStringUtils::split(const std::string& str, char delim) {
    TStrVec tokens;
    std::string::size_type start{0};
    for (;;) {
        std::string::size_type pos{str.find(delim, start)};
        if (pos == std::string::npos) {
            tokens.push_back(str.substr(start));
            break;
        }
        tokens.push_back(str.substr(start, pos - start));
        start = pos + 1;
    }
    return tokens;
}

std::string CStringUtils::join(const TStrVec& strings, const std::string& delimiter) {
    std::string result;
    for (std::size_t i = 0; i < strings.size(); ++i) {
        if (i > 0) {
            result += delimiter;
        }
        result += strings[i];
    }
    return result;
}

bool CStringUtils::_stringToType(bool silent, const std::string& str, int& ret) {
    long value{0};
    if (CStringUtils::_stringToType(silent, str, value) == false) {
        return false;
    }
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        if (!silent) {
            LOG_ERROR(<< "Unable to convert string '" << str << "' to int: out of range");
        }
        return false;
    }
    ret = static_cast<int>(value);
    return true;
}

bool CStringUtils::_stringToType(bool silent, const std::string& str, long& ret) {
    if (checkNotEmpty(silent, str, "long") == false) {
        return false;
    }
    char* endPtr{nullptr};
    errno = 0;
    long value{::strtol(str.c_str(), &endPtr, 10)};
    if (checkConversion(silent, str, endPtr, errno == ERANGE, "long") == false) {
        return false;
    }
    ret = value;
    return true;
}

bool CStringUtils::_stringToType(bool silent, const std::string& str, unsigned long& ret) {
    if (checkNotEmpty(silent, str, "unsigned long") == false) {
        return false;
    }
    if (str[0] == '-') {
        if (!silent) {
            LOG_ERROR(<< "Unable to convert string '" << str << "' to unsigned long: negative");
        }
        return false;
    }
    char* endPtr{nullptr};
    errno = 0;
    unsigned long value{::strtoul(str.c_str(), &endPtr, 10)};
    if (checkConversion(silent, str, endPtr, errno == ERANGE, "unsigned long") == false) {
        return false;
    }
    ret = value;
    return true;
}

bool CStringUtils::_stringToType(bool silent, const std::string& str, unsigned long long& ret) {
    if (checkNotEmpty(silent, str, "unsigned long long") == false) {
        return false;
    }
    if (str[0] == '-') {
        if (!silent) {
            LOG_ERROR(<< "Unable to convert string '" << str
                      << "' to unsigned long long: negative");
        }
        return false;
    }
    char* endPtr{nullptr};
    errno = 0;
    unsigned long long value{::strtoull(str.c_str(), &endPtr, 10)};
    if (checkConversion(silent, str, endPtr, errno == ERANGE, "unsigned long long") == false) {
        return false;
    }
    ret = value;
    return true;
}

bool CStringUtils::_stringToType(bool silent, const std::string& str, double& ret) {
    if (checkNotEmpty(silent, str, "double") == false) {
        return false;
    }
    char* endPtr{nullptr};
    errno = 0;
    double value{::strtod(str.c_str(), &endPtr)};
    // Underflow to a denormal or zero is fine, overflow isn't
    bool overflow{errno == ERANGE && std::fabs(value) == HUGE_VAL};
    if (checkConversion(silent, str, endPtr, overflow, "double") == false) {
        return false;
    }
    ret = value;
    return true;
}

bool CStringUtils::_stringToType(bool silent, const std::string& str, bool& ret) {
    std::string lower{CStringUtils::toLower(str)};
    if (lower == "true" || lower == "yes" || lower == "1") {
        ret = true;
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "0") {
        ret = false;
        return true;
    }
    if (!silent) {
        LOG_ERROR(<< "Unable to convert string '" << str << "' to bool");
    }
    return false;
}
}
}
