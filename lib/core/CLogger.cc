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

#include <boost/algorithm/string/predicate.hpp>
#include <boost/core/null_deleter.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/log/attributes/current_process_id.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/utility/formatting_ostream.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/filter_parser.hpp>
#include <boost/log/utility/setup/formatter_parser.hpp>
#include <boost/log/utility/setup/from_stream.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>

#include <fstream>
#include <iostream>
#include <stdexcept>

#include <stdlib.h>

namespace {
using TTextSink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>;
using TTextSinkPtr = boost::shared_ptr<TTextSink>;
using TOStreamPtr = boost::shared_ptr<std::ostream>;

const std::string LEVEL_NAMES[]{"TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL"};
const std::string UNKNOWN_LEVEL{"UNKNOWN"};
// Plain character arrays so they are usable however early the logger is
// first constructed
const char* const SEVERITY_ATTRIBUTE{"Severity"};
const char* const FILE_ATTRIBUTE{"File"};
const char* const LINE_ATTRIBUTE{"Line"};
const char* const FUNCTION_ATTRIBUTE{"Function"};

//! Keep just the last element of a path.
std::string cropPath(const std::string& fileName) {
    std::size_t pos{fileName.find_last_of("/\\")};
    return pos == std::string::npos ? fileName : fileName.substr(pos + 1);
}

//! Writes a record as:
//!
//! 2024-03-01 10:15:02.123456 [4242] DEBUG CAnomalyDetector.cc@71 message
void formatRecord(const boost::log::record_view& rec, boost::log::formatting_ostream& strm) {
    auto timeStamp = boost::log::extract<boost::posix_time::ptime>("TimeStamp", rec);
    if (timeStamp) {
        strm << boost::posix_time::to_simple_string(timeStamp.get()) << ' ';
    }
    auto pid = boost::log::extract<boost::log::attributes::current_process_id::value_type>(
        "ProcessID", rec);
    if (pid) {
        strm << '[' << pid.get() << "] ";
    }
    auto level = boost::log::extract<ecosense::core::CLogger::ELevel>(SEVERITY_ATTRIBUTE, rec);
    if (level) {
        strm << ecosense::core::CLogger::levelToString(level.get()) << ' ';
    }
    auto file = boost::log::extract<std::string>(FILE_ATTRIBUTE, rec);
    auto line = boost::log::extract<int>(LINE_ATTRIBUTE, rec);
    if (file && line) {
        strm << cropPath(file.get()) << '@' << line.get() << ' ';
    }
    strm << rec[boost::log::expressions::smessage];
}

TTextSinkPtr makeTextSink(const TOStreamPtr& strm) {
    auto sink = boost::make_shared<TTextSink>();
    sink->locked_backend()->add_stream(strm);
    sink->locked_backend()->auto_flush(true);
    sink->set_formatter(&formatRecord);
    return sink;
}

void addStderrSink() {
    boost::log::core::get()->add_sink(
        makeTextSink(TOStreamPtr{&std::cerr, boost::null_deleter()}));
}

// To ensure the singleton is constructed before multiple threads may require it
// call instance() during the static initialisation phase of the program.  Of
// course, the instance may already be constructed before this if another static
// object has used it.
const ecosense::core::CLogger& DO_NOT_USE_THIS_VARIABLE = ecosense::core::CLogger::instance();
}

namespace ecosense {
namespace core {

CLogger::CLogger()
    : m_Reconfigured{false}, m_FileAttributeName{FILE_ATTRIBUTE},
      m_LineAttributeName{LINE_ATTRIBUTE}, m_FunctionAttributeName{FUNCTION_ATTRIBUTE},
      m_FatalErrorHandler{defaultFatalErrorHandler} {
    boost::log::add_common_attributes();
    this->reset();
}

CLogger::~CLogger() {
    boost::log::core::get()->remove_all_sinks();
}

void CLogger::reset() {
    auto logCore = boost::log::core::get();
    logCore->remove_all_sinks();
    logCore->reset_filter();

    // Having a hardcoded stderr configuration means that the unit tests and
    // the command line program just work with minimal effort
    addStderrSink();
    this->setLoggingLevel(E_Debug);

    m_Reconfigured = false;
}

CLogger& CLogger::instance() {
    static CLogger instance;
    return instance;
}

bool CLogger::hasBeenReconfigured() const {
    return m_Reconfigured;
}

CLogger::TLevelSeverityLogger& CLogger::logger() {
    return m_Logger;
}

void CLogger::fatal() {
    throw std::runtime_error("EcoSense Fatal Exception");
}

void CLogger::fatalErrorHandler(const TFatalErrorHandler& handler) {
    m_FatalErrorHandler = handler;
}

const CLogger::TFatalErrorHandler& CLogger::fatalErrorHandler() const {
    return m_FatalErrorHandler;
}

void CLogger::handleFatal(std::string message) {
    m_FatalErrorHandler(std::move(message));
}

boost::log::attribute_name CLogger::fileAttributeName() const {
    return m_FileAttributeName;
}

boost::log::attribute_name CLogger::lineAttributeName() const {
    return m_LineAttributeName;
}

boost::log::attribute_name CLogger::functionAttributeName() const {
    return m_FunctionAttributeName;
}

bool CLogger::setLoggingLevel(ELevel level) {
    if (level < E_Trace || level > E_Fatal) {
        return false;
    }
    boost::log::core::get()->set_filter(
        boost::log::expressions::attr<ELevel>(SEVERITY_ATTRIBUTE) >= level);
    return true;
}

const std::string& CLogger::levelToString(ELevel level) {
    if (level < E_Trace || level > E_Fatal) {
        return UNKNOWN_LEVEL;
    }
    return LEVEL_NAMES[level];
}

bool CLogger::levelFromString(const std::string& name, ELevel& level) {
    for (int i = E_Trace; i <= E_Fatal; ++i) {
        if (boost::algorithm::iequals(name, LEVEL_NAMES[i])) {
            level = static_cast<ELevel>(i);
            return true;
        }
    }
    return false;
}

bool CLogger::reconfigure(const std::string& logFile, const std::string& propertiesFile) {
    if (propertiesFile.empty() == false && this->reconfigureFromFile(propertiesFile) == false) {
        return false;
    }
    if (logFile.empty() == false && this->reconfigureLogToFile(logFile) == false) {
        return false;
    }
    return true;
}

bool CLogger::reconfigureLogToFile(const std::string& logFile) {
    auto strm = boost::make_shared<std::ofstream>(logFile, std::ios::out | std::ios::app);
    if (strm->is_open() == false) {
        LOG_ERROR(<< "Cannot log to file " << logFile << " as it could not be opened for writing");
        return false;
    }

    boost::log::core::get()->add_sink(makeTextSink(strm));
    m_Reconfigured = true;

    LOG_DEBUG(<< "Logger is also logging to file " << logFile);

    return true;
}

bool CLogger::reconfigureFromFile(const std::string& propertiesFile) {
    std::ifstream strm(propertiesFile);
    if (strm.is_open() == false) {
        LOG_ERROR(<< "Unable to open properties file " << propertiesFile
                  << " for logger re-initialisation");
        return false;
    }

    if (this->reconfigureFromSettings(strm) == false) {
        return false;
    }

    LOG_DEBUG(<< "Logger re-initialised using properties file " << propertiesFile);

    return true;
}

bool CLogger::reconfigureFromSettings(std::istream& settingsStrm) {
    // The settings file refers to our severity attribute by name, so tell
    // Boost.Log how to parse and print it
    static const bool FACTORIES_REGISTERED{[] {
        boost::log::register_simple_formatter_factory<ELevel, char>(SEVERITY_ATTRIBUTE);
        boost::log::register_simple_filter_factory<ELevel, char>(SEVERITY_ATTRIBUTE);
        return true;
    }()};
    static_cast<void>(FACTORIES_REGISTERED);

    auto logCore = boost::log::core::get();
    logCore->remove_all_sinks();
    logCore->reset_filter();
    try {
        boost::log::init_from_stream(settingsStrm);
    } catch (const std::exception& e) {
        // Go back to the default configuration so the error can be seen
        this->reset();
        LOG_ERROR(<< "Failed to reinitialise logger: " << e.what());
        return false;
    }

    m_Reconfigured = true;

    return true;
}

void CLogger::defaultFatalErrorHandler(std::string message) {
    LOG_FATAL(<< message);
    ::exit(EXIT_FAILURE);
}

CLogger::CScopeSetFatalErrorHandler::CScopeSetFatalErrorHandler(const TFatalErrorHandler& handler)
    : m_OriginalFatalErrorHandler{CLogger::instance().fatalErrorHandler()} {
    CLogger::instance().fatalErrorHandler(handler);
}

CLogger::CScopeSetFatalErrorHandler::~CScopeSetFatalErrorHandler() {
    CLogger::instance().fatalErrorHandler(m_OriginalFatalErrorHandler);
}

std::ostream& operator<<(std::ostream& strm, CLogger::ELevel level) {
    return strm << CLogger::levelToString(level);
}

std::istream& operator>>(std::istream& strm, CLogger::ELevel& level) {
    std::string name;
    if (strm >> name && CLogger::levelFromString(name, level) == false) {
        strm.setstate(std::ios::failbit);
    }
    return strm;
}
}
}
