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
#include <api/CCsvInputParser.h>

#include <core/CLogger.h>
#include <core/CStreamUtils.h>
#include <core/CoreTypes.h>

#include <analysis/CRawTable.h>

#include <algorithm>
#include <istream>

namespace ecosense {
namespace api {

// Initialise statics
const char CCsvInputParser::RECORD_END('\n');
const char CCsvInputParser::STRIP_BEFORE_END('\r');

CCsvInputParser::CCsvInputParser(std::istream& strmIn, char separator)
    : m_StrmIn{strmIn}, m_RecordLineNumber{0}, m_LineNumber{0}, m_BomChecked{false},
      m_StreamFailed{false}, m_GotFieldNames{false}, m_NumberRecords{0},
      m_LineParser{separator} {
}

CCsvInputParser::CCsvInputParser(const std::string& input, char separator)
    : m_StringInputBuf{input}, m_StrmIn{m_StringInputBuf}, m_RecordLineNumber{0},
      m_LineNumber{0}, m_BomChecked{false}, m_StreamFailed{false},
      m_GotFieldNames{false}, m_NumberRecords{0}, m_LineParser{separator} {
}

bool CCsvInputParser::readStreamIntoVecs(const TVecReaderFunc& readerFunc) {
    if (m_GotFieldNames == false) {
        if (this->readRecord() == false) {
            if (m_StreamFailed) {
                return false;
            }
            // Don't scare the user with error messages if we've just
            // received an empty input
            LOG_DEBUG(<< "Received empty input");
            return true;
        }
        if (this->parseFieldNames() == false) {
            LOG_ERROR(<< "Failed to parse field names from stream");
            return false;
        }
    }

    // We reuse the same value vector for every record
    TStrVec fieldValues;
    fieldValues.reserve(m_FieldNames.size());

    while (this->readRecord()) {
        if (this->parseDataRecord(fieldValues) == false) {
            LOG_ERROR(<< "Failed to parse data record from stream");
            return false;
        }
        ++m_NumberRecords;
        if (readerFunc(m_FieldNames, fieldValues) == false) {
            LOG_ERROR(<< "Record handler function forced exit");
            return false;
        }
    }

    if (m_StreamFailed) {
        return false;
    }

    LOG_DEBUG(<< "Read " << m_NumberRecords << " records");

    return true;
}

bool CCsvInputParser::readStreamIntoTable(analysis::CRawTable& table) {
    bool fieldNamesSet{false};
    bool result{this->readStreamIntoVecs(
        [&table, &fieldNamesSet](const TStrVec& fieldNames, const TStrVec& fieldValues) {
            if (fieldNamesSet == false) {
                if (table.fieldNames(fieldNames) == false) {
                    return false;
                }
                fieldNamesSet = true;
            }
            return table.addRow(fieldValues);
        })};
    if (result && fieldNamesSet == false && m_GotFieldNames) {
        // Header only
        result = table.fieldNames(m_FieldNames);
    }
    return result;
}

const CCsvInputParser::TStrVec& CCsvInputParser::fieldNames() const {
    return m_FieldNames;
}

bool CCsvInputParser::gotFieldNames() const {
    return m_GotFieldNames;
}

bool CCsvInputParser::gotData() const {
    return m_NumberRecords > 0;
}

std::size_t CCsvInputParser::numberRecords() const {
    return m_NumberRecords;
}

bool CCsvInputParser::readRecord() {
    if (m_BomChecked == false) {
        core::CStreamUtils::skipUtf8Bom(m_StrmIn);
        m_BomChecked = true;
    }

    m_CurrentRowStr.clear();
    std::string line;
    std::size_t quoteCount{0};
    bool started{false};

    while (std::getline(m_StrmIn, line, RECORD_END)) {
        ++m_LineNumber;
        if (line.empty() == false && line.back() == STRIP_BEFORE_END) {
            line.pop_back();
        }
        if (started == false) {
            if (line.empty()) {
                // Skip blank lines between records
                continue;
            }
            started = true;
            m_RecordLineNumber = m_LineNumber;
        } else {
            // The newline was inside quotes so it's part of the field
            m_CurrentRowStr += RECORD_END;
        }
        m_CurrentRowStr += line;

        // In Excel style CSV, quote characters are escaped by doubling
        // them up.  Therefore, if what we've read of a record up to now
        // contains an odd number of quote characters then we need to
        // read more.
        quoteCount += static_cast<std::size_t>(
            std::count(line.begin(), line.end(), core::CCsvLineParser::QUOTE));
        if ((quoteCount % 2) == 0) {
            return true;
        }
    }

    if (m_StrmIn.bad()) {
        LOG_ERROR(<< "Input stream is bad");
        m_StreamFailed = true;
        return false;
    }
    if (started) {
        LOG_ERROR(<< "Unterminated quoted field in record starting at line "
                  << m_RecordLineNumber << ":" << core_t::LINE_ENDING << m_CurrentRowStr);
        m_StreamFailed = true;
    }
    return false;
}

bool CCsvInputParser::parseFieldNames() {
    LOG_TRACE(<< "Parse field names");

    if (m_LineParser.parseLine(m_CurrentRowStr, m_FieldNames) == false) {
        LOG_ERROR(<< "Failed to get CSV tokens from header:" << core_t::LINE_ENDING
                  << m_CurrentRowStr);
        m_FieldNames.clear();
        return false;
    }

    m_GotFieldNames = true;

    LOG_TRACE(<< "Field names " << m_CurrentRowStr);

    return true;
}

bool CCsvInputParser::parseDataRecord(TStrVec& values) {
    if (m_LineParser.parseLine(m_CurrentRowStr, values) == false) {
        LOG_ERROR(<< "Failed to get CSV tokens from line " << m_RecordLineNumber);
        return false;
    }

    if (values.size() != m_FieldNames.size()) {
        LOG_ERROR(<< "Data record at line " << m_RecordLineNumber << " contains "
                  << values.size() << " fields but the header contains "
                  << m_FieldNames.size() << ":" << core_t::LINE_ENDING << m_CurrentRowStr);
        return false;
    }

    return true;
}
}
}
