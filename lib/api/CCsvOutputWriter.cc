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
#include <api/CCsvOutputWriter.h>

#include <core/CLogger.h>

#include <ostream>

namespace ecosense {
namespace api {

// Initialise statics
const char CCsvOutputWriter::COMMA(',');
const char CCsvOutputWriter::QUOTE('"');
const char CCsvOutputWriter::RECORD_END('\n');

CCsvOutputWriter::CCsvOutputWriter(std::ostream& strmOut, char separator)
    : m_StrmOut{strmOut}, m_Separator{separator} {
    if (m_Separator == QUOTE || m_Separator == RECORD_END) {
        LOG_ERROR(<< "CSV output writer will not generate parsable output because "
                     "separator character ("
                  << m_Separator << ") is the same as the quote or record end characters");
    }
}

bool CCsvOutputWriter::writeRow(const TStrVec& fields) {
    m_WorkRecord.clear();
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) {
            m_WorkRecord += m_Separator;
        }
        this->appendField(fields[i]);
    }
    m_WorkRecord += RECORD_END;

    m_StrmOut << m_WorkRecord;
    if (m_StrmOut.good() == false) {
        LOG_ERROR(<< "Failed to write CSV record " << m_WorkRecord);
        return false;
    }
    return true;
}

void CCsvOutputWriter::appendField(const std::string& field) {
    bool needOuterQuotes{false};
    for (char curChar : field) {
        if (curChar == m_Separator || curChar == QUOTE || curChar == RECORD_END ||
            curChar == '\r') {
            needOuterQuotes = true;
            break;
        }
    }

    if (needOuterQuotes == false) {
        m_WorkRecord += field;
        return;
    }

    m_WorkRecord += QUOTE;
    for (char curChar : field) {
        if (curChar == QUOTE) {
            m_WorkRecord += QUOTE;
        }
        m_WorkRecord += curChar;
    }
    m_WorkRecord += QUOTE;
}
}
}
