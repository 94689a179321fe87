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
#include <core/CCsvLineParser.h>

#include <core/CLogger.h>
#include <core/CoreTypes.h>

namespace ecosense {
namespace core {

// Initialise statics
const char CCsvLineParser::COMMA(',');
const char CCsvLineParser::QUOTE('"');

CCsvLineParser::CCsvLineParser(char separator)
    : m_Separator{separator}, m_SeparatorAfterLastField{false}, m_Line{nullptr}, m_Pos{0} {
}

void CCsvLineParser::reset(const std::string& line) {
    m_SeparatorAfterLastField = false;
    m_Line = &line;
    m_Pos = 0;
    m_WorkField.clear();
    m_WorkField.reserve(line.length());
}

bool CCsvLineParser::atEnd() const {
    return m_Line == nullptr || (m_Pos == m_Line->length() && !m_SeparatorAfterLastField);
}

bool CCsvLineParser::parseNext(std::string& value) {
    if (m_Line == nullptr) {
        return false;
    }

    const std::string& line{*m_Line};
    m_WorkField.clear();

    if (m_Pos == line.length()) {
        // Allow one empty token at the end of a line
        if (!m_SeparatorAfterLastField) {
            LOG_ERROR(<< "Trying to read too many fields from record:"
                      << core_t::LINE_ENDING << line);
            return false;
        }
        m_SeparatorAfterLastField = false;
        value.clear();
        return true;
    }

    bool insideQuotes{false};
    for (; m_Pos < line.length(); ++m_Pos) {
        char current{line[m_Pos]};
        if (insideQuotes) {
            if (current == QUOTE) {
                if (m_Pos + 1 < line.length() && line[m_Pos + 1] == QUOTE) {
                    // Doubled quote is a literal quote
                    m_WorkField += QUOTE;
                    ++m_Pos;
                } else {
                    insideQuotes = false;
                }
            } else {
                m_WorkField += current;
            }
        } else if (current == m_Separator) {
            ++m_Pos;
            m_SeparatorAfterLastField = true;
            value = m_WorkField;
            return true;
        } else if (current == QUOTE) {
            insideQuotes = true;
        } else {
            m_WorkField += current;
        }
    }

    m_SeparatorAfterLastField = false;

    if (insideQuotes) {
        LOG_ERROR(<< "Unmatched final quote in record:" << core_t::LINE_ENDING << line);
        return false;
    }

    value = m_WorkField;
    return true;
}

bool CCsvLineParser::parseLine(const std::string& line, TStrVec& fields) {
    fields.clear();
    if (line.empty()) {
        // A blank line is a single empty field
        fields.emplace_back();
        return true;
    }
    this->reset(line);
    std::string field;
    do {
        if (this->parseNext(field) == false) {
            return false;
        }
        fields.push_back(field);
    } while (this->atEnd() == false);
    return true;
}
}
}
