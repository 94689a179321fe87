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
#ifndef INCLUDED_ecosense_core_CCsvLineParser_h
#define INCLUDED_ecosense_core_CCsvLineParser_h

#include <core/ImportExport.h>

#include <string>
#include <vector>

namespace ecosense {
namespace core {

//! \brief
//! Parses single lines of CSV formatted data.
//!
//! DESCRIPTION:\n
//! Splits one CSV record into its fields.  Used by the CSV input
//! parser, which deals with records that span several physical
//! lines, but usable on its own wherever a single line of CSV needs
//! tokenising.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Excel conventions: a field is quoted only if it needs to be, and
//! a quote inside a quoted field is written as two adjacent quotes.
//! boost::escaped_list_separator uses backslash escapes instead, so
//! can't be used.
//!
class CORE_EXPORT CCsvLineParser {
public:
    using TStrVec = std::vector<std::string>;

    //! Default CSV separator
    static const char COMMA;

    //! CSV quote character
    static const char QUOTE;

public:
    //! Construct, optionally supplying a non-standard separator.
    //! The string to be parsed must be supplied by calling the
    //! reset() method.
    explicit CCsvLineParser(char separator = COMMA);

    //! Supply a new CSV string to be parsed.  The string must outlive
    //! the calls to parseNext().
    void reset(const std::string& line);

    //! Parse the next token from the current line.
    bool parseNext(std::string& value);

    //! Are we at the end of the current line?
    bool atEnd() const;

    //! Parse every field of \p line into \p fields.
    bool parseLine(const std::string& line, TStrVec& fields);

private:
    //! Input field separator.
    const char m_Separator;

    //! Did the separator character appear after the last CSV field
    //! we parsed?  If so there is one more (empty) field to come.
    bool m_SeparatorAfterLastField;

    //! The line to be parsed.
    const std::string* m_Line;

    //! Index of the next character to be read from the line.
    std::size_t m_Pos;

    //! The field currently being built.
    std::string m_WorkField;
};
}
}

#endif // INCLUDED_ecosense_core_CCsvLineParser_h
