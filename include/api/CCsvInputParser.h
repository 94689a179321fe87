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
#ifndef INCLUDED_ecosense_api_CCsvInputParser_h
#define INCLUDED_ecosense_api_CCsvInputParser_h

#include <core/CCsvLineParser.h>

#include <api/ImportExport.h>

#include <functional>
#include <iosfwd>
#include <sstream>
#include <string>
#include <vector>

namespace ecosense {
namespace analysis {
class CRawTable;
}
namespace api {

//! \brief
//! Parse CSV formatted consumption data.
//!
//! DESCRIPTION:\n
//! The input format consists of:
//! 1) Input field names as Excel style CSV
//! 2) Data rows, each in Excel style CSV
//!
//! Each data row is passed to a supplied callback function, or collected
//! into a raw table.  Every data row must have exactly one value per
//! field name.  Blank lines are skipped.  A UTF-8 byte order mark at the
//! start of the input is skipped and Windows line endings are accepted.
//!
//! IMPLEMENTATION DECISIONS:\n
//! A quoted field may contain the record separator, so a record is only
//! complete once it contains an even number of quote characters.
//!
//! Input consisting of nothing at all is not an error.  It is reported
//! as no field names and no data, which the analysis treats as an empty
//! data set.
//!
class API_EXPORT CCsvInputParser {
public:
    using TStrVec = std::vector<std::string>;
    using TVecReaderFunc = std::function<bool(const TStrVec&, const TStrVec&)>;

public:
    //! CSV record end character
    static const char RECORD_END;

    //! Character to ignore at the end of lines
    static const char STRIP_BEFORE_END;

public:
    //! Construct with an input stream to be parsed.  Once a stream is
    //! passed to this constructor, no other object should read from it.
    explicit CCsvInputParser(std::istream& strmIn,
                             char separator = core::CCsvLineParser::COMMA);

    //! Construct to parse the CSV text \p input.
    explicit CCsvInputParser(const std::string& input,
                             char separator = core::CCsvLineParser::COMMA);

    CCsvInputParser(const CCsvInputParser&) = delete;
    CCsvInputParser& operator=(const CCsvInputParser&) = delete;

    //! Read records from the stream.  The supplied reader function is
    //! called once per record with the field names and the record's values.
    //! If the reader function returns false, reading stops.  Returns true
    //! if the end of the stream is reached successfully, otherwise false.
    bool readStreamIntoVecs(const TVecReaderFunc& readerFunc);

    //! Read every record from the stream into \p table, which receives
    //! the field names from the header row.
    bool readStreamIntoTable(analysis::CRawTable& table);

    //! Get the field names read from the header row.
    const TStrVec& fieldNames() const;

    //! Have the field names been read?
    bool gotFieldNames() const;

    //! Has at least one data record been read?
    bool gotData() const;

    //! Get the number of data records read so far.
    std::size_t numberRecords() const;

private:
    //! Read the next complete record into m_CurrentRowStr.  Returns false
    //! at the end of the stream or if the stream fails.
    bool readRecord();

    //! Parse the header row.
    bool parseFieldNames();

    //! Parse the current data record into \p values.
    bool parseDataRecord(TStrVec& values);

private:
    //! Holds the input when constructed from a string.
    std::istringstream m_StringInputBuf;

    //! Reference to the stream we're going to read from
    std::istream& m_StrmIn;

    //! The record being parsed, possibly several physical lines long.
    std::string m_CurrentRowStr;

    //! Line number of the start of the current record, for error messages.
    std::size_t m_RecordLineNumber;
    std::size_t m_LineNumber;

    bool m_BomChecked;
    bool m_StreamFailed;

    TStrVec m_FieldNames;
    bool m_GotFieldNames;
    std::size_t m_NumberRecords;

    //! Parser used to parse the individual records
    core::CCsvLineParser m_LineParser;
};
}
}

#endif // INCLUDED_ecosense_api_CCsvInputParser_h
