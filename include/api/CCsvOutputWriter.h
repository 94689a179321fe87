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
#ifndef INCLUDED_ecosense_api_CCsvOutputWriter_h
#define INCLUDED_ecosense_api_CCsvOutputWriter_h

#include <api/ImportExport.h>

#include <iosfwd>
#include <string>
#include <vector>

namespace ecosense {
namespace api {

//! \brief
//! Write rows of Excel style CSV.
//!
//! DESCRIPTION:\n
//! Fields are quoted only if they contain the separator, a quote or a
//! newline, and quotes within a quoted field are doubled, which is what
//! CCsvInputParser expects.
//!
class API_EXPORT CCsvOutputWriter {
public:
    using TStrVec = std::vector<std::string>;

public:
    //! Character to separate fields
    static const char COMMA;

    //! Quote character
    static const char QUOTE;

    //! Character to end records
    static const char RECORD_END;

public:
    explicit CCsvOutputWriter(std::ostream& strmOut, char separator = COMMA);

    CCsvOutputWriter(const CCsvOutputWriter&) = delete;
    CCsvOutputWriter& operator=(const CCsvOutputWriter&) = delete;

    //! Write one record.
    bool writeRow(const TStrVec& fields);

private:
    //! Append a field to the work record, quoting it if required
    void appendField(const std::string& field);

private:
    std::ostream& m_StrmOut;

    //! Character to use as a separator
    char m_Separator;

    //! Re-usable buffer for building each record
    std::string m_WorkRecord;
};
}
}

#endif // INCLUDED_ecosense_api_CCsvOutputWriter_h
