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
#ifndef INCLUDED_ecosense_analysis_CRawTable_h
#define INCLUDED_ecosense_analysis_CRawTable_h

#include <analysis/ImportExport.h>

#include <boost/optional.hpp>
#include <boost/unordered_map.hpp>

#include <string>
#include <vector>

namespace ecosense {
namespace analysis {

//! \brief
//! An in-memory table of strings, as read from a CSV file.
//!
//! DESCRIPTION:\n
//! Holds the field names and the data rows in input order.  Every row
//! has exactly one value per field.  No interpretation of the values is
//! done here, that is the job of CRecordNormalizer.
//!
class ANALYSIS_EXPORT CRawTable {
public:
    using TStrVec = std::vector<std::string>;
    using TStrVecVec = std::vector<TStrVec>;
    using TOptionalSize = boost::optional<std::size_t>;

public:
    CRawTable() = default;
    explicit CRawTable(TStrVec fieldNames);

    //! Replace the field names.  Only valid while the table has no rows.
    bool fieldNames(TStrVec fieldNames);

    //! Get the field names in column order.
    const TStrVec& fieldNames() const;

    //! Append a row.  Fails, logging an error, if the row's size doesn't
    //! match the number of fields.
    bool addRow(TStrVec row);

    //! Get the index of the column called \p name, if there is one.
    TOptionalSize columnIndex(const std::string& name) const;

    //! Get row \p i.
    const TStrVec& row(std::size_t i) const;

    //! Get the value in row \p i and column \p column.
    const std::string& value(std::size_t i, std::size_t column) const;

    //! Get every row.
    const TStrVecVec& rows() const;

    std::size_t numberRows() const;
    std::size_t numberColumns() const;
    bool empty() const;

private:
    using TStrSizeUMap = boost::unordered_map<std::string, std::size_t>;

private:
    TStrVec m_FieldNames;
    //! Lookup from field name to column.  If a name is repeated the
    //! first column with that name wins.
    TStrSizeUMap m_ColumnIndex;
    TStrVecVec m_Rows;
};
}
}

#endif // INCLUDED_ecosense_analysis_CRawTable_h
