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
#ifndef INCLUDED_ecosense_analysis_CRecordNormalizer_h
#define INCLUDED_ecosense_analysis_CRecordNormalizer_h

#include <analysis/CConsumptionRecord.h>
#include <analysis/ImportExport.h>

#include <string>

namespace ecosense {
namespace analysis {
class CRawTable;

//! \brief
//! Converts the rows of a raw table to consumption records.
//!
//! DESCRIPTION:\n
//! Finds the time, facility and value columns by name and interprets
//! every row.  The hour of the record is the hour of day of whatever is
//! in the time column, so a column holding only dates gives hour zero
//! for every record.
//!
//! Any problem is a CSchemaError: a missing column, an unparseable
//! time, an empty facility or a value that isn't a finite non-negative
//! number.  Nothing is ever substituted for a bad value.  Messages give
//! the column name and the 1-based data row.
//!
class ANALYSIS_EXPORT CRecordNormalizer {
public:
    CRecordNormalizer(std::string timeField, std::string facilityField, std::string valueField);

    //! Normalize every row of \p table, in input order.
    //!
    //! \throws CSchemaError
    TConsumptionRecordVec normalize(const CRawTable& table) const;

    const std::string& timeField() const;
    const std::string& facilityField() const;
    const std::string& valueField() const;

private:
    //! Look up \p field in \p table, throwing if it isn't there.
    static std::size_t requiredColumn(const CRawTable& table, const std::string& field);

private:
    std::string m_TimeField;
    std::string m_FacilityField;
    std::string m_ValueField;
};
}
}

#endif // INCLUDED_ecosense_analysis_CRecordNormalizer_h
