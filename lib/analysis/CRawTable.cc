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
#include <analysis/CRawTable.h>

#include <core/CLogger.h>

namespace ecosense {
namespace analysis {

CRawTable::CRawTable(TStrVec fieldNames) {
    this->fieldNames(std::move(fieldNames));
}

bool CRawTable::fieldNames(TStrVec fieldNames) {
    if (m_Rows.empty() == false) {
        LOG_ERROR(<< "Can't change the field names of a table with " << m_Rows.size() << " rows");
        return false;
    }
    m_FieldNames = std::move(fieldNames);
    m_ColumnIndex.clear();
    for (std::size_t i = 0; i < m_FieldNames.size(); ++i) {
        m_ColumnIndex.emplace(m_FieldNames[i], i);
    }
    return true;
}

const CRawTable::TStrVec& CRawTable::fieldNames() const {
    return m_FieldNames;
}

bool CRawTable::addRow(TStrVec row) {
    if (row.size() != m_FieldNames.size()) {
        LOG_ERROR(<< "Row " << m_Rows.size() + 1 << " has " << row.size()
                  << " values but there are " << m_FieldNames.size() << " fields");
        return false;
    }
    m_Rows.push_back(std::move(row));
    return true;
}

CRawTable::TOptionalSize CRawTable::columnIndex(const std::string& name) const {
    auto i = m_ColumnIndex.find(name);
    if (i == m_ColumnIndex.end()) {
        return TOptionalSize{};
    }
    return i->second;
}

const CRawTable::TStrVec& CRawTable::row(std::size_t i) const {
    return m_Rows[i];
}

const std::string& CRawTable::value(std::size_t i, std::size_t column) const {
    return m_Rows[i][column];
}

const CRawTable::TStrVecVec& CRawTable::rows() const {
    return m_Rows;
}

std::size_t CRawTable::numberRows() const {
    return m_Rows.size();
}

std::size_t CRawTable::numberColumns() const {
    return m_FieldNames.size();
}

bool CRawTable::empty() const {
    return m_Rows.empty();
}
}
}
