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
#include <api/CIoManager.h>

#include <core/CLogger.h>

#include <fstream>
#include <ios>
#include <iostream>

namespace ecosense {
namespace api {

CIoManager::CIoManager(const std::string& inputFileName, const std::string& outputFileName)
    : m_IoInitialised{false}, m_InputFileName{inputFileName}, m_OutputFileName{outputFileName} {
    // On some platforms input/output can be considerably faster if C and C++ IO
    // functionality is NOT synchronised.
    bool wasSynchronised{std::ios::sync_with_stdio(false)};
    if (wasSynchronised) {
        LOG_TRACE(<< "C++ streams no longer synchronised with C stdio");
    }

    // Untie the standard streams so that if std::cin and std::cout are used as
    // the primary IO mechanism they don't ruin each others buffering.
    std::cin.tie(nullptr);
    std::cout.tie(nullptr);
    std::cerr.tie(nullptr);
}

bool CIoManager::initIo() {
    m_IoInitialised = false;

    if (m_InputFileName.empty() == false) {
        auto fileStream = std::make_shared<std::ifstream>(m_InputFileName,
                                                          std::ios::binary | std::ios::in);
        if (fileStream->is_open() == false) {
            LOG_ERROR(<< "Failed to open input file for reading: " << m_InputFileName);
            return false;
        }
        m_InputStream = fileStream;
    }
    LOG_DEBUG(<< "Input: " << (m_InputFileName.empty() ? "<stdin>" : m_InputFileName));

    if (m_OutputFileName.empty() == false) {
        m_OutputStream = openOutputFile(m_OutputFileName);
        if (m_OutputStream == nullptr) {
            return false;
        }
    }
    LOG_DEBUG(<< "Output: " << (m_OutputFileName.empty() ? "<stdout>" : m_OutputFileName));

    m_IoInitialised = true;
    return true;
}

std::istream& CIoManager::inputStream() {
    if (m_InputStream != nullptr) {
        return *m_InputStream;
    }

    if (!m_IoInitialised) {
        LOG_ERROR(<< "Accessing input stream before IO is initialised");
    }

    return std::cin;
}

std::ostream& CIoManager::outputStream() {
    if (m_OutputStream != nullptr) {
        return *m_OutputStream;
    }

    if (!m_IoInitialised) {
        LOG_ERROR(<< "Accessing output stream before IO is initialised");
    }

    return std::cout;
}

CIoManager::TOStreamP CIoManager::openOutputFile(const std::string& fileName) {
    auto fileStream = std::make_shared<std::ofstream>(fileName, std::ios::binary | std::ios::out);
    if (fileStream->is_open() == false) {
        LOG_ERROR(<< "Failed to open output file for writing: " << fileName);
        return nullptr;
    }
    return fileStream;
}
}
}
