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
#include <test/CTestTmpDir.h>

#include <core/CLogger.h>

#include <boost/filesystem.hpp>

#include <stdlib.h>

namespace ecosense {
namespace test {

std::string CTestTmpDir::tmpDir() {
    std::string subDir{"ecosense_test"};
    const char* user{::getenv("USER")};
    if (user != nullptr && *user != '\0') {
        subDir += '_';
        subDir += user;
    }

    try {
        boost::filesystem::path tmpPath{boost::filesystem::temp_directory_path()};
        tmpPath /= subDir;
        // Prior existence of the directory is not considered an error by
        // boost::filesystem, and this is what we want
        boost::filesystem::create_directories(tmpPath);
        return tmpPath.string();
    } catch (std::exception& e) {
        LOG_ERROR(<< "Failed to create temporary directory " << subDir << " - " << e.what());
    }

    return ".";
}

std::string CTestTmpDir::tmpFile(const std::string& fileName) {
    boost::filesystem::path path{CTestTmpDir::tmpDir()};
    path /= fileName;
    return path.string();
}
}
}
