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
#ifndef INCLUDED_ecosense_test_CTestTmpDir_h
#define INCLUDED_ecosense_test_CTestTmpDir_h

#include <test/ImportExport.h>

#include <string>

namespace ecosense {
namespace test {

//! \brief
//! Return the name of a scratch directory for tests.
//!
//! DESCRIPTION:\n
//! Tests that exercise file input and output need somewhere to write.
//!
//! IMPLEMENTATION DECISIONS:\n
//! A sub-directory of the system temporary directory, named after
//! the user, so multiple users sharing the same server don't clash.
//!
class TEST_EXPORT CTestTmpDir {
public:
    CTestTmpDir() = delete;

    //! Returns the directory, creating it if necessary.  Falls back
    //! to the current directory if it can't be created.
    static std::string tmpDir();

    //! Returns a path for \p fileName within tmpDir().
    static std::string tmpFile(const std::string& fileName);
};
}
}

#endif // INCLUDED_ecosense_test_CTestTmpDir_h
