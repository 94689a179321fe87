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
#ifndef INCLUDED_ecosense_test_CBoostTestJUnitOutput_h
#define INCLUDED_ecosense_test_CBoostTestJUnitOutput_h

#include <test/ImportExport.h>

#include <fstream>

namespace ecosense {
namespace test {

//! \brief
//! Add JUnit output to default test output.
//!
//! DESCRIPTION:\n
//! A custom Boost.Test init function that unconditionally
//! adds JUnit output in addition to the default console output
//! (or whatever this has been overridden to via command line
//! arguments).
//!
//! IMPLEMENTATION DECISIONS:\n
//! The file is named after the master test suite, for example
//! lib.analysis_junit.xml, so that the test executables of the
//! different libraries can run in the same directory without
//! overwriting each other's results.
//!
class TEST_EXPORT CBoostTestJUnitOutput {
public:
    CBoostTestJUnitOutput() = delete;
    CBoostTestJUnitOutput(const CBoostTestJUnitOutput&) = delete;
    CBoostTestJUnitOutput& operator=(const CBoostTestJUnitOutput&) = delete;

    static bool init();

private:
    static std::ofstream ms_JUnitOutputFile;
};
}
}

#endif // INCLUDED_ecosense_test_CBoostTestJUnitOutput_h
