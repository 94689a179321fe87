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
#ifndef INCLUDED_ecosense_core_CStreamUtils_h
#define INCLUDED_ecosense_core_CStreamUtils_h

#include <core/ImportExport.h>

#include <iosfwd>

namespace ecosense {
namespace core {

//! \brief Stream utility functions.
class CORE_EXPORT CStreamUtils {
public:
    CStreamUtils() = delete;

    //! Spreadsheet programs often save CSV and ini files as UTF-8 with a
    //! byte order marker at the start, which neither the CSV parser nor
    //! boost::ini_parser expect.  This function advances the stream over
    //! a UTF-8 BOM, but only if one exists.  It only looks ahead with
    //! peek(), so works on pipes as well as files.
    //!
    //! \return true if a BOM was skipped.
    static bool skipUtf8Bom(std::istream& strm);
};
}
}

#endif // INCLUDED_ecosense_core_CStreamUtils_h
