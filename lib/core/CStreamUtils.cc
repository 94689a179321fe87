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
#include <core/CStreamUtils.h>

#include <core/CLogger.h>

#include <istream>

namespace ecosense {
namespace core {

bool CStreamUtils::skipUtf8Bom(std::istream& strm) {
    // The 3 bytes 0xEF, 0xBB, 0xBF form a UTF-8 byte order marker (BOM)
    static const int BOM[]{0xEF, 0xBB, 0xBF};

    if (strm.peek() != BOM[0]) {
        return false;
    }
    for (int expected : BOM) {
        if (strm.peek() != expected) {
            LOG_WARN(<< "Stream starts with an incomplete UTF-8 BOM");
            return false;
        }
        strm.get();
    }
    LOG_DEBUG(<< "Skipping UTF-8 BOM");
    return true;
}
}
}
