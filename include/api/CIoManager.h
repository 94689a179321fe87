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
#ifndef INCLUDED_ecosense_api_CIoManager_h
#define INCLUDED_ecosense_api_CIoManager_h

#include <api/ImportExport.h>

#include <iosfwd>
#include <memory>
#include <string>

namespace ecosense {
namespace api {

//! \brief
//! Manages the input and output streams of the analyze program.
//!
//! DESCRIPTION:\n
//! Opens the input and output files named on the command line.  An
//! empty name means STDIN or STDOUT.
//!
//! IMPLEMENTATION DECISIONS:\n
//! The constructor unties the standard streams, which must happen
//! before anything else uses them, so construct this object early.
//!
class API_EXPORT CIoManager {
public:
    using TIStreamP = std::shared_ptr<std::istream>;
    using TOStreamP = std::shared_ptr<std::ostream>;

public:
    //! Leave \p inputFileName/\p outputFileName empty to indicate
    //! STDIN/STDOUT.
    CIoManager(const std::string& inputFileName, const std::string& outputFileName);

    CIoManager(const CIoManager&) = delete;
    CIoManager& operator=(const CIoManager&) = delete;

    //! Set up the necessary streams given the constructor arguments.
    bool initIo();

    //! Get the stream to get input data from.
    std::istream& inputStream();

    //! Get the stream to write output to.
    std::ostream& outputStream();

    //! Open \p fileName for writing one of the supplementary outputs.
    //! Returns null, having logged why, if it can't be opened.
    static TOStreamP openOutputFile(const std::string& fileName);

private:
    //! Have the streams been successfully initialised?
    bool m_IoInitialised;

    //! Name of file to get input from.  Empty implies STDIN.
    std::string m_InputFileName;

    //! If this object owns the input stream then a pointer to it.  If
    //! std::cin is being used then this will be NULL.
    TIStreamP m_InputStream;

    //! Name of file to write output to.  Empty implies STDOUT.
    std::string m_OutputFileName;

    //! If this object owns the output stream then a pointer to it.  If
    //! std::cout is being used then this will be NULL.
    TOStreamP m_OutputStream;
};
}
}

#endif // INCLUDED_ecosense_api_CIoManager_h
