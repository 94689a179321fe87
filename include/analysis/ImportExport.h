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
#ifndef INCLUDED_ecosense_analysis_ImportExport_h
#define INCLUDED_ecosense_analysis_ImportExport_h

//! Symbol visibility for the analysis library.  Only Windows DLLs need
//! the declarations decorated; on other platforms everything is
//! exported from the shared object.
#ifdef Windows
#ifdef BUILDING_libEcoSenseAnalysis
#define ANALYSIS_EXPORT __declspec(dllexport)
#else
#define ANALYSIS_EXPORT __declspec(dllimport)
#endif
#else
#define ANALYSIS_EXPORT
#endif

#endif // INCLUDED_ecosense_analysis_ImportExport_h
