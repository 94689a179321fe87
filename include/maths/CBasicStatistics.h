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
#ifndef INCLUDED_ecosense_maths_CBasicStatistics_h
#define INCLUDED_ecosense_maths_CBasicStatistics_h

#include <maths/ImportExport.h>

#include <cstddef>
#include <limits>
#include <string>
#include <vector>

namespace ecosense {
namespace maths {

//! \brief Some basic stats utilities.
//!
//! DESCRIPTION:\n
//! Some utilities for computing basic sample statistics such as the
//! mean, variance, extremes and percentiles of a collection of values.
class MATHS_EXPORT CBasicStatistics {
public:
    using TDoubleVec = std::vector<double>;

public:
    CBasicStatistics() = delete;

    //! Compute the sample mean.  Zero for an empty sample.
    static double mean(const TDoubleVec& data);

    //! Compute the sample median.
    static double median(const TDoubleVec& data);

    //! Compute the \p p'th percentile, for \p p in [0, 100], of \p data
    //! by linear interpolation between the closest ranks.
    //!
    //! The p'th percentile lies at position (n - 1) p / 100 in the sorted
    //! sample, so the 0'th is the minimum, the 100'th the maximum and the
    //! 50'th the median.
    //!
    //! \return false, and logs an error, if \p data is empty or \p p is
    //! outside [0, 100].
    static bool percentile(TDoubleVec data, double p, double& result);

    /////////////////////////// ACCUMULATORS ///////////////////////////

    //! \brief An accumulator for the sample mean and variance.
    //!
    //! DESCRIPTION:\n
    //! Accumulates the count, mean and second central moment of the
    //! values passed to add().  Two accumulators can be combined, which
    //! is equivalent to running a single accumulator on both samples.
    //!
    //! IMPLEMENTATION DECISIONS:\n
    //! Uses the recurrence relations for the central moments rather than
    //! sums of powers, which minimizes cancellation errors.  In particular
    //! a sample of identical values has exactly zero variance and a mean
    //! exactly equal to the value.
    class MATHS_EXPORT CSampleMeanVar {
    public:
        CSampleMeanVar() = default;

        //! Define a function operator for use with std:: algorithms.
        void operator()(double x) { this->add(x); }

        //! Update the moments with \p x, with weight \p n.
        void add(double x, double n = 1.0);

        //! Update the moments with every value in \p x.
        void add(const TDoubleVec& x);

        //! Combine two accumulators.
        const CSampleMeanVar& operator+=(const CSampleMeanVar& rhs);

        //! Get the total weight of the values added.
        double count() const { return m_Count; }

        //! Get the sample mean.
        double mean() const { return m_Mean; }

        //! Get the unbiased sample variance, which is zero if the count
        //! is not greater than one.
        double variance() const;

        //! Get the square root of variance().
        double standardDeviation() const;

        //! Get a debug description.
        std::string print() const;

    private:
        double m_Count{0.0};
        double m_Mean{0.0};
        double m_SumSquaredDeviations{0.0};
    };

    using TMeanVarAccumulator = CSampleMeanVar;

    //! \brief Tracks the minimum and maximum of a collection of values.
    class MATHS_EXPORT CMinMax {
    public:
        CMinMax() = default;

        //! Define a function operator for use with std:: algorithms.
        void operator()(double x) { this->add(x); }

        //! Update the statistic with \p x.
        void add(double x);

        //! Combine two statistics.
        const CMinMax& operator+=(const CMinMax& rhs);

        //! Have any values been added?
        bool initialized() const { return m_Count > 0; }

        //! Get the minimum value.
        double min() const { return m_Min; }

        //! Get the maximum value.
        double max() const { return m_Max; }

        //! Get the difference between the maximum and minimum values.
        double range() const { return m_Max - m_Min; }

    private:
        std::size_t m_Count{0};
        double m_Min{std::numeric_limits<double>::max()};
        double m_Max{std::numeric_limits<double>::lowest()};
    };
};
}
}

#endif // INCLUDED_ecosense_maths_CBasicStatistics_h
