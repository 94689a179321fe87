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
#include <maths/CBasicStatistics.h>

#include <core/CLogger.h>

#include <algorithm>
#include <cmath>
#include <numeric>
#include <sstream>

namespace ecosense {
namespace maths {
namespace {

//! Compute the percentile reordering \p data in the process.
double percentileInPlace(std::vector<double>& data, double p) {
    double position{static_cast<double>(data.size() - 1) * p / 100.0};
    std::size_t lower{static_cast<std::size_t>(std::floor(position))};
    std::size_t upper{std::min(lower + 1, data.size() - 1)};
    double fraction{position - static_cast<double>(lower)};

    // This gets the lower rank into place with everything after it no
    // smaller, so the upper rank is the minimum of the remainder.
    std::nth_element(data.begin(), data.begin() + lower, data.end());
    double lowerValue{data[lower]};
    if (upper == lower || fraction == 0.0) {
        return lowerValue;
    }
    double upperValue{*std::min_element(data.begin() + upper, data.end())};

    return lowerValue + fraction * (upperValue - lowerValue);
}
}

double CBasicStatistics::mean(const TDoubleVec& data) {
    if (data.empty()) {
        return 0.0;
    }
    return std::accumulate(data.begin(), data.end(), 0.0) /
           static_cast<double>(data.size());
}

double CBasicStatistics::median(const TDoubleVec& data_) {
    if (data_.empty()) {
        return 0.0;
    }
    if (data_.size() == 1) {
        return data_[0];
    }
    TDoubleVec data{data_};
    return percentileInPlace(data, 50.0);
}

bool CBasicStatistics::percentile(TDoubleVec data, double p, double& result) {
    if (data.empty()) {
        LOG_ERROR(<< "Can't compute a percentile of no values");
        return false;
    }
    if (!(p >= 0.0 && p <= 100.0)) {
        LOG_ERROR(<< "Percentile " << p << " is outside [0, 100]");
        return false;
    }
    result = percentileInPlace(data, p);
    return true;
}

void CBasicStatistics::CSampleMeanVar::add(double x, double n) {
    if (n <= 0.0) {
        return;
    }
    m_Count += n;
    double delta{x - m_Mean};
    m_Mean += n * delta / m_Count;
    m_SumSquaredDeviations += n * delta * (x - m_Mean);
}

void CBasicStatistics::CSampleMeanVar::add(const TDoubleVec& x) {
    for (auto xi : x) {
        this->add(xi);
    }
}

const CBasicStatistics::CSampleMeanVar&
CBasicStatistics::CSampleMeanVar::operator+=(const CSampleMeanVar& rhs) {
    if (rhs.m_Count <= 0.0) {
        return *this;
    }
    if (m_Count <= 0.0) {
        *this = rhs;
        return *this;
    }
    double count{m_Count + rhs.m_Count};
    double delta{rhs.m_Mean - m_Mean};
    m_SumSquaredDeviations += rhs.m_SumSquaredDeviations +
                              delta * delta * m_Count * rhs.m_Count / count;
    m_Mean += delta * rhs.m_Count / count;
    m_Count = count;
    return *this;
}

double CBasicStatistics::CSampleMeanVar::variance() const {
    if (m_Count <= 1.0) {
        return 0.0;
    }
    return std::max(m_SumSquaredDeviations, 0.0) / (m_Count - 1.0);
}

double CBasicStatistics::CSampleMeanVar::standardDeviation() const {
    return std::sqrt(this->variance());
}

std::string CBasicStatistics::CSampleMeanVar::print() const {
    std::ostringstream result;
    result << '(' << m_Count << ", " << m_Mean << ", " << this->variance() << ')';
    return result.str();
}

void CBasicStatistics::CMinMax::add(double x) {
    ++m_Count;
    m_Min = std::min(m_Min, x);
    m_Max = std::max(m_Max, x);
}

const CBasicStatistics::CMinMax& CBasicStatistics::CMinMax::operator+=(const CMinMax& rhs) {
    m_Count += rhs.m_Count;
    m_Min = std::min(m_Min, rhs.m_Min);
    m_Max = std::max(m_Max, rhs.m_Max);
    return *this;
}
}
}
