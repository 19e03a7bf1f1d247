//!
//! @file statistics.cpp
//! @brief Definition of the non-templated statistics algorithms
//! @authors Lorenzo Fabbri, Francesco Orso Pancaldi
//!
//! Contains the definitions of the non-templated statistics algorithms declared in the header.
//! @see statistics.hpp
//!

#include "statistics.hpp"

#include <boost/math/distributions/normal.hpp>

#include <algorithm>

namespace rvmc {

//! @addtogroup user-functions
//! @{

//! @brief Calculates the standard deviation of the mean of the energies
//! @param v The energies, at least two
//! @return The standard deviation of the mean
//!
//! The energies are treated as uncorrelated.
Energy StdDevOfMean(std::vector<Energy> const &v) {
    if (v.size() < 2) {
        throw std::invalid_argument("At least two energies are needed to estimate the error on the mean.");
    }
    auto const size = static_cast<FPType>(std::ssize(v));
    return Energy{std::sqrt(Variance(v) / (size - 1))};
}

//! @brief Calculate the confidence interval of a mean given the correspondent std. dev. for a certain
//! confidence level
//! @param mean The mean
//! @param stdDev The standard deviation
//! @param confLevel The confidence level, in percent
//! @return The confidence interval
ConfInterval GetConfInt(Energy mean, Energy stdDev, FPType confLevel) {
    if (!(confLevel > 0 && confLevel < 100)) {
        throw std::out_of_range("The confidence level must be strictly between 0 and 100.");
    }
    if (stdDev.val == 0) {
        return ConfInterval{mean, mean};
    }

    boost::math::normal const standardNormal(0, 1);
    FPType const probability = 1 - (1 - confLevel / 100) / 2;
    FPType const z = boost::math::quantile(standardNormal, probability);

    return ConfInterval{mean - stdDev * z, mean + stdDev * z};
}

//! @brief Bins the positions into a normalized histogram
//! @param poss The positions, at least one
//! @param numBins The number of bins, must be positive
//! @return The centers of the bins and the density of each one
//!
//! The bins span [min, max] of the positions. If all the positions coincide, the range is
//! [x - margin_densityHistogram, x + margin_densityHistogram] instead.
Histogram DensityHistogram(Walkers const &poss, IntType numBins) {
    if (poss.empty()) {
        throw std::invalid_argument("Cannot compute the histogram of an empty sample.");
    }
    if (numBins <= 0) {
        throw std::out_of_range("The number of bins must be positive.");
    }

    auto const [minIt, maxIt] = std::minmax_element(poss.begin(), poss.end(),
                                                    [](Coordinate a, Coordinate b) { return a.val < b.val; });
    FPType lower = minIt->val;
    FPType upper = maxIt->val;
    if (!(upper > lower)) {
        lower -= margin_densityHistogram;
        upper += margin_densityHistogram;
    }
    FPType const binWidth = (upper - lower) / numBins;

    auto const uBins = static_cast<UIntType>(numBins);
    Histogram result{std::vector<FPType>(uBins), std::vector<FPType>(uBins, 0)};
    for (UIntType b = 0; b != uBins; ++b) {
        result.centers[b] = lower + (static_cast<FPType>(b) + FPType{0.5}) * binWidth;
    }
    for (Coordinate c : poss) {
        auto const bin = std::min(static_cast<UIntType>((c.val - lower) / binWidth), uBins - 1);
        result.densities[bin] += 1;
    }
    FPType const norm = static_cast<FPType>(poss.size()) * binWidth;
    std::transform(result.densities.begin(), result.densities.end(), result.densities.begin(),
                   [norm](FPType d) { return d / norm; });
    return result;
}

//! @}

} // namespace rvmc
