//!
//! @file statistics.hpp
//! @brief Statistical methods header
//! @authors Lorenzo Fabbri, Francesco Orso Pancaldi
//!
//! Contains the declarations of the statistical functions used by the gradient estimator and by the summary
//! of a run.
//! To improve readability, the implementation of the templated functions is in the .inl file.
//! @see statistics.inl
//!

#ifndef RVMC_STATISTICS_HPP
#define RVMC_STATISTICS_HPP

#include "types.hpp"

namespace rvmc {

//! @brief Normalized histogram of the positions of the walkers
struct Histogram {
    //! Center of each bin
    std::vector<FPType> centers;
    //! Fraction of walkers in each bin, divided by the bin width
    std::vector<FPType> densities;
};

//! @brief Half width of the range used when all the walkers are in the same place
//! @see DensityHistogram
constexpr FPType margin_densityHistogram = 0.5;

template <class T>
T Mean(std::vector<T> const &);

template <class T, class U>
FPType Covariance(std::vector<T> const &, std::vector<U> const &);

template <class T>
FPType Variance(std::vector<T> const &);

Energy StdDevOfMean(std::vector<Energy> const &);

ConfInterval GetConfInt(Energy, Energy, FPType);

Histogram DensityHistogram(Walkers const &, IntType);

} // namespace rvmc

#include "statistics.inl"

#endif
