//!
//! @file statistics.inl
//! @brief Definition of the templated statistics algorithms
//! @authors Lorenzo Fabbri, Francesco Orso Pancaldi
//!
//! Contains the definitions of the templated statistics algorithms declared in the header.
//! The non-templated ones are in the .cpp file.
//! @see statistics.hpp
//!

#ifndef RVMC_STATISTICS_INL
#define RVMC_STATISTICS_INL

#include "statistics.hpp"

#include <iterator>
#include <numeric>
#include <stdexcept>
#include <vector>

namespace rvmc {

//! @defgroup helpers Helpers
//! @brief Help the statistical functions
//! @{

//! @brief Unwraps a plain floating point number
inline FPType ValueOf_(FPType x) { return x; }

//! @brief Unwraps one of the lexicon types
//!
//! Requires the templated type to be a struct with public member 'val'.
template <class T>
FPType ValueOf_(T const &t) {
    return t.val;
}

//! @}

//! @defgroup user-functions User functions
//! @brief The functions that are meant to be called by the user
//! @{

//! @brief Calculates the mean
//! @param v The values to be averaged
//! @return The mean, with the same type of the values
template <class T>
T Mean(std::vector<T> const &v) {
    if (v.empty()) {
        throw std::invalid_argument("Cannot compute the mean of an empty sample.");
    }
    auto const size = std::ssize(v);

    return std::accumulate(v.begin(), v.end(), T{0}, [](T t1, T t2) { return t1 + t2; }) /
           static_cast<FPType>(size);
}

//! @brief Calculates the covariance of two samples of the same size
//! @param v The first sample
//! @param w The second sample
//! @return mean(v * w) - mean(v) * mean(w)
//!
//! This is the population covariance, without Bessel's correction.
template <class T, class U>
FPType Covariance(std::vector<T> const &v, std::vector<U> const &w) {
    if (v.empty() || (v.size() != w.size())) {
        throw std::invalid_argument("The covariance requires two non-empty samples of the same size.");
    }
    auto const size = static_cast<FPType>(std::ssize(v));

    FPType const meanProduct =
        std::inner_product(v.begin(), v.end(), w.begin(), FPType{0}, std::plus<>(),
                           [](T const &t, U const &u) { return ValueOf_(t) * ValueOf_(u); }) /
        size;
    FPType const meanV =
        std::accumulate(v.begin(), v.end(), FPType{0}, [](FPType f, T const &t) { return f + ValueOf_(t); }) /
        size;
    FPType const meanW =
        std::accumulate(w.begin(), w.end(), FPType{0}, [](FPType f, U const &u) { return f + ValueOf_(u); }) /
        size;
    return meanProduct - meanV * meanW;
}

//! @brief Calculates the population variance
//! @param v The sample
//! @return The variance
template <class T>
FPType Variance(std::vector<T> const &v) {
    return Covariance(v, v);
}

//! @}

} // namespace rvmc

#endif
