//!
//! @file wavefunction.cpp
//! @brief Definition of the trial wavefunction and of the local energy
//! @authors Lorenzo Fabbri, Francesco Orso Pancaldi
//! @see wavefunction.hpp
//!

#include "wavefunction.hpp"

#include <algorithm>
#include <execution>
#include <stdexcept>

namespace rvmc {

//! @brief Checks that alpha can be used in the wavefunction without overflows or underflows
//! @param alpha The variational parameter
//!
//! Throws std::invalid_argument if alpha is not a number, std::out_of_range if it is outside
//! [minAlpha, maxAlpha].
void ValidateAlpha(VarParam alpha) {
    if (std::isnan(alpha.val)) {
        throw std::invalid_argument("Alpha must be a real number.");
    }
    if (alpha.val < minAlpha.val) {
        throw std::out_of_range("Too large negative alpha causes numerical instability.");
    }
    if (alpha.val > maxAlpha.val) {
        throw std::out_of_range("Too large alpha causes numerical instability.");
    }
}

//! @addtogroup core-functions
//! @{

//! @brief Computes the (unnormalized) trial wavefunction of each walker
//! @param poss The positions of the walkers
//! @param alpha The variational parameter
//! @return The value of the wavefunction at each position
//!
//! The wavefunction vanishes for non-positive positions, x == 0 included.
//! Alpha is validated before any exponential is computed.
std::vector<FPType> Wavefunction(Walkers const &poss, VarParam alpha) {
    ValidateAlpha(alpha);

    std::vector<FPType> result(poss.size());
    std::transform(std::execution::par_unseq, poss.begin(), poss.end(), result.begin(),
                   [alpha](Coordinate x) { return (x.val > 0) ? std::exp(-alpha.val * x.val) : FPType{0}; });
    return result;
}

//! @brief Computes the local energy of each walker
//! @param poss The positions of the walkers, none of which can be 0
//! @param alpha The variational parameter
//! @return The local energy at each position
//!
//! The positions are not checked: the Markov chain never moves a walker to a point where the wavefunction
//! vanishes.
std::vector<Energy> LocalEnergies(Walkers const &poss, VarParam alpha) {
    std::vector<Energy> result(poss.size());
    std::transform(std::execution::par_unseq, poss.begin(), poss.end(), result.begin(),
                   [alpha](Coordinate x) {
                       return Energy{-1 / x.val - alpha.val * alpha.val / 2 + alpha.val / x.val};
                   });
    return result;
}

//! @brief Computes d(log(psi))/d(alpha) for each walker
//! @param poss The positions of the walkers
//! @return The logarithmic derivative at each position, which is just -x
std::vector<FPType> DLogWavefDAlpha(Walkers const &poss) {
    std::vector<FPType> result(poss.size());
    std::transform(poss.begin(), poss.end(), result.begin(), [](Coordinate x) { return -x.val; });
    return result;
}

//! @}

} // namespace rvmc
