//!
//! @file wavefunction.hpp
//! @brief Trial wavefunction and local energy of the radial problem
//! @authors Lorenzo Fabbri, Francesco Orso Pancaldi
//!
//! The trial wavefunction is exp(-alpha * x) for x > 0 and vanishes elsewhere.
//! The local energy is the analytical result of applying the radial Hamiltonian (with potential -1/x) to
//! the trial wavefunction, divided by the wavefunction itself.
//! @see wavefunction.cpp
//!

#ifndef RVMC_WAVEFUNCTION_HPP
#define RVMC_WAVEFUNCTION_HPP

#include "types.hpp"

namespace rvmc {

//! @defgroup wavef-constants Constants
//! @brief Numerical stability bounds of the variational parameter
//! @{

//! @brief Smallest accepted value of alpha
//!
//! Below this, exp(-alpha * x) overflows for the positions typically visited by the walkers.
constexpr VarParam minAlpha{-1000};
//! @brief Largest accepted value of alpha
//!
//! Above this, exp(-alpha * x) underflows to 0 and the acceptance ratio cannot be computed.
constexpr VarParam maxAlpha{200};

//! @}

void ValidateAlpha(VarParam);

std::vector<FPType> Wavefunction(Walkers const &, VarParam);

std::vector<Energy> LocalEnergies(Walkers const &, VarParam);

std::vector<FPType> DLogWavefDAlpha(Walkers const &);

} // namespace rvmc

#endif
