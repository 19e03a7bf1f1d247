//!
//! @file vmcalgs.hpp
//! @brief Declaration of the user functions and the constants
//! @authors Lorenzo Fabbri, Francesco Orso Pancaldi
//!
//! The user functions are defined in vmcalgs.cpp, their helpers in vmchelpers.cpp.
//! Despite possibly cluttering the header, the constants are here for easiness of access by both .cpp files
//! @see vmcalgs.cpp
//! @see vmchelpers.cpp
//!

#ifndef RVMC_VMCALGS_HPP
#define RVMC_VMCALGS_HPP

#include "types.hpp"

namespace rvmc {

FPType DEnergyDAlpha(Walkers const &, VarParam);

AlphaUpdate OptimizeAlpha(Walkers const &, VarParam, FPType);

RunResult Metropolis(RunParams const &, RandomGenerator &, ProgressCallback const & = {});

RunResult Metropolis(RunParams const &, Walkers, RandomGenerator &, ProgressCallback const & = {});

//! @defgroup algs-constants Constants
//! @brief Constants used in the algorithms and/or the helper functions
//!
//! Constants used in the algorithms.
//! They are named with the convention 'constantName_algorithmThatUsesIt'.
//! @{

//! @brief Lower end of the interval where the walkers are initially placed
//! @see InitialWalkers_
constexpr Coordinate lowerStart_initWalkers{2};
//! @brief Upper end (excluded) of the interval where the walkers are initially placed
//! @see InitialWalkers_
constexpr Coordinate upperStart_initWalkers{3};

//! @}

//! @defgroup core-helpers Core helpers
//! @brief Help the core functions
//!
//! They would be internal to the library, but are exposed to be tested.
//! @{

void ValidateLearningRate_(FPType);

void ValidateRunParams_(RunParams const &);

Walkers InitialWalkers_(IntType, RandomGenerator &);

IntType MetropolisSweep_(Walkers &, VarParam, FPType, RandomGenerator &);

void AddNotice_(std::vector<Notice> &, Notice);

//! @}

} // namespace rvmc

#endif
