//!
//! @file vmchelpers.cpp
//! @brief Definition of the helpers of the core functions
//! @authors Lorenzo Fabbri, Francesco Orso Pancaldi
//!
//! Separated to improve readability
//! @see vmcalgs.hpp
//! @see vmcalgs.cpp
//!

#include "vmcalgs.hpp"
#include "wavefunction.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>

namespace rvmc {

//! @addtogroup core-helpers
//! @{

//! @defgroup validation Input validation
//! @brief Reject the inputs which would make the algorithms meaningless or numerically unstable
//! @{

//! @brief Checks the learning rate of the gradient descent
//! @param learningRate The learning rate
//!
//! A negative learning rate would move alpha away from the minimum of the energy.
void ValidateLearningRate_(FPType learningRate) {
    if (!std::isfinite(learningRate)) {
        throw std::invalid_argument("Learning rate must be a finite real number.");
    }
    if (learningRate < 0) {
        throw std::out_of_range(
            "Learning rate must be a non-negative number, otherwise it would cause divergence.");
    }
}

//! @brief Checks all the parameters of a run, before any random number is drawn
//! @param params The parameters of the run
void ValidateRunParams_(RunParams const &params) {
    if (params.numSteps <= 0 || params.numWalkers <= 0) {
        throw std::out_of_range("numsteps and numwalkers must be positive integers greater than 0.");
    }
    if (params.equilibrationSteps < 0) {
        throw std::out_of_range("equilibration_steps must be a non-negative integer.");
    }
    if (!std::isfinite(params.stepSize)) {
        throw std::invalid_argument("step_size must be a finite real number.");
    }
    if (params.stepSize <= 0) {
        throw std::out_of_range("step_size must be strictly positive.");
    }
    ValidateAlpha(params.alpha);
    ValidateLearningRate_(params.learningRate);
}

//! @}

//! @brief Places the walkers uniformly in [lowerStart_initWalkers, upperStart_initWalkers)
//! @param numWalkers The number of walkers
//! @param gen The random generator
//! @return The positions of the walkers
Walkers InitialWalkers_(IntType numWalkers, RandomGenerator &gen) {
    std::uniform_real_distribution<FPType> unif(lowerStart_initWalkers.val, upperStart_initWalkers.val);
    Walkers result;
    result.reserve(static_cast<UIntType>(numWalkers));
    for (IntType i = 0; i != numWalkers; ++i) {
        result.push_back(Coordinate{unif(gen)});
    }
    return result;
}

//! @brief Attempts to move each walker once by using the Metropolis algorithm
//! @param poss The positions of the walkers, will be modified where the moves are accepted
//! @param alpha The variational parameter
//! @param stepSize The standard deviation of the proposed displacements
//! @param gen The random generator
//! @return The number of accepted moves
//!
//! First proposes a gaussian displacement for every walker, then draws one uniform number per walker and
//! accepts the move where psi(proposed) / psi(current) is larger than it.
//! The walkers are independent from each other, but the random numbers are drawn in the order of the
//! walkers, so that the outcome only depends on the state of the generator.
//! Proposals where the wavefunction vanishes are never accepted.
IntType MetropolisSweep_(Walkers &poss, VarParam alpha, FPType stepSize, RandomGenerator &gen) {
    std::normal_distribution<FPType> normal(0, 1);
    Walkers proposed;
    proposed.reserve(poss.size());
    for (Coordinate const &c : poss) {
        proposed.push_back(c + Coordinate{stepSize * normal(gen)});
    }

    std::vector<FPType> const oldPsi = Wavefunction(poss, alpha);
    std::vector<FPType> const newPsi = Wavefunction(proposed, alpha);
    if (std::any_of(oldPsi.begin(), oldPsi.end(), [](FPType psi) { return psi == 0; })) {
        throw std::domain_error("Division by zero detected in acceptance ratio.");
    }

    std::uniform_real_distribution<FPType> unif(0, 1);
    IntType succesfulUpdates = 0;
    for (std::size_t i = 0; i != poss.size(); ++i) {
        if (newPsi[i] / oldPsi[i] > unif(gen)) {
            poss[i] = proposed[i];
            ++succesfulUpdates;
        }
    }
    return succesfulUpdates;
}

//! @brief Records a notice, unless it was already recorded
void AddNotice_(std::vector<Notice> &notices, Notice notice) {
    if (std::find(notices.begin(), notices.end(), notice) == notices.end()) {
        notices.push_back(notice);
    }
}

//! @}

} // namespace rvmc
