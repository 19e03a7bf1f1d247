//!
//! @file vmcalgs.cpp
//! @brief Definition of the user and core functions
//! @authors Lorenzo Fabbri, Francesco Orso Pancaldi
//!
//! The user functions are declared in the related .hpp
//! To improve readability, the definitions of the helper functions is in vmchelpers.cpp
//! @see vmcalgs.hpp
//! @see vmchelpers.cpp
//!

#include "vmcalgs.hpp"
#include "statistics.hpp"
#include "wavefunction.hpp"

#include <iterator>
#include <stdexcept>
#include <utility>

namespace rvmc {

//! @defgroup core-functions Core functions
//! @brief The most important functions in the code
//!
//! The ones that actually do the work.
//! @{

//! @brief Estimates the derivative of the energy with respect to the variational parameter
//! @param poss The positions of the walkers, after equilibration
//! @param alpha The variational parameter
//! @return The estimate of dE/dalpha
//!
//! Uses dE/dalpha = 2 * (<E_L * d(log(psi))/dalpha> - <E_L> * <d(log(psi))/dalpha>), which is twice the
//! covariance between the local energy and the logarithmic derivative of the wavefunction.
FPType DEnergyDAlpha(Walkers const &poss, VarParam alpha) {
    std::vector<Energy> const localEns = LocalEnergies(poss, alpha);
    std::vector<FPType> const dLogPsi = DLogWavefDAlpha(poss);
    return 2 * Covariance(localEns, dLogPsi);
}

//! @brief Does one step of gradient descent on the variational parameter
//! @param poss The positions of the walkers, after equilibration
//! @param alpha The current variational parameter
//! @param learningRate How far to move along the gradient, must be non-negative
//! @return The new alpha, the gradient used to compute it, and Notice::frozenAlpha if the learning rate is 0
AlphaUpdate OptimizeAlpha(Walkers const &poss, VarParam alpha, FPType learningRate) {
    ValidateLearningRate_(learningRate);

    AlphaUpdate result;
    if (learningRate == 0) {
        result.notices.push_back(Notice::frozenAlpha);
    }
    result.gradient = DEnergyDAlpha(poss, alpha);
    result.alpha = alpha - VarParam{learningRate * result.gradient};
    return result;
}

//! @brief Runs the Markov chain and optimizes alpha on the fly, starting from the given positions
//! @param params The parameters of the run
//! @param initialPoss The starting positions, one for each walker
//! @param gen The random generator
//! @param progress Called after each measurement, can be empty
//! @return The final state of the chain and the history of alpha, of the energy and of the gradient
//!
//! Each of the 'params.numSteps' steps first does 'params.equilibrationSteps' Metropolis sweeps, then updates
//! alpha with one step of gradient descent and finally computes the mean local energy with the new alpha.
//! Throws std::domain_error if the wavefunction vanishes at the current position of a walker, since the
//! acceptance ratio cannot be computed there.
RunResult Metropolis(RunParams const &params, Walkers initialPoss, RandomGenerator &gen,
                     ProgressCallback const &progress) {
    ValidateRunParams_(params);
    if (std::ssize(initialPoss) != params.numWalkers) {
        throw std::invalid_argument("The number of initial positions must be equal to numwalkers.");
    }

    RunResult result;
    if (params.equilibrationSteps == 0) {
        AddNotice_(result.notices, Notice::noEquilibration);
    }
    result.initialPoss = initialPoss;
    auto const numSteps = static_cast<UIntType>(params.numSteps);
    result.alphas.resize(numSteps);
    result.energies.resize(numSteps);
    result.gradients.resize(numSteps);

    Walkers poss = std::move(initialPoss);
    VarParam alpha = params.alpha;
    long long succesfulUpdates = 0;
    for (IntType j = 0; j != params.numSteps; ++j) {
        for (IntType i = 0; i != params.equilibrationSteps; ++i) {
            succesfulUpdates += MetropolisSweep_(poss, alpha, params.stepSize, gen);
        }

        AlphaUpdate const update = OptimizeAlpha(poss, alpha, params.learningRate);
        for (Notice n : update.notices) {
            AddNotice_(result.notices, n);
        }
        alpha = update.alpha;

        auto const uj = static_cast<UIntType>(j);
        result.alphas[uj] = alpha;
        result.gradients[uj] = update.gradient;
        result.energies[uj] = Mean(LocalEnergies(poss, alpha));

        if (progress) {
            progress(j + 1, params.numSteps);
        }
    }

    long long const proposedUpdates =
        static_cast<long long>(params.numSteps) * params.equilibrationSteps * params.numWalkers;
    result.acceptanceRate =
        (proposedUpdates == 0) ? FPType{0} : static_cast<FPType>(succesfulUpdates) / proposedUpdates;
    result.finalPoss = std::move(poss);
    result.finalAlpha = alpha;
    return result;
}

//! @brief Runs the Markov chain and optimizes alpha on the fly
//! @param params The parameters of the run
//! @param gen The random generator
//! @param progress Called after each measurement, can be empty
//! @return The final state of the chain and the history of alpha, of the energy and of the gradient
//!
//! The walkers start uniformly distributed in [lowerStart_initWalkers, upperStart_initWalkers).
//! The parameters are validated before the initial positions are drawn.
RunResult Metropolis(RunParams const &params, RandomGenerator &gen, ProgressCallback const &progress) {
    ValidateRunParams_(params);
    return Metropolis(params, InitialWalkers_(params.numWalkers, gen), gen, progress);
}

//! @}

} // namespace rvmc
