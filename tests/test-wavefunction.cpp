//!
//! @file test-wavefunction.cpp
//! @brief Tests for the trial wavefunction and the local energy
//! @authors Lorenzo Fabbri, Francesco Orso Pancaldi
//!

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"

#include "rvmc.hpp"
#include "test.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

TEST_CASE("Testing the trial wavefunction") {
    SUBCASE("Exponential decay for positive positions") {
        rvmc::Walkers const poss = LinspaceWalkers(0.1, 5, 50);
        for (rvmc::FPType a : {-10.0, -1.0, 0.0, 0.5, 1.0, 3.0, 150.0}) {
            std::vector<rvmc::FPType> const psi = rvmc::Wavefunction(poss, rvmc::VarParam{a});
            REQUIRE(psi.size() == poss.size());
            for (std::size_t i = 0; i != poss.size(); ++i) {
                CHECK_MESSAGE(psi[i] == std::exp(-a * poss[i].val), "alpha: " + std::to_string(a));
            }
        }
    }

    SUBCASE("Vanishes for non-positive positions, zero included") {
        rvmc::Walkers const poss = MakeWalkers({0, -0.0, -1e-300, -0.5, -3, -1000});
        for (rvmc::FPType a : {-1000.0, -2.0, 0.0, 1.0, 200.0}) {
            std::vector<rvmc::FPType> const psi = rvmc::Wavefunction(poss, rvmc::VarParam{a});
            CHECK(std::all_of(psi.begin(), psi.end(), [](rvmc::FPType p) { return p == 0; }));
        }
    }

    SUBCASE("Mixed positions keep their order") {
        std::vector<rvmc::FPType> const psi =
            rvmc::Wavefunction(MakeWalkers({1, -1, 2, 0}), rvmc::VarParam{1});
        REQUIRE(psi.size() == 4);
        CHECK(psi[0] == std::exp(-1.0));
        CHECK(psi[1] == 0);
        CHECK(psi[2] == std::exp(-2.0));
        CHECK(psi[3] == 0);
    }

    SUBCASE("Empty ensemble") {
        CHECK(rvmc::Wavefunction(rvmc::Walkers{}, rvmc::VarParam{1}).empty());
    }

    SUBCASE("Alpha outside of the stable range") {
        rvmc::Walkers const poss = MakeWalkers({1, 2, 3});
        CHECK_THROWS_AS(rvmc::Wavefunction(poss, rvmc::VarParam{-1000.5}), std::out_of_range);
        CHECK_THROWS_AS(rvmc::Wavefunction(poss, rvmc::VarParam{-1e6}), std::out_of_range);
        CHECK_THROWS_AS(rvmc::Wavefunction(poss, rvmc::VarParam{200.5}), std::out_of_range);
        CHECK_THROWS_AS(rvmc::Wavefunction(poss, rvmc::VarParam{1e6}), std::out_of_range);
        rvmc::VarParam const infiniteAlpha{std::numeric_limits<rvmc::FPType>::infinity()};
        CHECK_THROWS_AS(rvmc::Wavefunction(poss, infiniteAlpha), std::out_of_range);
        CHECK_NOTHROW(rvmc::Wavefunction(poss, rvmc::minAlpha));
        CHECK_NOTHROW(rvmc::Wavefunction(poss, rvmc::maxAlpha));
    }

    SUBCASE("Alpha that is not a number") {
        rvmc::VarParam const nanAlpha{std::numeric_limits<rvmc::FPType>::quiet_NaN()};
        CHECK_THROWS_AS(rvmc::Wavefunction(MakeWalkers({1}), nanAlpha), std::invalid_argument);
        CHECK_THROWS_WITH(rvmc::ValidateAlpha(rvmc::VarParam{std::nan("")}), "Alpha must be a real number.");
    }
}

TEST_CASE("Testing the local energy") {
    SUBCASE("Matches the closed form") {
        rvmc::Walkers const poss = LinspaceWalkers(0.05, 10, 100);
        for (rvmc::FPType a : {1e-10, 0.3, 0.8, 1.0, 2.5, 1000.0}) {
            std::vector<rvmc::Energy> const localEns = rvmc::LocalEnergies(poss, rvmc::VarParam{a});
            REQUIRE(localEns.size() == poss.size());
            for (std::size_t i = 0; i != poss.size(); ++i) {
                rvmc::FPType const x = poss[i].val;
                CHECK(localEns[i].val == doctest::Approx(-1 / x - a * a / 2 + a / x));
            }
        }
    }

    SUBCASE("Constant for the exact ground state") {
        // With alpha = 1 the trial wavefunction is the exact eigenstate, so the local energy is -1/2
        // everywhere
        std::vector<rvmc::Energy> const localEns =
            rvmc::LocalEnergies(LinspaceWalkers(0.1, 8, 30), rvmc::VarParam{1});
        for (rvmc::Energy e : localEns) {
            CHECK(std::abs(e.val + 0.5) < closedFormTolerance);
        }
    }

    SUBCASE("Negative positions follow the same formula") {
        std::vector<rvmc::Energy> const localEns =
            rvmc::LocalEnergies(MakeWalkers({-2}), rvmc::VarParam{0.5});
        CHECK(localEns[0].val == doctest::Approx(0.5 - 0.125 - 0.25));
    }
}

TEST_CASE("Testing the logarithmic derivative of the wavefunction") {
    rvmc::Walkers const poss = MakeWalkers({0.5, 1, 2.25, 3});
    std::vector<rvmc::FPType> const dLogPsi = rvmc::DLogWavefDAlpha(poss);
    REQUIRE(dLogPsi.size() == poss.size());
    for (std::size_t i = 0; i != poss.size(); ++i) {
        CHECK(dLogPsi[i] == -poss[i].val);
    }
}
