//!
//! @file test-optimization.cpp
//! @brief Tests for the gradient estimator and the gradient descent step on alpha
//! @authors Lorenzo Fabbri, Francesco Orso Pancaldi
//!

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"

#include "rvmc.hpp"
#include "test.hpp"

#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <string>

// Straightforward evaluation of 2 * (<E_L * L> - <E_L> * <L>), with L = -x
rvmc::FPType ReferenceGradient(std::vector<rvmc::FPType> const &xs, rvmc::FPType alpha) {
    rvmc::FPType sumEL = 0;
    rvmc::FPType sumL = 0;
    rvmc::FPType sumELL = 0;
    for (rvmc::FPType x : xs) {
        rvmc::FPType const eL = -1 / x - alpha * alpha / 2 + alpha / x;
        sumEL += eL;
        sumL += -x;
        sumELL += eL * (-x);
    }
    rvmc::FPType const n = static_cast<rvmc::FPType>(xs.size());
    return 2 * (sumELL / n - (sumEL / n) * (sumL / n));
}

TEST_CASE("Testing DEnergyDAlpha") {
    std::vector<rvmc::FPType> xs(60);
    std::iota(xs.begin(), xs.end(), rvmc::FPType{0});
    std::transform(xs.begin(), xs.end(), xs.begin(), [](rvmc::FPType i) { return 0.5 + 2.5 * i / 59; });
    rvmc::Walkers const poss = MakeWalkers(xs);

    SUBCASE("Finite and equal to the covariance formula") {
        for (rvmc::FPType a : {1e-10, 1e-3, 0.5, 0.8, 1.3, 10.0, 1000.0}) {
            rvmc::FPType const gradient = rvmc::DEnergyDAlpha(poss, rvmc::VarParam{a});
            std::string const logMessage = "alpha: " + std::to_string(a);
            CHECK_MESSAGE(std::isfinite(gradient), logMessage);
            CHECK_MESSAGE(gradient == doctest::Approx(ReferenceGradient(xs, a)).epsilon(1e-9), logMessage);
        }
    }

    SUBCASE("Vanishes at the exact ground state") {
        // The local energy does not depend on the position, so its covariance with anything is 0
        CHECK(std::abs(rvmc::DEnergyDAlpha(poss, rvmc::VarParam{1})) < closedFormTolerance);
    }

    SUBCASE("Sign points towards the exact ground state") {
        // E_L = (alpha - 1) / x - alpha^2 / 2 and L = -x, so the gradient is
        // 2 * (alpha - 1) * (<1/x><x> - 1), where <1/x><x> > 1 for any sample that is not constant
        CHECK(rvmc::DEnergyDAlpha(poss, rvmc::VarParam{0.8}) < 0);
        CHECK(rvmc::DEnergyDAlpha(poss, rvmc::VarParam{1.2}) > 0);
    }

    SUBCASE("Single walker") {
        CHECK(rvmc::DEnergyDAlpha(MakeWalkers({1.7}), rvmc::VarParam{0.8}) == doctest::Approx(0));
    }

    SUBCASE("Empty ensemble") {
        CHECK_THROWS_AS(rvmc::DEnergyDAlpha(rvmc::Walkers{}, rvmc::VarParam{0.8}), std::invalid_argument);
    }
}

TEST_CASE("Testing OptimizeAlpha") {
    rvmc::Walkers const poss = MakeWalkers({0.6, 0.9, 1.4, 2.0, 2.7, 3.0});
    rvmc::VarParam const alpha{0.8};
    rvmc::FPType const gradient = rvmc::DEnergyDAlpha(poss, alpha);

    SUBCASE("Gradient descent step") {
        for (rvmc::FPType lr : {0.0, 1e-6, 0.01, 5.0}) {
            rvmc::AlphaUpdate const update = rvmc::OptimizeAlpha(poss, alpha, lr);
            std::string const logMessage = "learning rate: " + std::to_string(lr);
            CHECK_MESSAGE(update.gradient == gradient, logMessage);
            CHECK_MESSAGE(update.alpha.val == alpha.val - lr * gradient, logMessage);
        }
    }

    SUBCASE("Positive gradient decreases alpha") {
        rvmc::VarParam const largeAlpha{1.5};
        rvmc::AlphaUpdate const update = rvmc::OptimizeAlpha(poss, largeAlpha, 0.01);
        REQUIRE(update.gradient > 0);
        CHECK(update.alpha.val < largeAlpha.val);
    }

    SUBCASE("Zero learning rate freezes alpha and raises a notice") {
        rvmc::AlphaUpdate const update = rvmc::OptimizeAlpha(poss, alpha, 0);
        CHECK(update.alpha.val == alpha.val);
        CHECK(update.gradient == gradient);
        REQUIRE(update.notices.size() == 1);
        CHECK(update.notices[0] == rvmc::Notice::frozenAlpha);
    }

    SUBCASE("Positive learning rate raises no notice") {
        CHECK(rvmc::OptimizeAlpha(poss, alpha, 0.01).notices.empty());
    }

    SUBCASE("Invalid learning rate") {
        CHECK_THROWS_AS(rvmc::OptimizeAlpha(poss, alpha, -0.01), std::out_of_range);
        CHECK_THROWS_AS(rvmc::OptimizeAlpha(poss, alpha, -1e-300), std::out_of_range);
        CHECK_THROWS_AS(rvmc::OptimizeAlpha(poss, alpha, std::nan("")), std::invalid_argument);
        rvmc::FPType const inf = std::numeric_limits<rvmc::FPType>::infinity();
        CHECK_THROWS_AS(rvmc::OptimizeAlpha(poss, alpha, inf), std::invalid_argument);
    }
}
