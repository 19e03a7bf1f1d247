//!
//! @file types.hpp
//! @brief Type definition header
//! @authors Lorenzo Fabbri, Francesco Orso Pancaldi
//!
//! Definitions of the types used in the program.
//! Some of them are simple wrapper structs, and are used to ensure that the arithmetic operations have
//! physical sense.
//! For example, the code forbids adding up an object of type 'Coordinate' with one of type 'Energy'.
//!

#ifndef RVMC_TYPES_HPP
#define RVMC_TYPES_HPP

#include <cmath>
#include <functional>
#include <iostream>
#include <random>
#include <string>
#include <type_traits>
#include <vector>

namespace rvmc {

//! @defgroup struct-types Structure types
//! @brief Type aliases, used to define the other types
//!
//! These types give a consistent structure to the program and are used to define the other ones.
//! @{

//! @brief Floating point type
//!
//! Can be adjusted to improve either precision or execution time.
//! Only C++ floating point types are allowed
using FPType = double;
static_assert(std::is_floating_point_v<FPType>);
//! @brief Signed integer type
//!
//! The type to use when an integer is needed, even if that integer is guaranteed to be non-negative.
using IntType = int;
static_assert(std::is_integral_v<IntType>);
static_assert(std::is_signed_v<IntType>);
//! @brief Unsigned integer type
//!
//! Should be used instead of IntType only when unsigned integers are explicitly required (for example, to
//! seed the random generator).
using UIntType = long unsigned int;
static_assert(std::is_integral_v<UIntType>);
static_assert(std::is_unsigned_v<UIntType>);
//! @brief Random generator type
//!
//! The only source of randomness of the library: it is always created by the caller and passed by reference.
using RandomGenerator = std::default_random_engine;

//! @}

//! @defgroup lexic-types Lexicon types
//! @brief Types that have a clear physical meaning
//!
//! Types that have a clear physical meaning.
//! Also includes wrapper structs.
//! @{

//! @brief Radial position of one walker
struct Coordinate {
    FPType val;
    Coordinate &operator+=(Coordinate other) {
        val += other.val;
        return *this;
    }
    Coordinate &operator-=(Coordinate other) {
        val -= other.val;
        return *this;
    }
    Coordinate &operator*=(FPType other) {
        val *= other;
        return *this;
    }
    Coordinate &operator/=(FPType other) {
        val /= other;
        return *this;
    }
};
inline Coordinate operator+(Coordinate lhs, Coordinate rhs) { return lhs += rhs; }
inline Coordinate operator-(Coordinate lhs, Coordinate rhs) { return lhs -= rhs; }
inline Coordinate operator*(Coordinate lhs, FPType rhs) { return lhs *= rhs; }
inline Coordinate operator/(Coordinate lhs, FPType rhs) { return lhs /= rhs; }
//! @brief Positions of all the walkers
using Walkers = std::vector<Coordinate>;
//! @brief Variational parameter
//!
//! The decay rate 'alpha' of the trial wavefunction.
struct VarParam {
    FPType val;
    VarParam &operator+=(VarParam other) {
        val += other.val;
        return *this;
    }
    VarParam &operator-=(VarParam other) {
        val -= other.val;
        return *this;
    }
    VarParam &operator*=(FPType other) {
        val *= other;
        return *this;
    }
    VarParam &operator/=(FPType other) {
        val /= other;
        return *this;
    }
    friend std::ostream &operator<<(std::ostream &os, VarParam v) { return os << v.val; }
};
inline VarParam operator+(VarParam lhs, VarParam rhs) { return lhs += rhs; }
inline VarParam operator-(VarParam lhs, VarParam rhs) { return lhs -= rhs; }
inline VarParam operator*(VarParam lhs, FPType rhs) { return lhs *= rhs; }
inline VarParam operator*(FPType lhs, VarParam rhs) { return rhs * lhs; }
inline VarParam operator/(VarParam lhs, FPType rhs) { return lhs /= rhs; }
//! @brief Energy of the system
struct Energy {
    FPType val;
    Energy &operator+=(Energy other) {
        val += other.val;
        return *this;
    }
    Energy &operator-=(Energy other) {
        val -= other.val;
        return *this;
    }
    Energy &operator*=(FPType other) {
        val *= other;
        return *this;
    }
    Energy &operator/=(FPType other) {
        val /= other;
        return *this;
    }
    friend std::ostream &operator<<(std::ostream &os, Energy e) { return os << e.val; }
};
inline Energy operator+(Energy lhs, Energy rhs) { return lhs += rhs; }
inline Energy operator-(Energy lhs, Energy rhs) { return lhs -= rhs; }
inline Energy operator*(Energy lhs, FPType rhs) { return lhs *= rhs; }
inline Energy operator*(FPType lhs, Energy rhs) { return rhs * lhs; }
inline Energy operator/(Energy lhs, FPType rhs) { return lhs /= rhs; }
inline bool operator<(Energy lhs, Energy rhs) { return lhs.val < rhs.val; }
inline bool operator>(Energy lhs, Energy rhs) { return lhs.val > rhs.val; }
inline Energy abs(Energy e) { return Energy{std::abs(e.val)}; }
//! @brief Confidence interval of an energy
struct ConfInterval {
    Energy min;
    Energy max;
};

//! @}

//! @defgroup run-types Run types
//! @brief Inputs and outputs of one Markov chain run
//! @{

//! @brief Non-fatal conditions detected during a run
//!
//! They do not stop the run, but the caller should know about them.
enum class Notice { noEquilibration, frozenAlpha };

//! @brief Human readable description of a notice
inline std::string NoticeMessage(Notice notice) {
    switch (notice) {
    case Notice::noEquilibration:
        return "equilibration_steps is set to 0. The system will not equilibrate before optimization.";
    case Notice::frozenAlpha:
        return "The learning rate is set to 0. No optimization will be performed for alpha.";
    }
    return "Unknown notice.";
}

//! @brief Parameters of one Markov chain run
struct RunParams {
    //! Number of Metropolis sweeps before each measurement
    IntType equilibrationSteps;
    //! Number of measurements, each followed by an update of alpha
    IntType numSteps;
    IntType numWalkers;
    //! Initial value of the variational parameter
    VarParam alpha;
    FPType learningRate;
    //! Standard deviation of the proposed displacements
    FPType stepSize;
};

//! @brief Variational parameter after one gradient descent step
struct AlphaUpdate {
    VarParam alpha;
    //! Estimate of dE/dalpha used for the step
    FPType gradient;
    std::vector<Notice> notices;
};

//! @brief Everything produced by one Markov chain run
struct RunResult {
    Walkers finalPoss;
    VarParam finalAlpha;
    //! Alpha after the update of each step
    std::vector<VarParam> alphas;
    //! Mean local energy of each step
    std::vector<Energy> energies;
    //! Estimate of dE/dalpha of each step
    std::vector<FPType> gradients;
    Walkers initialPoss;
    //! Fraction of accepted Metropolis proposals over the whole run
    FPType acceptanceRate;
    std::vector<Notice> notices;
};

//! @brief Called after each outer step with the number of completed steps and the total
using ProgressCallback = std::function<void(IntType, IntType)>;

//! @}

} // namespace rvmc

#endif
