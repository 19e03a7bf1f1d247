//!
//! @file config.hpp
//! @brief Configuration of a simulation
//! @authors Lorenzo Fabbri, Francesco Orso Pancaldi
//!
//! The parameters of a simulation come from three sources, with decreasing priority: the command line, a
//! configuration file and the built-in defaults.
//! The configuration file is an INI file whose keys are in the [Simulation] section, for example
//!
//!     [Simulation]
//!     numwalkers = 4000
//!     alpha = 0.8
//!
//! @see config.cpp
//!

#ifndef RVMC_CONFIG_HPP
#define RVMC_CONFIG_HPP

#include "types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace rvmc {

//! @defgroup config-types Configuration types
//! @{

//! @brief All the settings of a simulation, already resolved
struct SimConfig {
    IntType numWalkers;
    IntType numSteps;
    IntType equilibrationSteps;
    VarParam alpha;
    FPType learningRate;
    FPType stepSize;
    UIntType seed;
    std::string outputDir;
};

//! @brief Settings coming from a single source, each of which may be missing
struct ConfigOverrides {
    std::optional<IntType> numWalkers;
    std::optional<IntType> numSteps;
    std::optional<IntType> equilibrationSteps;
    std::optional<VarParam> alpha;
    std::optional<FPType> learningRate;
    std::optional<FPType> stepSize;
    std::optional<UIntType> seed;
    std::optional<std::string> outputDir;
};

//! @brief Parsed command line
struct CommandLine {
    ConfigOverrides overrides;
    std::optional<std::string> configPath;
    bool help;
};

//! @}

//! @defgroup config-constants Defaults
//! @{

constexpr IntType defaultNumWalkers = 4000;
constexpr IntType defaultNumSteps = 120;
constexpr IntType defaultEquilibrationSteps = 3000;
constexpr VarParam defaultAlpha{0.8};
constexpr FPType defaultLearningRate = 0.01;
constexpr FPType defaultStepSize = 0.1;
constexpr UIntType defaultSeed = 19436u;
inline std::string const defaultOutputDir = "results";

//! @}

SimConfig DefaultConfig();

ConfigOverrides ParseConfigFile(std::string const &);

CommandLine ParseCommandLine(std::vector<std::string> const &);

SimConfig ResolveConfig(ConfigOverrides const &, ConfigOverrides const &);

RunParams ToRunParams(SimConfig const &);

std::string UsageMessage(std::string const &);

} // namespace rvmc

#endif
