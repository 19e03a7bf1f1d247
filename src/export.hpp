//!
//! @file export.hpp
//! @brief Saving the results of a run
//! @authors Lorenzo Fabbri, Francesco Orso Pancaldi
//! @see export.cpp
//!

#ifndef RVMC_EXPORT_HPP
#define RVMC_EXPORT_HPP

#include "types.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace rvmc {

//! @defgroup export-constants File names
//! @{

inline std::string const positionsFile = "final_positions.csv";
inline std::string const alphasFile = "alpha_evolution.csv";
inline std::string const energiesFile = "energy_evolution.csv";
inline std::string const gradientsFile = "gradient_evolution.csv";

//! @}

void SaveColumnToCSV(std::vector<FPType> const &, std::string const &, std::filesystem::path const &);

void SaveResultsToCSV(RunResult const &, std::filesystem::path const &);

} // namespace rvmc

#endif
