//!
//! @file export.cpp
//! @brief Definition of the functions that save the results of a run
//! @authors Lorenzo Fabbri, Francesco Orso Pancaldi
//! @see export.hpp
//!

#include "export.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <limits>
#include <stdexcept>

namespace rvmc {

//! @brief Writes a single column CSV file
//! @param values The values, one per line
//! @param header The name of the column, written in the first line
//! @param file The path of the file, which is overwritten
//!
//! The values are written with enough digits to be read back exactly.
void SaveColumnToCSV(std::vector<FPType> const &values, std::string const &header,
                     std::filesystem::path const &file) {
    std::ofstream fileStream(file);
    if (!fileStream) {
        throw std::runtime_error("Could not open '" + file.string() + "' for writing.");
    }
    fileStream << std::setprecision(std::numeric_limits<FPType>::max_digits10);
    fileStream << header << '\n';
    for (FPType v : values) {
        fileStream << v << '\n';
    }
    if (!fileStream) {
        throw std::runtime_error("Error while writing '" + file.string() + "'.");
    }
}

//! @brief Saves the final positions and the trajectories of a run
//! @param result The result of the run
//! @param outputDir The directory where the files are saved, created if missing
void SaveResultsToCSV(RunResult const &result, std::filesystem::path const &outputDir) {
    std::filesystem::create_directories(outputDir);

    std::vector<FPType> positions(result.finalPoss.size());
    std::transform(result.finalPoss.begin(), result.finalPoss.end(), positions.begin(),
                   [](Coordinate c) { return c.val; });
    std::vector<FPType> alphas(result.alphas.size());
    std::transform(result.alphas.begin(), result.alphas.end(), alphas.begin(),
                   [](VarParam a) { return a.val; });
    std::vector<FPType> energies(result.energies.size());
    std::transform(result.energies.begin(), result.energies.end(), energies.begin(),
                   [](Energy e) { return e.val; });

    SaveColumnToCSV(positions, "position", outputDir / positionsFile);
    SaveColumnToCSV(alphas, "alpha", outputDir / alphasFile);
    SaveColumnToCSV(energies, "energy", outputDir / energiesFile);
    SaveColumnToCSV(result.gradients, "gradient", outputDir / gradientsFile);
}

} // namespace rvmc
