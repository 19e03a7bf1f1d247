//!
//! @file main.hpp
//! @brief Helper functions for main
//! @authors Lorenzo Fabbri, Francesco Orso Pancaldi
//!
//! Contains the definitions of the helper functions used in main.cpp
//! @see main.cpp
//!

#ifndef RVMC_MAIN_HPP
#define RVMC_MAIN_HPP

#include "sciplot/sciplot.hpp"
#include "src/rvmc.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <string>
#include <vector>

namespace rvmc {

//! @defgroup main-constants Constants
//! @{

//! @brief Exact optimal alpha of the hydrogen ground state, in atomic units
constexpr VarParam exactAlpha{1};
//! @brief Exact hydrogen ground state energy, in atomic units
constexpr Energy exactEnergy{-0.5};
//! @brief Confidence level of the interval printed for the energy
constexpr FPType confLvl{95};
//! @brief Number of bins of the histogram of the final positions
constexpr IntType numBins_histogram = 200;
//! @brief Width of the progress bar, in characters
constexpr IntType width_progressBar = 50;

//! @}

//! @defgroup Helper functions for reporting
//! @brief Print the configuration, the progress and the results of a run
//! @{

//! @brief Prints the settings of the simulation
void PrintConfig(SimConfig const &config) {
    std::cout << "numwalkers: " << config.numWalkers << "  numsteps: " << config.numSteps
              << "  equilibration_steps: " << config.equilibrationSteps << '\n'
              << "alpha: " << config.alpha << "  learning_rate: " << config.learningRate
              << "  step_size: " << config.stepSize << "  seed: " << config.seed << '\n';
}

//! @brief Draws a progress bar on std::clog, overwriting the previous one
//! @param done The number of completed steps
//! @param total The total number of steps
void PrintProgress(IntType done, IntType total) {
    IntType const filled = width_progressBar * done / total;
    std::clog << '\r' << '[' << std::string(static_cast<UIntType>(filled), '#')
              << std::string(static_cast<UIntType>(width_progressBar - filled), ' ') << "] " << done << '/'
              << total << std::flush;
    if (done == total) {
        std::clog << '\n';
    }
}

//! @brief Prints the final alpha and the statistics of the positions and of the energies
void PrintSummary(RunResult const &result) {
    std::cout << std::fixed << std::setprecision(3);
    std::cout << "\nexpected alpha value = " << exactAlpha << '\n';
    std::cout << "expected energy value = " << exactEnergy << '\n';
    std::cout << "Final optimized alpha: " << result.finalAlpha << '\n';
    std::cout << "Mean final position: " << Mean(result.finalPoss).val << '\n';
    std::cout << "Variance of the final positions: " << Variance(result.finalPoss) << '\n';
    std::cout << "Mean local energy: " << Mean(result.energies) << '\n';
    std::cout << "Variance of the mean local energy: " << Variance(result.energies) << '\n';
    if (result.energies.size() > 1) {
        ConfInterval const confInt =
            GetConfInt(Mean(result.energies), StdDevOfMean(result.energies), confLvl);
        std::cout << "Conf. Int. with " << confLvl << "% Conf. Lvl.: [" << confInt.min << ", " << confInt.max
                  << "]\n";
    }
    std::cout << "Acceptance rate: " << result.acceptanceRate << '\n';
}

//! @}

//! @defgroup Helper functions for plotting
//! @brief Plot the distribution of the walkers and the trajectories of a run
//! @{

//! @brief Creates the histogram of the final positions of the walkers
//! @param poss The final positions
//! @return The Canvas containing the plot
sciplot::Canvas MakePositionsGraph(Walkers const &poss) {
    Histogram const histogram = DensityHistogram(poss, numBins_histogram);

    sciplot::Plot2D plot;
    plot.xlabel("Position");
    plot.ylabel("Density");
    plot.legend().hide();

    plot.drawBoxes(histogram.centers, histogram.densities)
        .fillSolid()
        .fillColor("#3CB371") // Medium Sea Green
        .fillIntensity(0.6)
        .label("Final positions");

    plot.grid().lineWidth(1).lineColor("#9370DB").show(); // Lavender purple

    sciplot::Figure fig = {{plot}};
    fig.title("Histogram of Final Positions");
    sciplot::Canvas canvas = {{fig}};
    return canvas;
}

//! @brief Creates the graph of a quantity as a function of the step
//! @param values The value of the quantity at each step
//! @param name The name of the quantity
//! @param color The color of the curve
//! @return The Canvas containing the plot
sciplot::Canvas MakeEvolutionGraph(std::vector<FPType> const &values, std::string const &name,
                                   std::string const &color) {
    std::vector<FPType> steps(values.size());
    std::iota(steps.begin(), steps.end(), FPType{0});

    sciplot::Plot2D plot;
    plot.xlabel("Step");
    plot.ylabel(name);
    plot.legend().hide();

    plot.drawCurve(steps, values).lineColor(color).lineWidth(2).label(name);

    plot.grid().lineWidth(1).lineColor("#9370DB").show(); // Lavender purple

    sciplot::Figure fig = {{plot}};
    fig.title("Evolution of " + name);
    sciplot::Canvas canvas = {{fig}};
    return canvas;
}

//! @}

} // namespace rvmc

#endif
