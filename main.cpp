//!
//! @file main.cpp
//! @brief main file
//! @authors Lorenzo Fabbri, Francesco Orso Pancaldi
//!
//! Runs one simulation of the hydrogen atom, optimizing alpha on the fly, then saves the results and the
//! plots in the output directory.
//!

#include "main.hpp"

#include <cstdlib>
#include <exception>
#include <filesystem>

int main(int argc, char *argv[]) {
    using namespace rvmc;

    try {
        CommandLine const commandLine = ParseCommandLine(std::vector<std::string>(argv + 1, argv + argc));
        if (commandLine.help) {
            std::cout << UsageMessage(argv[0]);
            return EXIT_SUCCESS;
        }
        ConfigOverrides const fileArgs =
            commandLine.configPath ? ParseConfigFile(*commandLine.configPath) : ConfigOverrides{};
        SimConfig const config = ResolveConfig(commandLine.overrides, fileArgs);
        PrintConfig(config);

        RandomGenerator gen(static_cast<RandomGenerator::result_type>(config.seed));
        RunResult const result = Metropolis(ToRunParams(config), gen, PrintProgress);
        for (Notice n : result.notices) {
            std::cerr << "Warning: " << NoticeMessage(n) << '\n';
        }
        PrintSummary(result);

        std::filesystem::path const outputDir{config.outputDir};
        SaveResultsToCSV(result, outputDir);
        std::cout << "Values saved to " << outputDir.string() << '\n';

        // sciplot requires vectors of plain numbers as inputs
        std::vector<FPType> alphaVals(result.alphas.size());
        std::transform(result.alphas.begin(), result.alphas.end(), alphaVals.begin(),
                       [](VarParam a) { return a.val; });
        std::vector<FPType> energyVals(result.energies.size());
        std::transform(result.energies.begin(), result.energies.end(), energyVals.begin(),
                       [](Energy e) { return e.val; });

        MakePositionsGraph(result.finalPoss).save((outputDir / "histogram_positions.png").string());
        MakeEvolutionGraph(alphaVals, "Alpha", "#FF0000").save((outputDir / "alpha_evolution.png").string());
        MakeEvolutionGraph(energyVals, "Energy", "#191970") // Midnight Blue
            .save((outputDir / "energy_evolution.png").string());
        std::cout << "Plots saved to " << outputDir.string() << '\n';
    } catch (std::exception const &e) {
        std::cerr << "Error: " << e.what() << '\n';
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
