//!
//! @file config.cpp
//! @brief Definition of the configuration functions
//! @authors Lorenzo Fabbri, Francesco Orso Pancaldi
//! @see config.hpp
//!

#include "config.hpp"

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <type_traits>

namespace rvmc {

namespace {

//! @defgroup config-helpers Configuration helpers
//! @{

//! @brief Converts the text of a setting to its type
//! @param key The name of the setting, used in the error message
//! @param text The text to convert
//! @return The converted value
//!
//! Throws std::invalid_argument if the whole text is not a valid representation of the type.
template <class T>
T Convert_(std::string const &key, std::string const &text) {
    std::string const trimmed = boost::algorithm::trim_copy(text);
    std::string expected;
    if constexpr (std::is_floating_point_v<T>) {
        expected = "a real number";
    } else if constexpr (std::is_unsigned_v<T>) {
        expected = "a non-negative integer";
    } else {
        expected = "an integer";
    }
    // lexical_cast silently wraps negative numbers into unsigned types
    if (std::is_unsigned_v<T> && boost::algorithm::starts_with(trimmed, "-")) {
        throw std::invalid_argument(key + " must be " + expected + ", got '" + text + "'.");
    }
    try {
        return boost::lexical_cast<T>(trimmed);
    } catch (boost::bad_lexical_cast const &) {
        throw std::invalid_argument(key + " must be " + expected + ", got '" + text + "'.");
    }
}

//! @brief Stores one setting in the overrides
//! @param overrides Where the setting is stored
//! @param key The name of the setting, as in the configuration file
//! @param text The value of the setting
//! @return Whether the key is a known setting
bool SetKey_(ConfigOverrides &overrides, std::string const &key, std::string const &text) {
    if (key == "numwalkers") {
        overrides.numWalkers = Convert_<IntType>(key, text);
    } else if (key == "numsteps") {
        overrides.numSteps = Convert_<IntType>(key, text);
    } else if (key == "equilibration_steps") {
        overrides.equilibrationSteps = Convert_<IntType>(key, text);
    } else if (key == "alpha") {
        overrides.alpha = VarParam{Convert_<FPType>(key, text)};
    } else if (key == "learning_rate") {
        overrides.learningRate = Convert_<FPType>(key, text);
    } else if (key == "step_size") {
        overrides.stepSize = Convert_<FPType>(key, text);
    } else if (key == "seed") {
        overrides.seed = Convert_<UIntType>(key, text);
    } else if (key == "output_dir") {
        overrides.outputDir = boost::algorithm::trim_copy(text);
    } else {
        return false;
    }
    return true;
}

//! @brief Overwrites the settings which are present in the overrides
void Apply_(SimConfig &config, ConfigOverrides const &overrides) {
    config.numWalkers = overrides.numWalkers.value_or(config.numWalkers);
    config.numSteps = overrides.numSteps.value_or(config.numSteps);
    config.equilibrationSteps = overrides.equilibrationSteps.value_or(config.equilibrationSteps);
    config.alpha = overrides.alpha.value_or(config.alpha);
    config.learningRate = overrides.learningRate.value_or(config.learningRate);
    config.stepSize = overrides.stepSize.value_or(config.stepSize);
    config.seed = overrides.seed.value_or(config.seed);
    config.outputDir = overrides.outputDir.value_or(config.outputDir);
}

//! @}

} // namespace

//! @addtogroup user-functions
//! @{

//! @brief The built-in settings
SimConfig DefaultConfig() {
    return SimConfig{defaultNumWalkers,   defaultNumSteps, defaultEquilibrationSteps, defaultAlpha,
                     defaultLearningRate, defaultStepSize, defaultSeed,               defaultOutputDir};
}

//! @brief Reads the settings in the [Simulation] section of an INI file
//! @param configPath The path of the file
//! @return The settings found in the file
//!
//! Unknown keys are ignored, keys are case insensitive.
//! Throws std::runtime_error if the file does not exist, and std::invalid_argument if a value cannot be
//! converted to the type of its setting.
ConfigOverrides ParseConfigFile(std::string const &configPath) {
    if (!std::filesystem::exists(configPath)) {
        throw std::runtime_error("Configuration file '" + configPath + "' not found.");
    }

    boost::property_tree::ptree tree;
    boost::property_tree::read_ini(configPath, tree);

    ConfigOverrides result;
    auto const section = tree.get_child_optional("Simulation");
    if (!section) {
        return result;
    }
    for (auto const &[key, node] : *section) {
        SetKey_(result, boost::algorithm::to_lower_copy(key), node.data());
    }
    return result;
}

//! @brief Parses the command line arguments, without the name of the program
//! @param args The arguments
//! @return The settings found on the command line, and the path of the configuration file if given
//!
//! Options have the form '--key=value' or '--key value', where key is one of the keys of the configuration
//! file or 'config'. Dashes in the key are equivalent to underscores.
CommandLine ParseCommandLine(std::vector<std::string> const &args) {
    CommandLine result{ConfigOverrides{}, std::nullopt, false};
    for (std::size_t i = 0; i != args.size(); ++i) {
        std::string const &arg = args[i];
        if (arg == "--help" || arg == "-h") {
            result.help = true;
            continue;
        }
        if (!boost::algorithm::starts_with(arg, "--")) {
            throw std::invalid_argument("Unexpected argument '" + arg + "'.");
        }

        std::string name = arg.substr(2);
        std::string value;
        auto const equalPos = name.find('=');
        if (equalPos != std::string::npos) {
            value = name.substr(equalPos + 1);
            name.erase(equalPos);
        } else if (i + 1 != args.size()) {
            value = args[++i];
        } else {
            throw std::invalid_argument("Missing value for option '" + arg + "'.");
        }
        boost::algorithm::replace_all(name, "-", "_");

        if (name == "config") {
            result.configPath = value;
        } else if (!SetKey_(result.overrides, name, value)) {
            throw std::invalid_argument("Unknown option '--" + name + "'.");
        }
    }
    return result;
}

//! @brief Combines the sources of the settings
//! @param explicitArgs The settings given explicitly, for example on the command line
//! @param fileArgs The settings read from the configuration file
//! @return The settings, where each one is taken from explicitArgs, or fileArgs, or the defaults, in this
//! order of priority
SimConfig ResolveConfig(ConfigOverrides const &explicitArgs, ConfigOverrides const &fileArgs) {
    SimConfig result = DefaultConfig();
    Apply_(result, fileArgs);
    Apply_(result, explicitArgs);
    return result;
}

//! @brief Extracts the parameters of the Markov chain
RunParams ToRunParams(SimConfig const &config) {
    return RunParams{config.equilibrationSteps, config.numSteps,     config.numWalkers,
                     config.alpha,              config.learningRate, config.stepSize};
}

//! @brief Describes the command line options
std::string UsageMessage(std::string const &programName) {
    std::ostringstream os;
    os << "Usage: " << programName << " [options]\n"
       << "Runs a variational Monte Carlo simulation of the ground state of the hydrogen atom.\n\n"
       << "Options (--key=value or --key value):\n"
       << "  --config <path>              INI file with a [Simulation] section\n"
       << "  --numwalkers <int>           number of walkers (default: " << defaultNumWalkers << ")\n"
       << "  --numsteps <int>             number of measurements (default: " << defaultNumSteps << ")\n"
       << "  --equilibration_steps <int>  sweeps before each measurement (default: "
       << defaultEquilibrationSteps << ")\n"
       << "  --alpha <real>               initial variational parameter (default: " << defaultAlpha << ")\n"
       << "  --learning_rate <real>       gradient descent learning rate (default: " << defaultLearningRate
       << ")\n"
       << "  --step_size <real>           standard deviation of the moves (default: " << defaultStepSize
       << ")\n"
       << "  --seed <int>                 seed of the random generator (default: " << defaultSeed << ")\n"
       << "  --output_dir <path>          directory of the results (default: " << defaultOutputDir << ")\n"
       << "  --help                       print this message\n";
    return os.str();
}

//! @}

} // namespace rvmc
