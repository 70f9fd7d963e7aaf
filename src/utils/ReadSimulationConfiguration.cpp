#include "utils/ReadSimulationConfiguration.hpp"
#include "compartmental/EpidemicMetrics.hpp"
#include "compartmental/solvers/SolverStrategyFactory.hpp"
#include "exceptions/Exceptions.hpp"
#include <cmath>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace compartmental {

namespace {

    const std::string kInitialPrefix = "initial_";

    double parseDouble(const std::string& key, const std::string& text, const std::string& where) {
        std::size_t consumed = 0;
        double value = 0.0;
        try {
            value = std::stod(text, &consumed);
        } catch (const std::invalid_argument&) {
            throw DataFormatException("readSimulationConfiguration",
                                      "Invalid numeric value '" + text + "' for '" + key + "' " + where);
        } catch (const std::out_of_range&) {
            throw DataFormatException("readSimulationConfiguration",
                                      "Numeric value '" + text + "' for '" + key + "' is out of range " + where);
        }
        if (consumed != text.size() || !std::isfinite(value)) {
            throw DataFormatException("readSimulationConfiguration",
                                      "Invalid numeric value '" + text + "' for '" + key + "' " + where);
        }
        return value;
    }

    double parseWholeNumber(const std::string& key, const std::string& text, const std::string& where) {
        const double value = parseDouble(key, text, where);
        if (value != std::floor(value)) {
            throw DataFormatException("readSimulationConfiguration",
                                      "Expected a whole number for '" + key + "' " + where + ", got '" + text + "'");
        }
        return value;
    }

    int parseInt(const std::string& key, const std::string& text, const std::string& where) {
        const double value = parseDouble(key, text, where);
        if (value != std::floor(value) || value < 0 || value > 2147483647.0) {
            throw DataFormatException("readSimulationConfiguration",
                                      "Expected a non-negative integer for '" + key + "' " + where + ", got '" + text + "'");
        }
        return static_cast<int>(value);
    }

} // namespace

SimulationConfiguration parseSimulationConfiguration(std::istream& input, const std::string& source_name) {
    SimulationConfiguration config;
    bool has_model = false;
    bool has_population = false;
    bool has_horizon = false;
    std::optional<double> reproduction_number;

    std::string line;
    int line_number = 0;
    while (std::getline(input, line)) {
        line_number++;
        const std::size_t comment = line.find('#');
        if (comment != std::string::npos) {
            line.erase(comment);
        }

        std::istringstream iss(line);
        std::string key;
        if (!(iss >> key)) {
            continue;
        }
        const std::string where = "on line " + std::to_string(line_number) + " of " + source_name;

        std::string value;
        if (!(iss >> value)) {
            throw DataFormatException("readSimulationConfiguration", "Missing value for '" + key + "' " + where);
        }
        std::string extra;
        if (iss >> extra) {
            throw DataFormatException("readSimulationConfiguration",
                                      "Too many values for '" + key + "' " + where + ". Expected 1 value.");
        }

        if (key == "model") {
            config.variant = parseModelVariant(value);
            has_model = true;
        } else if (key == "population") {
            config.population = parseWholeNumber(key, value, where);
            has_population = true;
        } else if (key == "horizon") {
            config.horizon = parseDouble(key, value, where);
            has_horizon = true;
        } else if (key == "step") {
            config.step = parseDouble(key, value, where);
        } else if (key == "beta" || key == "gamma" || key == "sigma") {
            config.parameters[key] = parseDouble(key, value, where);
        } else if (key == "R0") {
            reproduction_number = parseDouble(key, value, where);
        } else if (key.compare(0, kInitialPrefix.size(), kInitialPrefix) == 0 && key.size() > kInitialPrefix.size()) {
            config.initial_counts[key.substr(kInitialPrefix.size())] = parseDouble(key, value, where);
        } else if (key == "solver") {
            createSolverStrategy(value);
            config.solver = value;
        } else if (key == "abs_error") {
            config.abs_error = parseDouble(key, value, where);
        } else if (key == "rel_error") {
            config.rel_error = parseDouble(key, value, where);
        } else if (key == "max_steps") {
            config.max_steps = parseInt(key, value, where);
        } else if (key == "invariant_tolerance") {
            config.invariant_tolerance = parseDouble(key, value, where);
        } else if (key == "output") {
            config.output_path = value;
        } else if (key == "output_format") {
            if (value != "wide" && value != "long") {
                throw DataFormatException("readSimulationConfiguration",
                                          "output_format must be 'wide' or 'long' " + where + ", got '" + value + "'");
            }
            config.output_format = value;
        } else if (key == "log_level") {
            config.log_level = parseLogLevel(value);
        } else if (key == "log_file") {
            config.log_file = value;
        } else {
            Logger::getInstance().warning("readSimulationConfiguration",
                                          "Unrecognized key '" + key + "' " + where + ". Ignoring.");
        }
    }

    if (!has_model) {
        THROW_CONFIGURATION_ERROR("readSimulationConfiguration", "Missing required key 'model' in " + source_name);
    }
    if (!has_population) {
        THROW_CONFIGURATION_ERROR("readSimulationConfiguration", "Missing required key 'population' in " + source_name);
    }
    if (!has_horizon) {
        THROW_CONFIGURATION_ERROR("readSimulationConfiguration", "Missing required key 'horizon' in " + source_name);
    }

    if (reproduction_number) {
        if (config.parameters.count("beta")) {
            Logger::getInstance().warning("readSimulationConfiguration",
                                          "Both 'beta' and 'R0' given in " + source_name + "; using the explicit beta.");
        } else {
            auto gamma = config.parameters.find("gamma");
            if (gamma == config.parameters.end()) {
                THROW_CONFIGURATION_ERROR("readSimulationConfiguration",
                                          "'R0' requires 'gamma' to derive beta in " + source_name);
            }
            config.parameters["beta"] = EpidemicMetrics::transmissionRateFromR0(*reproduction_number, gamma->second);
        }
    }

    validateConfiguration(config);
    return config;
}

SimulationConfiguration readSimulationConfiguration(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw FileIOException("readSimulationConfiguration", "Unable to open configuration file: " + filename);
    }
    Logger::getInstance().debug("readSimulationConfiguration", "Reading configuration from: " + filename);
    return parseSimulationConfiguration(file, filename);
}

SimulationConfiguration presetConfiguration(ModelVariant variant) {
    SimulationConfiguration config;
    config.variant = variant;
    config.step = 1.0;

    switch (variant) {
        case ModelVariant::SI:
            config.population = 1000;
            config.horizon = 50;
            config.initial_counts = {{"I", 1}};
            config.parameters = {{"beta", 0.5}};
            break;
        case ModelVariant::SIS:
            config.population = 1000;
            config.horizon = 150;
            config.initial_counts = {{"I", 1}};
            config.parameters = {{"beta", 0.5}, {"gamma", 0.1}};
            break;
        case ModelVariant::SIR: {
            const double gamma = 1.0 / 8.0;
            config.population = 100000;
            config.horizon = 100;
            config.initial_counts = {{"I", 10}, {"R", 0}};
            config.parameters = {{"beta", EpidemicMetrics::transmissionRateFromR0(15.0, gamma)}, {"gamma", gamma}};
            break;
        }
        case ModelVariant::SEIR: {
            const double gamma = 1.0 / 7.0;
            config.population = 100000;
            config.horizon = 200;
            config.initial_counts = {{"E", 10}, {"I", 0}, {"R", 0}};
            config.parameters = {{"beta", EpidemicMetrics::transmissionRateFromR0(2.5, gamma)},
                                 {"sigma", 1.0 / 5.0},
                                 {"gamma", gamma}};
            break;
        }
    }
    return config;
}

void validateConfiguration(const SimulationConfiguration& config) {
    const std::string where = "validateConfiguration";
    if (!std::isfinite(config.population) || config.population <= 0 || config.population != std::floor(config.population)) {
        THROW_CONFIGURATION_ERROR(where, "population must be a positive whole number. Got: " + std::to_string(config.population));
    }
    if (config.horizon <= 0) {
        THROW_CONFIGURATION_ERROR(where, "horizon must be positive. Got: " + std::to_string(config.horizon));
    }
    if (config.step <= 0 || config.step > config.horizon) {
        THROW_CONFIGURATION_ERROR(where, "step must be positive and not exceed the horizon. Got: " + std::to_string(config.step));
    }
    if (config.abs_error < 0 || config.rel_error < 0 || (config.abs_error == 0 && config.rel_error == 0)) {
        THROW_CONFIGURATION_ERROR(where, "abs_error and rel_error must be non-negative and not both zero.");
    }
    if (config.max_steps <= 0) {
        THROW_CONFIGURATION_ERROR(where, "max_steps must be positive. Got: " + std::to_string(config.max_steps));
    }
    if (config.invariant_tolerance < 0) {
        THROW_CONFIGURATION_ERROR(where, "invariant_tolerance cannot be negative.");
    }
}

} // namespace compartmental
