#ifndef READ_SIMULATION_CONFIGURATION_HPP
#define READ_SIMULATION_CONFIGURATION_HPP

#include "compartmental/ModelVariant.hpp"
#include "compartmental/ParameterSet.hpp"
#include "compartmental/StateTypes.hpp"
#include "utils/Logger.hpp"
#include <istream>
#include <map>
#include <string>

namespace compartmental {

/**
 * @brief Everything the command-line driver needs to set up and export one run.
 */
struct SimulationConfiguration {
    ModelVariant variant = ModelVariant::SIR;
    double population = 0.0;
    double horizon = 0.0;
    double step = 1.0;
    std::map<std::string, double> parameters;   ///< beta, gamma, sigma...
    CompartmentValues initial_counts;           ///< Remainder of the population goes to S.

    std::string solver = "dopri5";
    double abs_error = 1.0e-6;
    double rel_error = 1.0e-6;
    int max_steps = 100000;
    double invariant_tolerance = 1.0e-4;

    std::string output_path;                    ///< Empty: no CSV export.
    std::string output_format = "wide";         ///< "wide" or "long".
    LogLevel log_level = LogLevel::INFO;
    std::string log_file;                       ///< Empty: console only.

    /** @brief Parameters as an immutable ParameterSet. */
    ParameterSet getParameterSet() const { return ParameterSet(parameters); }
};

/**
 * @brief Reads a simulation configuration file.
 *
 * Each non-empty line holds `<key> <value>`; text after '#' is ignored. Recognised keys:
 * model, population, horizon, step, beta, gamma, sigma, R0, initial_<Compartment>,
 * solver, abs_error, rel_error, max_steps, invariant_tolerance, output, output_format,
 * log_level, log_file. When R0 is given without beta, beta is set to R0 * gamma.
 * Unknown keys are logged as warnings and ignored.
 *
 * @param filename Path to the configuration file.
 * @return SimulationConfiguration Parsed and validated configuration.
 *
 * @throws FileIOException If the file cannot be opened.
 * @throws DataFormatException If a line is malformed, a value cannot be parsed, or the
 *         population is not a whole number.
 * @throws ConfigurationException If required keys are missing or values are inconsistent.
 */
SimulationConfiguration readSimulationConfiguration(const std::string& filename);

/**
 * @brief Same as readSimulationConfiguration(), reading from an open stream.
 *
 * @param input Stream holding the configuration text.
 * @param source_name Name used in error messages.
 */
SimulationConfiguration parseSimulationConfiguration(std::istream& input, const std::string& source_name);

/**
 * @brief Reference scenario for a variant (population, initial counts, rates, horizon).
 *
 * SI: N=1000, I=1, beta=0.5, 50 days. SIS: N=1000, I=1, beta=0.5, gamma=0.1, 150 days.
 * SIR: N=100000, I=10, R0=15, gamma=1/8, 100 days. SEIR: N=100000, E=10, R0=2.5,
 * sigma=1/5, gamma=1/7, 200 days. All use a unit output step.
 */
SimulationConfiguration presetConfiguration(ModelVariant variant);

/**
 * @brief Checks the ranges of the scalar settings of a configuration.
 * @throws ConfigurationException On the first invalid setting.
 */
void validateConfiguration(const SimulationConfiguration& config);

} // namespace compartmental

#endif // READ_SIMULATION_CONFIGURATION_HPP
