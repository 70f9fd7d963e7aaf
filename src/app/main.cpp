#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "compartmental/EpidemicMetrics.hpp"
#include "compartmental/InvariantChecker.hpp"
#include "compartmental/ModelVariant.hpp"
#include "compartmental/SimulationResultProcessor.hpp"
#include "compartmental/SimulationRunner.hpp"
#include "compartmental/Simulator.hpp"
#include "compartmental/solvers/SolverStrategyFactory.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/FileUtils.hpp"
#include "utils/Logger.hpp"
#include "utils/ReadSimulationConfiguration.hpp"

using namespace compartmental;

namespace {

void printUsage(const std::string& program) {
    std::cerr << "Usage:\n"
              << "  " << program << " <configuration file>\n"
              << "  " << program << " --preset <SI|SIS|SIR|SEIR> [output.csv]\n";
}

std::string formatNumber(double value, int precision = 2) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

void logSummary(const SimulationConfiguration& config, const SimulationResult& result) {
    Logger& logger = Logger::getInstance();

    PeakInfo peak = EpidemicMetrics::findPeak(result, "I");
    logger.info("main", "Peak infectious: " + formatNumber(peak.value) + " at t = " + formatNumber(peak.time));

    const state_type& final_state = result.solution.back();
    std::string final_values;
    for (std::size_t i = 0; i < result.compartment_names.size(); ++i) {
        final_values += (i ? ", " : "") + result.compartment_names[i] + "=" + formatNumber(final_state[i]);
    }
    logger.info("main", "Final state at t = " + formatNumber(result.time_points.back()) + ": " + final_values);
    logger.info("main", "Attack rate: " + formatNumber(100.0 * EpidemicMetrics::attackRate(result), 2) + "%");

    if (config.variant != ModelVariant::SI) {
        double r0 = EpidemicMetrics::basicReproductionNumber(config.variant, config.getParameterSet());
        logger.info("main", "Basic reproduction number R0 = " + formatNumber(r0, 3));
    }
    if (config.variant == ModelVariant::SIS) {
        double equilibrium = EpidemicMetrics::endemicEquilibrium(config.getParameterSet(), config.population);
        logger.info("main", "Endemic equilibrium I* = " + formatNumber(equilibrium));
    }

    std::vector<InvariantViolation> violations =
        InvariantChecker::check(result, config.population, config.invariant_tolerance);
    if (violations.empty()) {
        logger.info("main", "Invariants hold within tolerance " + formatNumber(config.invariant_tolerance, 6) + ".");
    } else {
        logger.warning("main", std::to_string(violations.size()) + " invariant violation(s); first: " +
                               violations.front().describe());
    }
}

} // namespace

int main(int argc, char* argv[]) {
    const std::string program = argc > 0 ? argv[0] : "compartmental_sim";
    Logger::getInstance().setLogLevel(LogLevel::INFO);

    if (argc < 2) {
        printUsage(program);
        return 1;
    }

    try {
        SimulationConfiguration config;
        const std::string first = argv[1];
        if (first == "--preset") {
            if (argc < 3 || argc > 4) {
                printUsage(program);
                return 1;
            }
            config = presetConfiguration(parseModelVariant(argv[2]));
            config.output_path = (argc == 4) ? std::string(argv[3])
                                             : FileUtils::getOutputPath(toString(config.variant) + "_simulation.csv");
        } else if (argc == 2) {
            config = readSimulationConfiguration(first);
        } else {
            printUsage(program);
            return 1;
        }

        Logger::getInstance().setLogLevel(config.log_level);
        if (!config.log_file.empty()) {
            Logger::getInstance().enableFileLogging(true, config.log_file);
        }

        Logger::getInstance().info("main", "Starting " + toString(config.variant) + " simulation (N = " +
                                           formatNumber(config.population, 0) + ", horizon = " +
                                           formatNumber(config.horizon) + ", step = " + formatNumber(config.step) + ").");

        Simulator simulator(createSolverStrategy(config.solver), config.abs_error, config.rel_error, config.max_steps);
        SimulationRunner runner(simulator);
        runner.setInvariantTolerance(config.invariant_tolerance);

        SimulationResult result = runner.run(config.variant,
                                             config.population,
                                             config.initial_counts,
                                             config.getParameterSet(),
                                             config.horizon,
                                             config.step);
        Logger::getInstance().info("main", "Simulation finished with " + std::to_string(result.size()) + " output points.");

        logSummary(config, result);

        if (!config.output_path.empty()) {
            if (config.output_format == "long") {
                SimulationResultProcessor::saveLongFormatToCSV(result, config.output_path);
            } else {
                SimulationResultProcessor::saveResultsToCSV(result, config.output_path);
            }
        }
    } catch (const IntegrationException& e) {
        Logger::getInstance().fatal("main", std::string("Integration failed: ") + e.what());
        return 1;
    } catch (const ModelException& e) {
        Logger::getInstance().fatal("main", std::string("Simulation aborted: ") + e.what());
        return 1;
    } catch (const std::exception& e) {
        Logger::getInstance().fatal("main", std::string("Unexpected error: ") + e.what());
        return 1;
    }

    Logger::getInstance().info("main", "Done.");
    return 0;
}
