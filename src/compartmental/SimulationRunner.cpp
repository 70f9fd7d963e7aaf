#include "compartmental/SimulationRunner.hpp"
#include "compartmental/ModelFactory.hpp"
#include "compartmental/InvariantChecker.hpp"
#include "compartmental/solvers/Dopri5SolverStrategy.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <cmath>
#include <limits>
#include <memory>
#include <utility>

namespace compartmental {

    SimulationRunner::SimulationRunner(Simulator simulator)
        : simulator_(std::move(simulator)),
          invariant_tolerance_(1e-4),
          max_refinements_(2),
          enforce_invariants_(true)
    {}

    SimulationRunner::SimulationRunner()
        : SimulationRunner(Simulator(std::make_shared<Dopri5SolverStrategy>()))
    {}

    void SimulationRunner::setInvariantTolerance(double tolerance) {
        if (!std::isfinite(tolerance) || tolerance < 0.0) {
            THROW_CONFIGURATION_ERROR("SimulationRunner::setInvariantTolerance",
                                      "Invariant tolerance must be finite and non-negative. Got: " + std::to_string(tolerance));
        }
        invariant_tolerance_ = tolerance;
    }

    void SimulationRunner::setMaxRefinements(int refinements) {
        if (refinements < 0) {
            THROW_CONFIGURATION_ERROR("SimulationRunner::setMaxRefinements",
                                      "Refinement count cannot be negative. Got: " + std::to_string(refinements));
        }
        max_refinements_ = refinements;
    }

    SimulationResult SimulationRunner::run(ModelVariant variant,
                                           double population,
                                           const CompartmentValues& initial_counts,
                                           const ParameterSet& parameters,
                                           double horizon,
                                           double step) const {
        if (!std::isfinite(horizon) || horizon <= 0.0) {
            THROW_CONFIGURATION_ERROR("SimulationRunner::run", "Horizon must be positive. Got: " + std::to_string(horizon));
        }
        const ModelDefinition model = ModelFactory::create(variant);
        return run(model, population, initial_counts, parameters, TimeGrid::uniform(0.0, horizon, step));
    }

    SimulationResult SimulationRunner::run(const ModelDefinition& model,
                                           double population,
                                           const CompartmentValues& initial_counts,
                                           const ParameterSet& parameters,
                                           const TimeGrid& time_grid) const {
        const state_type initial_state = ModelFactory::createInitialState(model, population, initial_counts);
        model.validateParameters(parameters);

        Logger::getInstance().info("SimulationRunner::run",
                                   "Running " + model.getName() + " model: N=" + std::to_string(population) +
                                   ", t=[" + std::to_string(time_grid.front()) + ", " + std::to_string(time_grid.back()) +
                                   "], " + std::to_string(time_grid.size()) + " output points.");

        Simulator simulator = simulator_;
        std::vector<InvariantViolation> violations;
        for (int attempt = 0; attempt <= max_refinements_; ++attempt) {
            SimulationResult result = simulator.integrate(model, initial_state, parameters, time_grid);
            if (!enforce_invariants_) {
                Logger::getInstance().info("SimulationRunner::run", "Simulation completed (invariant gate disabled).");
                return result;
            }

            violations = InvariantChecker::check(result, population, invariant_tolerance_);
            if (violations.empty()) {
                Logger::getInstance().info("SimulationRunner::run",
                                           "Simulation completed: " + std::to_string(result.size()) + " points.");
                return result;
            }

            Logger::getInstance().warning("SimulationRunner::run",
                                          std::to_string(violations.size()) + " invariant violation(s) with abs=" +
                                          std::to_string(simulator.getAbsError()) + ", rel=" +
                                          std::to_string(simulator.getRelError()) + "; first: " +
                                          violations.front().describe());
            if (attempt < max_refinements_) {
                simulator.setErrorTolerance(simulator.getAbsError() / kToleranceRefinementFactor,
                                            simulator.getRelError() / kToleranceRefinementFactor);
            }
        }

        const InvariantViolation& first = violations.front();
        const double last_valid_time = (first.index > 0)
            ? time_grid[first.index - 1]
            : std::numeric_limits<double>::quiet_NaN();
        Logger::getInstance().error("SimulationRunner::run", "Invariants still violated after " +
                                    std::to_string(max_refinements_) + " refinement(s): " + first.describe());
        THROW_INTEGRATION_ERROR("SimulationRunner::run",
                                "Result violates invariants beyond tolerance " + std::to_string(invariant_tolerance_) +
                                " after " + std::to_string(max_refinements_) + " refinement(s): " + first.describe(),
                                last_valid_time);
    }

} // namespace compartmental
