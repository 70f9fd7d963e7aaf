#include "compartmental/Simulator.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <cmath>
#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace compartmental {

    Simulator::Simulator(std::shared_ptr<IOdeSolverStrategy> solver_strategy_,
                         double abs_error_,
                         double rel_error_,
                         int max_steps_)
        : solver_strategy(std::move(solver_strategy_)),
          abs_error(abs_error_),
          rel_error(rel_error_),
          max_steps(max_steps_)
    {
        if (!solver_strategy) {
            THROW_CONFIGURATION_ERROR("Simulator::Simulator", "Solver strategy pointer cannot be null.");
        }
        setErrorTolerance(abs_error_, rel_error_);
        setMaxSteps(max_steps_);
    }

    void Simulator::setErrorTolerance(double abs_error_, double rel_error_) {
        if (!(abs_error_ >= 0) || !(rel_error_ >= 0) || (abs_error_ == 0 && rel_error_ == 0)) {
            THROW_CONFIGURATION_ERROR("Simulator::setErrorTolerance",
                                      "Error tolerances must be non-negative and not both zero. Received: abs_error=" +
                                      std::to_string(abs_error_) + ", rel_error=" + std::to_string(rel_error_));
        }
        abs_error = abs_error_;
        rel_error = rel_error_;
    }

    void Simulator::setMaxSteps(int max_steps_) {
        if (max_steps_ <= 0) {
            THROW_CONFIGURATION_ERROR("Simulator::setMaxSteps",
                                      "Maximum step count must be positive. Received: " + std::to_string(max_steps_));
        }
        max_steps = max_steps_;
    }

    SimulationResult Simulator::integrate(const ModelDefinition& model,
                                          const state_type& initial_state,
                                          const ParameterSet& params,
                                          const TimeGrid& time_grid) const {
        if (initial_state.size() != static_cast<std::size_t>(model.getStateSize())) {
            THROW_CONFIGURATION_ERROR("Simulator::integrate",
                                      "Initial state size (" + std::to_string(initial_state.size()) +
                                      ") does not match model state size (" +
                                      std::to_string(model.getStateSize()) + ").");
        }
        for (double value : initial_state) {
            if (!std::isfinite(value)) {
                THROW_CONFIGURATION_ERROR("Simulator::integrate", "Initial state contains a non-finite value.");
            }
        }
        model.validateParameters(params);

        const std::vector<double>& times = time_grid.getPoints();

        SimulationResult result;
        result.compartment_names = model.getCompartmentNames();
        result.time_points.reserve(times.size());
        result.solution.reserve(times.size());

        double last_time_reached = std::numeric_limits<double>::quiet_NaN();

        auto system_function = [&model, &params](const state_type& x, state_type& dxdt, double t) {
            model.computeDerivatives(t, x, params, dxdt);
        };

        auto observer = [&result, &last_time_reached](const state_type& x, double t) {
            for (double value : x) {
                if (!std::isfinite(value)) {
                    THROW_INTEGRATION_ERROR("Simulator::integrate observer",
                                            "Non-finite state produced at t = " + std::to_string(t) + ".",
                                            last_time_reached);
                }
            }
            result.time_points.push_back(t);
            result.solution.push_back(x);
            last_time_reached = t;
        };

        const double dt_hint = (times.size() > 1) ? times[1] - times[0] : 1.0;
        state_type working_state = initial_state;

        Logger::getInstance().debug("Simulator::integrate",
                                    "Integrating model '" + model.getName() + "' with " + solver_strategy->getName() +
                                    " over " + std::to_string(times.size()) + " output points (abs=" +
                                    std::to_string(abs_error) + ", rel=" + std::to_string(rel_error) + ").");
        try {
            solver_strategy->integrate(
                system_function,
                working_state,
                times,
                dt_hint,
                observer,
                abs_error,
                rel_error,
                max_steps
            );
        } catch (const IntegrationException& e) {
            Logger::getInstance().error("Simulator::integrate", e.what());
            if (std::isnan(e.getLastTimeReached())) {
                throw IntegrationException("Simulator::integrate",
                                           std::string(e.what()) + " (last time reached: " +
                                           std::to_string(last_time_reached) + ")",
                                           last_time_reached);
            }
            throw;
        } catch (const ModelException& e) {
            Logger::getInstance().error("Simulator::integrate", e.what());
            throw;
        } catch (const std::exception& e) {
            std::string msg = "Integration failed: " + std::string(e.what());
            Logger::getInstance().error("Simulator::integrate", msg);
            THROW_INTEGRATION_ERROR("Simulator::integrate", msg, last_time_reached);
        }

        if (result.time_points.size() != times.size() || result.solution.size() != times.size()) {
            THROW_INTEGRATION_ERROR("Simulator::integrate",
                                    "Solver reported " + std::to_string(result.time_points.size()) + " of " +
                                    std::to_string(times.size()) + " requested time points.",
                                    last_time_reached);
        }
        if (result.time_points.front() != times.front() || result.solution.front() != initial_state) {
            THROW_INTEGRATION_ERROR("Simulator::integrate",
                                    "Initial time point " + std::to_string(times.front()) + " was not reported unchanged.",
                                    last_time_reached);
        }

        Logger::getInstance().debug("Simulator::integrate",
                                    "Integration completed: " + std::to_string(result.time_points.size()) + " points.");
        return result;
    }

} // namespace compartmental
