#ifndef SIMULATOR_H
#define SIMULATOR_H

#include "compartmental/SimulationResult.hpp"
#include "compartmental/ModelDefinition.hpp"
#include "compartmental/ParameterSet.hpp"
#include "compartmental/TimeGrid.hpp"
#include "compartmental/interfaces/IOdeSolverStrategy.hpp"
#include <memory>

namespace compartmental {

/**
 * @class Simulator
 * @brief Numerical integrator: advances a model's state across a time grid with a pluggable adaptive solver.
 *
 * The solver strategy chooses its internal step sizes from the error tolerances;
 * the grid only decides where the solution is reported. A Simulator holds no
 * per-run state, so one instance can serve concurrent integrations as long as
 * its settings are not changed meanwhile.
 */
class Simulator {
public:
    /**
     * @brief Construct a new Simulator object.
     *
     * @param solver_strategy_ Strategy used for integration.
     * @param abs_error_ Absolute error tolerance (default: 1.0e-6).
     * @param rel_error_ Relative error tolerance (default: 1.0e-6).
     * @param max_steps_ Maximum number of internal steps between two output points (default: 100000).
     *
     * @throws ConfigurationException If `solver_strategy_` is null, a tolerance is negative
     *         or both are zero, or `max_steps_` is not positive.
     */
    explicit Simulator(std::shared_ptr<IOdeSolverStrategy> solver_strategy_,
                       double abs_error_ = 1.0e-6,
                       double rel_error_ = 1.0e-6,
                       int max_steps_ = 100000);

    /**
     * @brief Set new error tolerances for the adaptive ODE solver.
     * @throws ConfigurationException If either tolerance is negative, or both are zero.
     */
    void setErrorTolerance(double abs_error_, double rel_error_);

    /**
     * @brief Set the step budget between consecutive output points.
     * @throws ConfigurationException If `max_steps_` is not positive.
     */
    void setMaxSteps(int max_steps_);

    /**
     * @brief Integrate `model` from `initial_state` and report the state at every grid point.
     *
     * The first reported state is `initial_state` itself, unchanged.
     *
     * @param model Compartment model providing the derivatives.
     * @param initial_state Initial values in the model's compartment order.
     * @param params Rate parameters; validated against the model before integrating.
     * @param time_grid Output time points.
     *
     * @return A SimulationResult with exactly one state per grid point, in grid order.
     *
     * @throws ConfigurationException If the initial state has the wrong size or contains a
     *         non-finite value, or the parameters do not satisfy the model.
     * @throws IntegrationException If the solver fails, exhausts its step budget, or produces
     *         a non-finite state. The exception reports the last grid time successfully reached.
     */
    SimulationResult integrate(const ModelDefinition& model,
                               const state_type& initial_state,
                               const ParameterSet& params,
                               const TimeGrid& time_grid) const;

    std::shared_ptr<IOdeSolverStrategy> getSolverStrategy() const { return solver_strategy; }
    double getAbsError() const { return abs_error; }
    double getRelError() const { return rel_error; }
    int getMaxSteps() const { return max_steps; }

private:
    std::shared_ptr<IOdeSolverStrategy> solver_strategy;
    double abs_error;
    double rel_error;
    int max_steps;
};

} // namespace compartmental

#endif // SIMULATOR_H
