#ifndef I_ODE_SOLVER_STRATEGY_HPP
#define I_ODE_SOLVER_STRATEGY_HPP

#include "compartmental/StateTypes.hpp"
#include <functional>
#include <string>
#include <vector>

namespace compartmental {

/**
 * @brief Interface for ODE integration strategies.
 *
 * Defines the contract for the adaptive numerical integration methods
 * that can be plugged into the Simulator.
 */
class IOdeSolverStrategy {
public:
    virtual ~IOdeSolverStrategy() = default;

    /**
     * @brief Integrates the ODE system, reporting the state exactly at the given time points.
     *
     * The observer is called once per time point, in order, starting with the unmodified
     * initial state at `times.front()`.
     *
     * @param system The function defining the ODE system (model derivatives).
     * @param initial_state The initial state vector; holds the final state on return.
     * @param times Strictly increasing time points at which to record the solution.
     * @param dt_hint An initial step size hint for the adaptive controller.
     * @param observer A function called at each output time point to record the state.
     * @param abs_error Absolute error tolerance.
     * @param rel_error Relative error tolerance.
     * @param max_steps Maximum number of internal steps allowed between two output points.
     *
     * @throws IntegrationException If integration fails. Exceptions derived from ModelException
     *         thrown by `system` or `observer` propagate unchanged.
     */
    virtual void integrate(
        const std::function<void(const state_type&, state_type&, double)>& system,
        state_type& initial_state,
        const std::vector<double>& times,
        double dt_hint,
        std::function<void(const state_type&, double)> observer,
        double abs_error,
        double rel_error,
        int max_steps) const = 0;

    /**
     * @brief Short identifier of the method, e.g. "dopri5".
     */
    virtual std::string getName() const = 0;
};

} // namespace compartmental

#endif // I_ODE_SOLVER_STRATEGY_HPP
