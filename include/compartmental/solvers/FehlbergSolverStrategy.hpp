#ifndef FEHLBERG_SOLVER_STRATEGY_HPP
#define FEHLBERG_SOLVER_STRATEGY_HPP

#include "compartmental/interfaces/IOdeSolverStrategy.hpp"

namespace compartmental {

/**
 * @brief ODE solver strategy using Boost.Odeint's Runge-Kutta Fehlberg 7(8) method.
 *
 * Higher order than the 5(4) pairs; useful as a reference solution when
 * comparing the default method against tight tolerances.
 */
class FehlbergSolverStrategy : public IOdeSolverStrategy {
public:
    void integrate(
        const std::function<void(const state_type&, state_type&, double)>& system,
        state_type& initial_state,
        const std::vector<double>& times,
        double dt_hint,
        std::function<void(const state_type&, double)> observer,
        double abs_error,
        double rel_error,
        int max_steps) const override;

    std::string getName() const override { return "fehlberg78"; }
};

} // namespace compartmental

#endif // FEHLBERG_SOLVER_STRATEGY_HPP
