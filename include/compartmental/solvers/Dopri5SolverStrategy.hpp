#ifndef DOPRI5_SOLVER_STRATEGY_HPP
#define DOPRI5_SOLVER_STRATEGY_HPP

#include "compartmental/interfaces/IOdeSolverStrategy.hpp"

namespace compartmental {

/**
 * @brief ODE solver strategy using Boost.Odeint's Dormand-Prince 5(4) method.
 *
 * Explicit embedded Runge-Kutta pair with adaptive step size control; the
 * default method for the non-stiff compartmental systems handled here.
 */
class Dopri5SolverStrategy : public IOdeSolverStrategy {
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

    std::string getName() const override { return "dopri5"; }
};

} // namespace compartmental

#endif // DOPRI5_SOLVER_STRATEGY_HPP
