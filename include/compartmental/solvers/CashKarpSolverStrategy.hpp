#ifndef CASH_KARP_SOLVER_STRATEGY_HPP
#define CASH_KARP_SOLVER_STRATEGY_HPP

#include "compartmental/interfaces/IOdeSolverStrategy.hpp"

namespace compartmental {

    /**
     * @brief ODE solver strategy using Boost.Odeint's Runge-Kutta Cash-Karp 5(4) method.
     *
     * Adaptive step size control driven by the embedded fourth order error estimate.
     */
    class CashKarpSolverStrategy : public IOdeSolverStrategy {
    public:
        /**
         * @brief Integrates the system with a controlled Cash-Karp stepper.
         *
         * @param[in] system The function defining the system of ODEs.
         * @param[in,out] initial_state Initial state; contains the final state after integration.
         * @param[in] times Time points at which the solution is reported.
         * @param[in] dt_hint Initial step size hint for the integrator.
         * @param[in] observer Function called at each output point with the current state and time.
         * @param[in] abs_error Absolute error tolerance.
         * @param[in] rel_error Relative error tolerance.
         * @param[in] max_steps Step budget between two consecutive output points.
         *
         * @throws IntegrationException If Boost.Odeint reports a failure.
         */
        void integrate(
            const std::function<void(const state_type&, state_type&, double)>& system,
            state_type& initial_state,
            const std::vector<double>& times,
            double dt_hint,
            std::function<void(const state_type&, double)> observer,
            double abs_error,
            double rel_error,
            int max_steps) const override;

        std::string getName() const override { return "cash_karp"; }
    };
} // namespace compartmental

#endif // CASH_KARP_SOLVER_STRATEGY_HPP
