#include "compartmental/solvers/CashKarpSolverStrategy.hpp"
#include "exceptions/Exceptions.hpp"
#include <boost/numeric/odeint/integrate/integrate_times.hpp>
#include <boost/numeric/odeint/integrate/max_step_checker.hpp>
#include <boost/numeric/odeint/stepper/generation.hpp>
#include <boost/numeric/odeint/stepper/runge_kutta_cash_karp54.hpp>
#include <boost/numeric/odeint/util/odeint_error.hpp>

namespace compartmental {

void CashKarpSolverStrategy::integrate(
    const std::function<void(const state_type&, state_type&, double)>& system,
    state_type& initial_state,
    const std::vector<double>& times,
    double dt_hint,
    std::function<void(const state_type&, double)> observer,
    double abs_error,
    double rel_error,
    int max_steps) const
{
    namespace odeint = boost::numeric::odeint;
    try {
        odeint::integrate_times(
            odeint::make_controlled<odeint::runge_kutta_cash_karp54<state_type>>(abs_error, rel_error),
            system,
            initial_state,
            times.begin(), times.end(),
            dt_hint,
            observer,
            odeint::max_step_checker(max_steps)
        );
    } catch (const ModelException&) {
        throw;
    } catch (const odeint::odeint_error& e) {
        throw IntegrationException("CashKarpSolverStrategy::integrate", "Boost.Odeint could not advance the solution: " + std::string(e.what()));
    } catch (const std::exception& e) {
        throw IntegrationException("CashKarpSolverStrategy::integrate", "Boost.Odeint integration failed: " + std::string(e.what()));
    }
}

} // namespace compartmental
