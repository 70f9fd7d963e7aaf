#ifndef SIMULATION_RUNNER_HPP
#define SIMULATION_RUNNER_HPP

#include "compartmental/Simulator.hpp"
#include "compartmental/ModelVariant.hpp"
#include "compartmental/ModelDefinition.hpp"
#include "compartmental/ParameterSet.hpp"
#include "compartmental/SimulationResult.hpp"
#include "compartmental/TimeGrid.hpp"

namespace compartmental {

    /**
     * @class SimulationRunner
     * @brief Binds a model, an initial state, parameters and a time grid into one integration request.
     *
     * All inputs are validated before the solver is invoked, so configuration problems
     * surface as ConfigurationException without any integration work. After integrating,
     * the runner checks the invariants; a breach triggers a retry with tolerances tightened
     * by `kToleranceRefinementFactor`, and a breach that survives every retry is raised as an
     * IntegrationException. With enforcement disabled the result is returned as computed and
     * the caller is expected to run InvariantChecker itself.
     *
     * run() performs no file or console output apart from log lines.
     */
    class SimulationRunner {
    public:
        static constexpr double kToleranceRefinementFactor = 100.0;

        /**
         * @param simulator Integrator used for every run. Defaults to Dormand-Prince 5(4)
         *                  with absolute and relative tolerances of 1e-6.
         */
        explicit SimulationRunner(Simulator simulator);
        SimulationRunner();

        /**
         * @brief Absolute tolerance used by the post-integration invariant gate (default 1e-4).
         * @throws ConfigurationException If negative or not finite.
         */
        void setInvariantTolerance(double tolerance);

        /**
         * @brief Number of retries with tighter tolerances before giving up (default 2).
         * @throws ConfigurationException If negative.
         */
        void setMaxRefinements(int refinements);

        /** @brief Enables or disables the invariant gate (enabled by default). */
        void setEnforceInvariants(bool enforce) { enforce_invariants_ = enforce; }

        double getInvariantTolerance() const { return invariant_tolerance_; }
        int getMaxRefinements() const { return max_refinements_; }
        bool getEnforceInvariants() const { return enforce_invariants_; }
        const Simulator& getSimulator() const { return simulator_; }

        /**
         * @brief Simulates a built-in variant on a uniform grid 0, step, ..., horizon.
         *
         * @param variant Model variant.
         * @param population Total population N, positive.
         * @param initial_counts Initial counts by compartment; the remainder of N goes to S.
         * @param parameters Rate parameters required by the variant (beta, gamma, sigma).
         * @param horizon Final time, positive.
         * @param step Output spacing, positive and not larger than `horizon`.
         *
         * @throws ConfigurationException On any invalid input; raised before integration.
         * @throws IntegrationException If the solver fails or invariants stay violated after all retries.
         */
        SimulationResult run(ModelVariant variant,
                             double population,
                             const CompartmentValues& initial_counts,
                             const ParameterSet& parameters,
                             double horizon,
                             double step) const;

        /**
         * @brief Simulates an arbitrary model definition on an arbitrary grid.
         *
         * @throws ConfigurationException On any invalid input; raised before integration.
         * @throws IntegrationException If the solver fails or invariants stay violated after all retries.
         */
        SimulationResult run(const ModelDefinition& model,
                             double population,
                             const CompartmentValues& initial_counts,
                             const ParameterSet& parameters,
                             const TimeGrid& time_grid) const;

    private:
        Simulator simulator_;
        double invariant_tolerance_;
        int max_refinements_;
        bool enforce_invariants_;
    };

} // namespace compartmental

#endif // SIMULATION_RUNNER_HPP
