#ifndef INVARIANT_CHECKER_HPP
#define INVARIANT_CHECKER_HPP

#include "compartmental/SimulationResult.hpp"
#include <string>
#include <vector>
#include <cstddef>

namespace compartmental {

    /**
     * @enum InvariantKind
     * @brief Which epidemiological invariant a violation breaks.
     */
    enum class InvariantKind {
        PopulationConservation,  ///< Sum of compartments drifted from the population.
        NonNegativity            ///< A compartment went below -tolerance.
    };

    std::string toString(InvariantKind kind);

    /**
     * @struct InvariantViolation
     * @brief One invariant breach at one output time point.
     */
    struct InvariantViolation {
        std::size_t index = 0;     ///< Position in the result.
        double time = 0.0;         ///< Output time of the offending state.
        InvariantKind kind = InvariantKind::PopulationConservation;
        std::string compartment;   ///< Offending compartment; empty for conservation breaches.
        double value = 0.0;        ///< Compartment value, or the state total for conservation breaches.
        double expected = 0.0;     ///< Population for conservation breaches, 0 for non-negativity.

        /** @brief One-line human readable description. */
        std::string describe() const;
    };

    /**
     * @class InvariantChecker
     * @brief Verifies population conservation and non-negativity of a simulation result.
     *
     * Never modifies the result. An empty return value means every state passed.
     */
    class InvariantChecker {
    public:
        InvariantChecker() = delete;

        /**
         * @brief Checks every state of `result`.
         *
         * A state violates conservation when |sum - population| > tolerance, and
         * non-negativity for each compartment whose value is below -tolerance.
         *
         * @param result Result to inspect.
         * @param population Expected total population.
         * @param tolerance Absolute tolerance, must be non-negative.
         * @return Violations in time order; conservation first within a time point.
         *
         * @throws ConfigurationException If `tolerance` is negative or not finite.
         * @throws InvalidResultException If `result` is not valid.
         */
        static std::vector<InvariantViolation> check(const SimulationResult& result,
                                                     double population,
                                                     double tolerance);

        /** @brief Convenience: true when check() finds nothing. */
        static bool holds(const SimulationResult& result, double population, double tolerance);
    };

} // namespace compartmental

#endif // INVARIANT_CHECKER_HPP
