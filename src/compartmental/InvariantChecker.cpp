#include "compartmental/InvariantChecker.hpp"
#include "exceptions/Exceptions.hpp"
#include <cmath>
#include <sstream>

namespace compartmental {

    std::string toString(InvariantKind kind) {
        switch (kind) {
            case InvariantKind::PopulationConservation: return "population conservation";
            case InvariantKind::NonNegativity:          return "non-negativity";
        }
        return "unknown invariant";
    }

    std::string InvariantViolation::describe() const {
        std::ostringstream oss;
        oss << toString(kind) << " violated at t=" << time << " (index " << index << "): ";
        if (kind == InvariantKind::PopulationConservation) {
            oss << "total " << value << " differs from population " << expected
                << " by " << std::fabs(value - expected);
        } else {
            oss << "compartment " << compartment << " = " << value;
        }
        return oss.str();
    }

    std::vector<InvariantViolation> InvariantChecker::check(const SimulationResult& result,
                                                            double population,
                                                            double tolerance) {
        if (!std::isfinite(tolerance) || tolerance < 0.0) {
            THROW_CONFIGURATION_ERROR("InvariantChecker::check",
                                      "Tolerance must be finite and non-negative. Got: " + std::to_string(tolerance));
        }
        if (!result.isValid()) {
            throw InvalidResultException("InvariantChecker::check", "Simulation result object is invalid or empty.");
        }

        std::vector<InvariantViolation> violations;
        for (std::size_t t = 0; t < result.solution.size(); ++t) {
            const state_type& state = result.solution[t];

            const double total = result.totalAt(t);
            if (!(std::fabs(total - population) <= tolerance)) {
                InvariantViolation violation;
                violation.index = t;
                violation.time = result.time_points[t];
                violation.kind = InvariantKind::PopulationConservation;
                violation.value = total;
                violation.expected = population;
                violations.push_back(violation);
            }

            for (std::size_t c = 0; c < state.size(); ++c) {
                if (!(state[c] >= -tolerance)) {
                    InvariantViolation violation;
                    violation.index = t;
                    violation.time = result.time_points[t];
                    violation.kind = InvariantKind::NonNegativity;
                    violation.compartment = result.compartment_names[c];
                    violation.value = state[c];
                    violation.expected = 0.0;
                    violations.push_back(violation);
                }
            }
        }
        return violations;
    }

    bool InvariantChecker::holds(const SimulationResult& result, double population, double tolerance) {
        return check(result, population, tolerance).empty();
    }

} // namespace compartmental
