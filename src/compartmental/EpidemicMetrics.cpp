#include "compartmental/EpidemicMetrics.hpp"
#include "exceptions/Exceptions.hpp"
#include <cmath>

namespace compartmental {

    double EpidemicMetrics::transmissionRateFromR0(double R0, double gamma) {
        if (!std::isfinite(R0) || R0 < 0.0 || !std::isfinite(gamma) || gamma < 0.0) {
            THROW_CONFIGURATION_ERROR("EpidemicMetrics::transmissionRateFromR0",
                                      "R0 and gamma must be finite and non-negative. Got R0=" + std::to_string(R0) +
                                      ", gamma=" + std::to_string(gamma));
        }
        return R0 * gamma;
    }

    double EpidemicMetrics::basicReproductionNumber(ModelVariant variant, const ParameterSet& params) {
        if (variant == ModelVariant::SI) {
            THROW_CONFIGURATION_ERROR("EpidemicMetrics::basicReproductionNumber",
                                      "The SI model has no recovery; its reproduction number is unbounded.");
        }
        const double beta = params.get("beta");
        const double gamma = params.get("gamma");
        if (gamma <= 0.0) {
            THROW_CONFIGURATION_ERROR("EpidemicMetrics::basicReproductionNumber",
                                      "gamma must be positive to define R0. Got: " + std::to_string(gamma));
        }
        return beta / gamma;
    }

    double EpidemicMetrics::endemicEquilibrium(const ParameterSet& params, double population) {
        const double beta = params.get("beta");
        const double gamma = params.get("gamma");
        if (beta < 0.0 || gamma < 0.0) {
            THROW_CONFIGURATION_ERROR("EpidemicMetrics::endemicEquilibrium", "beta and gamma cannot be negative.");
        }
        if (!std::isfinite(population) || population <= 0.0) {
            THROW_CONFIGURATION_ERROR("EpidemicMetrics::endemicEquilibrium",
                                      "Population must be positive. Got: " + std::to_string(population));
        }
        if (beta <= gamma) {
            return 0.0;
        }
        return population * (1.0 - gamma / beta);
    }

    PeakInfo EpidemicMetrics::findPeak(const SimulationResult& result, const std::string& compartment) {
        if (!result.isValid()) {
            throw InvalidResultException("EpidemicMetrics::findPeak", "Simulation result object is invalid or empty.");
        }
        const std::size_t c = result.compartmentIndex(compartment);

        PeakInfo peak;
        peak.index = 0;
        peak.time = result.time_points[0];
        peak.value = result.solution[0][c];
        for (std::size_t t = 1; t < result.size(); ++t) {
            if (result.solution[t][c] > peak.value) {
                peak.index = t;
                peak.time = result.time_points[t];
                peak.value = result.solution[t][c];
            }
        }
        return peak;
    }

    double EpidemicMetrics::attackRate(const SimulationResult& result, const std::string& susceptible) {
        if (!result.isValid()) {
            throw InvalidResultException("EpidemicMetrics::attackRate", "Simulation result object is invalid or empty.");
        }
        const std::size_t s = result.compartmentIndex(susceptible);
        const double initial_total = result.totalAt(0);
        if (initial_total <= 0.0) {
            throw InvalidResultException("EpidemicMetrics::attackRate", "Initial population must be positive.");
        }
        return (result.solution.front()[s] - result.solution.back()[s]) / initial_total;
    }

} // namespace compartmental
