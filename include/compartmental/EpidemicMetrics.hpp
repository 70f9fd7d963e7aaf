#ifndef EPIDEMIC_METRICS_HPP
#define EPIDEMIC_METRICS_HPP

#include "compartmental/ModelVariant.hpp"
#include "compartmental/ParameterSet.hpp"
#include "compartmental/SimulationResult.hpp"
#include <string>
#include <cstddef>

namespace compartmental {

    /**
     * @brief Location and height of the maximum of a compartment series.
     */
    struct PeakInfo {
        std::size_t index = 0;
        double time = 0.0;
        double value = 0.0;
    };

    /**
     * @class EpidemicMetrics
     * @brief Summary quantities derived from parameters or from a simulated trajectory.
     */
    class EpidemicMetrics {
    public:
        EpidemicMetrics() = delete;

        /**
         * @brief Transmission rate implied by a basic reproduction number: beta = R0 * gamma.
         * @throws ConfigurationException If either argument is negative or not finite.
         */
        static double transmissionRateFromR0(double R0, double gamma);

        /**
         * @brief R0 = beta / gamma for the variants with recovery.
         * @throws ConfigurationException For SI (no recovery), gamma == 0, or missing parameters.
         */
        static double basicReproductionNumber(ModelVariant variant, const ParameterSet& params);

        /**
         * @brief Endemic infectious level of the SIS model, N * (1 - gamma / beta), or 0 when beta <= gamma.
         * @throws ConfigurationException If beta or gamma is missing or negative, or population is not positive.
         */
        static double endemicEquilibrium(const ParameterSet& params, double population);

        /**
         * @brief Maximum of a compartment over the result; the earliest time wins on ties.
         * @throws InvalidResultException If the result is invalid.
         * @throws OutOfRangeException If the compartment is not part of the result.
         */
        static PeakInfo findPeak(const SimulationResult& result, const std::string& compartment);

        /**
         * @brief Fraction of the initial population that left the susceptible compartment by the last time point.
         * @param result Result to inspect.
         * @param susceptible Name of the susceptible compartment (default "S").
         * @throws InvalidResultException If the result is invalid or its initial total is not positive.
         * @throws OutOfRangeException If the compartment is not part of the result.
         */
        static double attackRate(const SimulationResult& result, const std::string& susceptible = "S");
    };

} // namespace compartmental

#endif // EPIDEMIC_METRICS_HPP
