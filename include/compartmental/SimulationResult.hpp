#ifndef SIMULATION_RESULT_HPP
#define SIMULATION_RESULT_HPP

#include "compartmental/StateTypes.hpp"
#include <string>
#include <vector>
#include <cstddef>

namespace compartmental {

    /**
     * @brief Trajectory produced by one integration: one state per requested time point.
     *
     * Produced once by the Simulator and not modified afterwards; processors and
     * checkers only read it.
     */
    struct SimulationResult {
        /** @brief Compartment names, in the order used by every entry of `solution`. */
        std::vector<std::string> compartment_names;

        /** @brief Output time points, strictly increasing. */
        std::vector<double> time_points;

        /** @brief State at each time point, in compartment order. */
        std::vector<state_type> solution;

        SimulationResult() = default;

        /**
         * @brief Checks if the result object contains consistent data.
         * @return true if non-empty, with one state per time point and one value per compartment.
         */
        bool isValid() const;

        std::size_t size() const { return time_points.size(); }

        /**
         * @brief State at a time index, keyed by compartment name.
         * @throws OutOfRangeException If `index` is out of bounds.
         */
        CompartmentValues stateAt(std::size_t index) const;

        /**
         * @brief Sum of all compartments at a time index.
         * @throws OutOfRangeException If `index` is out of bounds.
         */
        double totalAt(std::size_t index) const;

        /**
         * @brief Position of a compartment in each state vector.
         * @throws OutOfRangeException If the compartment is not part of the result.
         */
        std::size_t compartmentIndex(const std::string& compartment) const;

        /**
         * @brief Values of one compartment over time.
         * @throws OutOfRangeException If the compartment is not part of the result.
         */
        std::vector<double> getCompartmentSeries(const std::string& compartment) const;
    };

} // namespace compartmental

#endif // SIMULATION_RESULT_HPP
