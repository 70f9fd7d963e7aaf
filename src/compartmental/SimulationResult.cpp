#include "compartmental/SimulationResult.hpp"
#include "exceptions/Exceptions.hpp"
#include <algorithm>
#include <numeric>

namespace compartmental {

    bool SimulationResult::isValid() const {
        if (time_points.empty() || time_points.size() != solution.size() || compartment_names.empty()) {
            return false;
        }
        return std::all_of(solution.begin(), solution.end(), [this](const state_type& state) {
            return state.size() == compartment_names.size();
        });
    }

    CompartmentValues SimulationResult::stateAt(std::size_t index) const {
        if (index >= solution.size()) {
            THROW_OUT_OF_RANGE("SimulationResult::stateAt",
                               "Index " + std::to_string(index) + " out of range for result of size " +
                               std::to_string(solution.size()) + ".");
        }
        CompartmentValues values;
        const state_type& state = solution[index];
        for (std::size_t c = 0; c < compartment_names.size() && c < state.size(); ++c) {
            values[compartment_names[c]] = state[c];
        }
        return values;
    }

    double SimulationResult::totalAt(std::size_t index) const {
        if (index >= solution.size()) {
            THROW_OUT_OF_RANGE("SimulationResult::totalAt",
                               "Index " + std::to_string(index) + " out of range for result of size " +
                               std::to_string(solution.size()) + ".");
        }
        return std::accumulate(solution[index].begin(), solution[index].end(), 0.0);
    }

    std::size_t SimulationResult::compartmentIndex(const std::string& compartment) const {
        auto it = std::find(compartment_names.begin(), compartment_names.end(), compartment);
        if (it == compartment_names.end()) {
            THROW_OUT_OF_RANGE("SimulationResult::compartmentIndex",
                               "Compartment '" + compartment + "' is not part of this result.");
        }
        return static_cast<std::size_t>(std::distance(compartment_names.begin(), it));
    }

    std::vector<double> SimulationResult::getCompartmentSeries(const std::string& compartment) const {
        const std::size_t c = compartmentIndex(compartment);
        std::vector<double> series;
        series.reserve(solution.size());
        for (const auto& state : solution) {
            series.push_back(state.at(c));
        }
        return series;
    }

} // namespace compartmental
