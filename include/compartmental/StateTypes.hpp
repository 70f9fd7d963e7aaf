#ifndef STATE_TYPES_HPP
#define STATE_TYPES_HPP

#include <map>
#include <string>
#include <vector>

namespace compartmental {

    /** @brief Compartment values in model compartment order; the representation handed to the ODE solver. */
    using state_type = std::vector<double>;

    /** @brief Compartment values keyed by compartment name. */
    using CompartmentValues = std::map<std::string, double>;

} // namespace compartmental

#endif // STATE_TYPES_HPP
