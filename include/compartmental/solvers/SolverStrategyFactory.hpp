#ifndef SOLVER_STRATEGY_FACTORY_HPP
#define SOLVER_STRATEGY_FACTORY_HPP

#include "compartmental/interfaces/IOdeSolverStrategy.hpp"
#include <memory>
#include <string>
#include <vector>

namespace compartmental {

    /**
     * @brief Creates a solver strategy from its name: "dopri5", "cash_karp" or "fehlberg78" (case-insensitive).
     *
     * @throws ConfigurationException If the name is unknown.
     */
    std::shared_ptr<IOdeSolverStrategy> createSolverStrategy(const std::string& name);

    /** @brief Names accepted by createSolverStrategy(). */
    std::vector<std::string> availableSolverStrategies();

} // namespace compartmental

#endif // SOLVER_STRATEGY_FACTORY_HPP
