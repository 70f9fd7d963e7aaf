#include "compartmental/solvers/SolverStrategyFactory.hpp"
#include "compartmental/solvers/Dopri5SolverStrategy.hpp"
#include "compartmental/solvers/CashKarpSolverStrategy.hpp"
#include "compartmental/solvers/FehlbergSolverStrategy.hpp"
#include "exceptions/Exceptions.hpp"
#include <algorithm>
#include <cctype>

namespace compartmental {

    std::shared_ptr<IOdeSolverStrategy> createSolverStrategy(const std::string& name) {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lower == "dopri5") return std::make_shared<Dopri5SolverStrategy>();
        if (lower == "cash_karp") return std::make_shared<CashKarpSolverStrategy>();
        if (lower == "fehlberg78") return std::make_shared<FehlbergSolverStrategy>();

        THROW_CONFIGURATION_ERROR("createSolverStrategy",
                                  "Unknown solver '" + name + "'. Expected one of: dopri5, cash_karp, fehlberg78.");
    }

    std::vector<std::string> availableSolverStrategies() {
        return {"dopri5", "cash_karp", "fehlberg78"};
    }

} // namespace compartmental
