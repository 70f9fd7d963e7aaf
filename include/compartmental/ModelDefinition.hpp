#ifndef MODEL_DEFINITION_HPP
#define MODEL_DEFINITION_HPP

#include "compartmental/StateTypes.hpp"
#include "compartmental/ParameterSet.hpp"
#include <string>
#include <vector>
#include <cstddef>

namespace compartmental {

    /**
     * @enum FlowKind
     * @brief How the rate of a flow between two compartments is computed.
     */
    enum class FlowKind {
        /** rate = p * source * infectious / N, with N the current total population. */
        Transmission,
        /** rate = p * source. */
        Linear
    };

    /**
     * @struct FlowRule
     * @brief One directed flow of individuals from `source` to `target`.
     *
     * Every flow removes exactly what it adds, so the derivatives of any model
     * built from FlowRules sum to zero.
     */
    struct FlowRule {
        std::string name;            ///< Flow label, e.g. "new_infections".
        std::string source;          ///< Compartment individuals leave.
        std::string target;          ///< Compartment individuals enter.
        std::string rate_parameter;  ///< Parameter scaling the flow (beta, gamma, sigma...).
        FlowKind kind = FlowKind::Linear;
        std::string infectious;      ///< Compartment driving a Transmission flow; empty for Linear flows.

        static FlowRule transmission(const std::string& name,
                                     const std::string& source,
                                     const std::string& target,
                                     const std::string& infectious,
                                     const std::string& rate_parameter);

        static FlowRule linear(const std::string& name,
                               const std::string& source,
                               const std::string& target,
                               const std::string& rate_parameter);
    };

    /**
     * @class ModelDefinition
     * @brief A closed-population compartmental model: named compartments plus the flows between them.
     *
     * The definition is validated completely at construction, so that every
     * compartment and parameter a flow refers to is known to exist before any
     * integration is attempted. Derivative evaluation is const and keeps no state
     * between calls, which lets an adaptive solver re-evaluate it freely at trial steps.
     *
     * The total population N used by Transmission flows is recomputed on every call
     * as the sum of the current compartment values. When N is not positive the
     * transmission terms are zero. Negative compartment values are used as given.
     */
    class ModelDefinition {
    public:
        /**
         * @brief Builds and validates a model definition.
         *
         * @param name Human readable model name (e.g. "SIR").
         * @param compartments Ordered, unique compartment names. The order fixes the state vector layout.
         * @param parameters Names of the parameters the flows may reference.
         * @param flows Flow rules between declared compartments.
         * @param susceptible Compartment that absorbs the unassigned remainder of the population
         *                    when building an initial state (default "S").
         *
         * @throws ConfigurationException If a compartment or parameter name is empty or repeated,
         *         a flow references an undeclared compartment or parameter, a flow's source equals its
         *         target, flow names are repeated, or `susceptible` is not a declared compartment.
         */
        ModelDefinition(std::string name,
                        std::vector<std::string> compartments,
                        std::vector<std::string> parameters,
                        std::vector<FlowRule> flows,
                        std::string susceptible = "S");

        const std::string& getName() const { return name_; }
        const std::vector<std::string>& getCompartmentNames() const { return compartments_; }
        const std::vector<std::string>& getParameterNames() const { return parameters_; }
        const std::vector<FlowRule>& getFlows() const { return flows_; }
        const std::string& getSusceptibleCompartment() const { return susceptible_; }

        /** @brief Number of compartments, i.e. the length of the state vector. */
        int getStateSize() const { return static_cast<int>(compartments_.size()); }

        bool hasCompartment(const std::string& compartment) const;

        /**
         * @brief Position of a compartment in the state vector.
         * @throws ConfigurationException If the compartment is not declared.
         */
        std::size_t getCompartmentIndex(const std::string& compartment) const;

        /**
         * @brief Position of a flow in getFlows().
         * @throws ConfigurationException If no flow has that name.
         */
        std::size_t getFlowIndex(const std::string& flow) const;

        /**
         * @brief Checks that `params` supplies every declared parameter with a non-negative value.
         * @throws ConfigurationException On a missing or negative parameter.
         */
        void validateParameters(const ParameterSet& params) const;

        /**
         * @brief Rate of every flow, in getFlows() order, for the given state.
         * @throws ConfigurationException If the state has the wrong size or a parameter is missing.
         */
        std::vector<double> computeFlowRates(const state_type& state, const ParameterSet& params) const;

        /**
         * @brief Evaluates d(state)/dt into a caller-provided vector.
         *
         * @param time Current time. The built-in flows are autonomous and ignore it.
         * @param state Current compartment values in compartment order.
         * @param params Rate parameters.
         * @param derivatives Output, resized to the state size.
         *
         * @throws ConfigurationException If the state has the wrong size or a parameter is missing.
         */
        void computeDerivatives(double time,
                                const state_type& state,
                                const ParameterSet& params,
                                state_type& derivatives) const;

        /**
         * @brief Name-keyed form of computeDerivatives().
         *
         * @throws ConfigurationException If `state` misses a compartment or names an undeclared one.
         */
        CompartmentValues derivatives(double time,
                                      const CompartmentValues& state,
                                      const ParameterSet& params) const;

        /**
         * @brief Converts a name-keyed state to compartment order.
         * @throws ConfigurationException If a compartment is missing or an unknown name is present.
         */
        state_type toStateVector(const CompartmentValues& state) const;

        /**
         * @brief Converts a state vector to a name-keyed state.
         * @throws ConfigurationException If the vector has the wrong size.
         */
        CompartmentValues toCompartmentValues(const state_type& state) const;

    private:
        struct ResolvedFlow {
            std::size_t source;
            std::size_t target;
            std::size_t infectious;
            FlowKind kind;
        };

        void checkStateSize(const std::string& function, std::size_t size) const;

        std::string name_;
        std::vector<std::string> compartments_;
        std::vector<std::string> parameters_;
        std::vector<FlowRule> flows_;
        std::string susceptible_;
        std::vector<ResolvedFlow> resolved_;
    };

} // namespace compartmental

#endif // MODEL_DEFINITION_HPP
