#include "compartmental/ModelDefinition.hpp"
#include "exceptions/Exceptions.hpp"
#include <algorithm>
#include <numeric>
#include <set>
#include <utility>

namespace compartmental {

    FlowRule FlowRule::transmission(const std::string& name,
                                    const std::string& source,
                                    const std::string& target,
                                    const std::string& infectious,
                                    const std::string& rate_parameter) {
        FlowRule rule;
        rule.name = name;
        rule.source = source;
        rule.target = target;
        rule.rate_parameter = rate_parameter;
        rule.kind = FlowKind::Transmission;
        rule.infectious = infectious;
        return rule;
    }

    FlowRule FlowRule::linear(const std::string& name,
                              const std::string& source,
                              const std::string& target,
                              const std::string& rate_parameter) {
        FlowRule rule;
        rule.name = name;
        rule.source = source;
        rule.target = target;
        rule.rate_parameter = rate_parameter;
        rule.kind = FlowKind::Linear;
        return rule;
    }

    ModelDefinition::ModelDefinition(std::string name,
                                     std::vector<std::string> compartments,
                                     std::vector<std::string> parameters,
                                     std::vector<FlowRule> flows,
                                     std::string susceptible)
        : name_(std::move(name)),
          compartments_(std::move(compartments)),
          parameters_(std::move(parameters)),
          flows_(std::move(flows)),
          susceptible_(std::move(susceptible))
    {
        const std::string where = "ModelDefinition::ModelDefinition";

        if (compartments_.empty()) {
            THROW_CONFIGURATION_ERROR(where, "Model '" + name_ + "' must declare at least one compartment.");
        }
        std::set<std::string> seen;
        for (const auto& compartment : compartments_) {
            if (compartment.empty()) {
                THROW_CONFIGURATION_ERROR(where, "Compartment names cannot be empty.");
            }
            if (!seen.insert(compartment).second) {
                THROW_CONFIGURATION_ERROR(where, "Duplicate compartment name '" + compartment + "' in model '" + name_ + "'.");
            }
        }

        std::set<std::string> declared_parameters;
        for (const auto& parameter : parameters_) {
            if (parameter.empty()) {
                THROW_CONFIGURATION_ERROR(where, "Parameter names cannot be empty.");
            }
            if (!declared_parameters.insert(parameter).second) {
                THROW_CONFIGURATION_ERROR(where, "Duplicate parameter name '" + parameter + "' in model '" + name_ + "'.");
            }
        }

        if (!hasCompartment(susceptible_)) {
            THROW_CONFIGURATION_ERROR(where, "Susceptible compartment '" + susceptible_ + "' is not declared in model '" + name_ + "'.");
        }

        std::set<std::string> flow_names;
        resolved_.reserve(flows_.size());
        for (const auto& flow : flows_) {
            if (!flow_names.insert(flow.name).second) {
                THROW_CONFIGURATION_ERROR(where, "Duplicate flow name '" + flow.name + "'.");
            }
            if (!hasCompartment(flow.source)) {
                THROW_CONFIGURATION_ERROR(where, "Flow '" + flow.name + "' references undeclared source compartment '" + flow.source + "'.");
            }
            if (!hasCompartment(flow.target)) {
                THROW_CONFIGURATION_ERROR(where, "Flow '" + flow.name + "' references undeclared target compartment '" + flow.target + "'.");
            }
            if (flow.source == flow.target) {
                THROW_CONFIGURATION_ERROR(where, "Flow '" + flow.name + "' has identical source and target '" + flow.source + "'.");
            }
            if (declared_parameters.count(flow.rate_parameter) == 0) {
                THROW_CONFIGURATION_ERROR(where, "Flow '" + flow.name + "' references undeclared parameter '" + flow.rate_parameter + "'.");
            }

            ResolvedFlow resolved{getCompartmentIndex(flow.source), getCompartmentIndex(flow.target), 0, flow.kind};
            if (flow.kind == FlowKind::Transmission) {
                if (!hasCompartment(flow.infectious)) {
                    THROW_CONFIGURATION_ERROR(where, "Transmission flow '" + flow.name + "' references undeclared infectious compartment '" + flow.infectious + "'.");
                }
                resolved.infectious = getCompartmentIndex(flow.infectious);
            }
            resolved_.push_back(resolved);
        }
    }

    bool ModelDefinition::hasCompartment(const std::string& compartment) const {
        return std::find(compartments_.begin(), compartments_.end(), compartment) != compartments_.end();
    }

    std::size_t ModelDefinition::getCompartmentIndex(const std::string& compartment) const {
        auto it = std::find(compartments_.begin(), compartments_.end(), compartment);
        if (it == compartments_.end()) {
            THROW_CONFIGURATION_ERROR("ModelDefinition::getCompartmentIndex",
                                      "Compartment '" + compartment + "' is not declared in model '" + name_ + "'.");
        }
        return static_cast<std::size_t>(std::distance(compartments_.begin(), it));
    }

    std::size_t ModelDefinition::getFlowIndex(const std::string& flow) const {
        for (std::size_t i = 0; i < flows_.size(); ++i) {
            if (flows_[i].name == flow) {
                return i;
            }
        }
        THROW_CONFIGURATION_ERROR("ModelDefinition::getFlowIndex",
                                  "Flow '" + flow + "' is not defined in model '" + name_ + "'.");
    }

    void ModelDefinition::validateParameters(const ParameterSet& params) const {
        for (const auto& parameter : parameters_) {
            if (!params.contains(parameter)) {
                THROW_CONFIGURATION_ERROR("ModelDefinition::validateParameters",
                                          "Model '" + name_ + "' requires parameter '" + parameter + "', which was not supplied.");
            }
            double value = params.get(parameter);
            if (value < 0.0) {
                THROW_CONFIGURATION_ERROR("ModelDefinition::validateParameters",
                                          "Parameter '" + parameter + "' cannot be negative. Got: " + std::to_string(value));
            }
        }
    }

    void ModelDefinition::checkStateSize(const std::string& function, std::size_t size) const {
        if (size != compartments_.size()) {
            THROW_CONFIGURATION_ERROR(function, "State size mismatch. Expected " + std::to_string(compartments_.size()) +
                                                ", got " + std::to_string(size) + ".");
        }
    }

    std::vector<double> ModelDefinition::computeFlowRates(const state_type& state, const ParameterSet& params) const {
        checkStateSize("ModelDefinition::computeFlowRates", state.size());

        const double N = std::accumulate(state.begin(), state.end(), 0.0);

        std::vector<double> rates(flows_.size(), 0.0);
        for (std::size_t f = 0; f < flows_.size(); ++f) {
            const ResolvedFlow& flow = resolved_[f];
            const double p = params.get(flows_[f].rate_parameter);
            if (flow.kind == FlowKind::Transmission) {
                rates[f] = (N > 0.0) ? p * state[flow.source] * state[flow.infectious] / N : 0.0;
            } else {
                rates[f] = p * state[flow.source];
            }
        }
        return rates;
    }

    void ModelDefinition::computeDerivatives([[maybe_unused]] double time,
                                             const state_type& state,
                                             const ParameterSet& params,
                                             state_type& derivatives) const {
        const std::vector<double> rates = computeFlowRates(state, params);

        derivatives.assign(state.size(), 0.0);
        for (std::size_t f = 0; f < resolved_.size(); ++f) {
            derivatives[resolved_[f].source] -= rates[f];
            derivatives[resolved_[f].target] += rates[f];
        }
    }

    CompartmentValues ModelDefinition::derivatives(double time,
                                                   const CompartmentValues& state,
                                                   const ParameterSet& params) const {
        state_type dxdt;
        computeDerivatives(time, toStateVector(state), params, dxdt);
        return toCompartmentValues(dxdt);
    }

    state_type ModelDefinition::toStateVector(const CompartmentValues& state) const {
        for (const auto& entry : state) {
            if (!hasCompartment(entry.first)) {
                THROW_CONFIGURATION_ERROR("ModelDefinition::toStateVector",
                                          "Unknown compartment '" + entry.first + "' for model '" + name_ + "'.");
            }
        }
        state_type vec;
        vec.reserve(compartments_.size());
        for (const auto& compartment : compartments_) {
            auto it = state.find(compartment);
            if (it == state.end()) {
                THROW_CONFIGURATION_ERROR("ModelDefinition::toStateVector",
                                          "Missing value for compartment '" + compartment + "'.");
            }
            vec.push_back(it->second);
        }
        return vec;
    }

    CompartmentValues ModelDefinition::toCompartmentValues(const state_type& state) const {
        checkStateSize("ModelDefinition::toCompartmentValues", state.size());
        CompartmentValues values;
        for (std::size_t i = 0; i < compartments_.size(); ++i) {
            values[compartments_[i]] = state[i];
        }
        return values;
    }

} // namespace compartmental
