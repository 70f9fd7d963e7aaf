#include "compartmental/ModelFactory.hpp"
#include "exceptions/Exceptions.hpp"
#include <cmath>

namespace compartmental {

    ModelDefinition ModelFactory::create(ModelVariant variant) {
        switch (variant) {
            case ModelVariant::SI:   return createSIModel();
            case ModelVariant::SIS:  return createSISModel();
            case ModelVariant::SIR:  return createSIRModel();
            case ModelVariant::SEIR: return createSEIRModel();
        }
        THROW_CONFIGURATION_ERROR("ModelFactory::create", "Unhandled model variant.");
    }

    ModelDefinition ModelFactory::createSIModel() {
        return ModelDefinition("SI", {"S", "I"}, {"beta"},
                               {FlowRule::transmission("new_infections", "S", "I", "I", "beta")});
    }

    ModelDefinition ModelFactory::createSISModel() {
        return ModelDefinition("SIS", {"S", "I"}, {"beta", "gamma"},
                               {FlowRule::transmission("new_infections", "S", "I", "I", "beta"),
                                FlowRule::linear("recoveries", "I", "S", "gamma")});
    }

    ModelDefinition ModelFactory::createSIRModel() {
        return ModelDefinition("SIR", {"S", "I", "R"}, {"beta", "gamma"},
                               {FlowRule::transmission("new_infections", "S", "I", "I", "beta"),
                                FlowRule::linear("recoveries", "I", "R", "gamma")});
    }

    ModelDefinition ModelFactory::createSEIRModel() {
        return ModelDefinition("SEIR", {"S", "E", "I", "R"}, {"beta", "sigma", "gamma"},
                               {FlowRule::transmission("new_infections", "S", "E", "I", "beta"),
                                FlowRule::linear("progression", "E", "I", "sigma"),
                                FlowRule::linear("recoveries", "I", "R", "gamma")});
    }

    state_type ModelFactory::createInitialState(const ModelDefinition& model,
                                                double population,
                                                const CompartmentValues& initial_counts) {
        const std::string where = "ModelFactory::createInitialState";

        if (!std::isfinite(population) || population <= 0.0) {
            THROW_CONFIGURATION_ERROR(where, "Population must be positive. Got: " + std::to_string(population));
        }

        state_type initial_state(model.getStateSize(), 0.0);
        double assigned = 0.0;
        for (const auto& entry : initial_counts) {
            if (!model.hasCompartment(entry.first)) {
                THROW_CONFIGURATION_ERROR(where, "Initial count given for unknown compartment '" + entry.first +
                                                 "' of model '" + model.getName() + "'.");
            }
            if (!std::isfinite(entry.second) || entry.second < 0.0) {
                THROW_CONFIGURATION_ERROR(where, "Initial count for compartment '" + entry.first +
                                                 "' must be non-negative. Got: " + std::to_string(entry.second));
            }
            initial_state[model.getCompartmentIndex(entry.first)] = entry.second;
            assigned += entry.second;
        }

        if (assigned > population) {
            THROW_CONFIGURATION_ERROR(where, "Initial counts sum to " + std::to_string(assigned) +
                                             ", which exceeds the population of " + std::to_string(population) + ".");
        }

        initial_state[model.getCompartmentIndex(model.getSusceptibleCompartment())] += population - assigned;
        return initial_state;
    }

} // namespace compartmental
