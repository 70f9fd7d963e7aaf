#ifndef MODEL_FACTORY_HPP
#define MODEL_FACTORY_HPP

#include "compartmental/ModelDefinition.hpp"
#include "compartmental/ModelVariant.hpp"
#include "compartmental/StateTypes.hpp"

namespace compartmental {

    /**
     * @class ModelFactory
     * @brief Builds the model definitions of the supported variants and their initial state vectors.
     *
     * | Variant | Compartments | Flows (source -> target : rate)                                     |
     * |---------|--------------|---------------------------------------------------------------------|
     * | SI      | S, I         | new_infections S->I : beta*S*I/N                                    |
     * | SIS     | S, I         | new_infections S->I : beta*S*I/N; recoveries I->S : gamma*I         |
     * | SIR     | S, I, R      | new_infections S->I : beta*S*I/N; recoveries I->R : gamma*I         |
     * | SEIR    | S, E, I, R   | new_infections S->E : beta*S*I/N; progression E->I : sigma*E;       |
     * |         |              | recoveries I->R : gamma*I                                           |
     */
    class ModelFactory {
    public:
        ModelFactory() = delete;

        /**
         * @brief Creates the definition of a built-in variant.
         */
        static ModelDefinition create(ModelVariant variant);

        static ModelDefinition createSIModel();
        static ModelDefinition createSISModel();
        static ModelDefinition createSIRModel();
        static ModelDefinition createSEIRModel();

        /**
         * @brief Builds the initial state vector for a model from partial initial counts.
         *
         * Compartments absent from `initial_counts` start at zero. Whatever part of
         * `population` is not assigned is added to the model's susceptible compartment.
         *
         * @param model Model whose compartment order is used.
         * @param population Total population N. Must be positive and finite.
         * @param initial_counts Initial counts keyed by compartment name.
         * @return state_type Initial values in compartment order, summing to `population`.
         *
         * @throws ConfigurationException If the population is not positive, a count names an
         *         unknown compartment, a count is negative or non-finite, or the counts sum to
         *         more than the population.
         */
        static state_type createInitialState(const ModelDefinition& model,
                                             double population,
                                             const CompartmentValues& initial_counts);
    };

} // namespace compartmental

#endif // MODEL_FACTORY_HPP
