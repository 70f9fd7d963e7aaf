#ifndef MODEL_VARIANT_HPP
#define MODEL_VARIANT_HPP

#include <string>
#include <vector>

namespace compartmental {

/**
 * @enum ModelVariant
 * @brief The supported compartment structures.
 */
enum class ModelVariant {
    SI,   ///< Susceptible -> Infectious, no recovery.
    SIS,  ///< Infectious individuals return to Susceptible.
    SIR,  ///< Infectious individuals recover with permanent immunity.
    SEIR  ///< SIR with a latent (Exposed) stage.
};

/**
 * @brief Canonical upper-case name of a variant ("SI", "SIS", "SIR", "SEIR").
 */
std::string toString(ModelVariant variant);

/**
 * @brief Parses a variant name, case-insensitively.
 *
 * @throws ConfigurationException If the name does not denote a known variant.
 */
ModelVariant parseModelVariant(const std::string& name);

/**
 * @brief All variants, in declaration order.
 */
std::vector<ModelVariant> allModelVariants();

} // namespace compartmental

#endif // MODEL_VARIANT_HPP
