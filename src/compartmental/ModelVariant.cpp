#include "compartmental/ModelVariant.hpp"
#include "exceptions/Exceptions.hpp"
#include <algorithm>
#include <cctype>

namespace compartmental {

std::string toString(ModelVariant variant) {
    switch (variant) {
        case ModelVariant::SI:   return "SI";
        case ModelVariant::SIS:  return "SIS";
        case ModelVariant::SIR:  return "SIR";
        case ModelVariant::SEIR: return "SEIR";
    }
    THROW_CONFIGURATION_ERROR("toString(ModelVariant)", "Unhandled model variant value.");
}

ModelVariant parseModelVariant(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    for (ModelVariant variant : allModelVariants()) {
        if (toString(variant) == upper) {
            return variant;
        }
    }
    THROW_CONFIGURATION_ERROR("parseModelVariant",
                              "Unknown model variant '" + name + "'. Expected one of: SI, SIS, SIR, SEIR.");
}

std::vector<ModelVariant> allModelVariants() {
    return {ModelVariant::SI, ModelVariant::SIS, ModelVariant::SIR, ModelVariant::SEIR};
}

} // namespace compartmental
