#include "compartmental/ParameterSet.hpp"
#include "exceptions/Exceptions.hpp"
#include <cmath>

namespace compartmental {

    ParameterSet::ParameterSet(std::initializer_list<std::pair<const std::string, double>> values) {
        for (const auto& entry : values) {
            validateEntry(entry.first, entry.second);
            if (!values_.emplace(entry.first, entry.second).second) {
                THROW_CONFIGURATION_ERROR("ParameterSet::ParameterSet",
                                          "Parameter '" + entry.first + "' is given more than once.");
            }
        }
    }

    ParameterSet::ParameterSet(std::map<std::string, double> values)
        : values_(std::move(values))
    {
        for (const auto& entry : values_) {
            validateEntry(entry.first, entry.second);
        }
    }

    ParameterSet ParameterSet::with(const std::string& name, double value) const {
        validateEntry(name, value);
        ParameterSet copy(*this);
        copy.values_[name] = value;
        return copy;
    }

    bool ParameterSet::contains(const std::string& name) const {
        return values_.find(name) != values_.end();
    }

    double ParameterSet::get(const std::string& name) const {
        auto it = values_.find(name);
        if (it == values_.end()) {
            THROW_CONFIGURATION_ERROR("ParameterSet::get", "Missing parameter '" + name + "'.");
        }
        return it->second;
    }

    std::vector<std::string> ParameterSet::getNames() const {
        std::vector<std::string> names;
        names.reserve(values_.size());
        for (const auto& entry : values_) {
            names.push_back(entry.first);
        }
        return names;
    }

    void ParameterSet::validateEntry(const std::string& name, double value) {
        if (name.empty()) {
            THROW_CONFIGURATION_ERROR("ParameterSet", "Parameter names cannot be empty.");
        }
        if (!std::isfinite(value)) {
            THROW_CONFIGURATION_ERROR("ParameterSet",
                                      "Parameter '" + name + "' must be finite. Got: " + std::to_string(value));
        }
    }

} // namespace compartmental
