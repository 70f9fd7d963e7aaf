#ifndef PARAMETER_SET_HPP
#define PARAMETER_SET_HPP

#include <map>
#include <string>
#include <vector>
#include <initializer_list>
#include <utility>

namespace compartmental {

    /**
     * @class ParameterSet
     * @brief Immutable mapping from parameter name (e.g. "beta", "gamma", "sigma") to value.
     *
     * A ParameterSet never changes once built; `with()` returns a modified copy.
     * Values must be finite. Range checks (non-negative rates) belong to the
     * ModelDefinition the set is bound to, since only the model knows which
     * names it reads.
     */
    class ParameterSet {
    public:
        ParameterSet() = default;

        /**
         * @brief Builds a set from name/value pairs.
         * @throws ConfigurationException If a name is empty, repeated, or a value is not finite.
         */
        ParameterSet(std::initializer_list<std::pair<const std::string, double>> values);

        /**
         * @brief Builds a set from an existing map.
         * @throws ConfigurationException If a name is empty or a value is not finite.
         */
        explicit ParameterSet(std::map<std::string, double> values);

        /**
         * @brief Returns a copy with `name` set to `value` (added or replaced).
         * @throws ConfigurationException If the name is empty or the value is not finite.
         */
        ParameterSet with(const std::string& name, double value) const;

        bool contains(const std::string& name) const;

        /**
         * @brief Value of a named parameter.
         * @throws ConfigurationException If the parameter is missing.
         */
        double get(const std::string& name) const;

        std::vector<std::string> getNames() const;
        const std::map<std::string, double>& getValues() const { return values_; }
        std::size_t size() const { return values_.size(); }
        bool empty() const { return values_.empty(); }

    private:
        static void validateEntry(const std::string& name, double value);

        std::map<std::string, double> values_;
    };

} // namespace compartmental

#endif // PARAMETER_SET_HPP
