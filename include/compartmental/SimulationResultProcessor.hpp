#ifndef SIMULATION_RESULT_PROCESSOR_HPP
#define SIMULATION_RESULT_PROCESSOR_HPP

#include "compartmental/SimulationResult.hpp"
#include "compartmental/ModelDefinition.hpp"
#include "compartmental/ParameterSet.hpp"
#include <string>
#include <vector>
#include <Eigen/Dense>

namespace compartmental {

    /**
     * @brief One row of a long-format (tidy) result table.
     */
    struct LongFormatRow {
        double time;
        std::string compartment;
        double value;
    };

    /**
     * @class SimulationResultProcessor
     * @brief Converts SimulationResult data into tables for export and plotting collaborators.
     *
     * Static utility class; it never modifies the result it reads.
     */
    class SimulationResultProcessor {
    public:
        /** @brief Deleted default constructor to enforce static utility class behavior. */
        SimulationResultProcessor() = delete;

        /**
         * @brief Time series of one compartment.
         *
         * @throws InvalidResultException If the result is invalid or empty.
         * @throws OutOfRangeException If the compartment is not part of the result.
         */
        static Eigen::VectorXd getCompartmentData(const SimulationResult& result,
                                                  const std::string& compartment);

        /**
         * @brief Wide table: one row per time point, column 0 is time, then one column per compartment.
         *
         * @throws InvalidResultException If the result is invalid or empty.
         */
        static Eigen::MatrixXd toMatrix(const SimulationResult& result);

        /**
         * @brief Long table: one row per (time, compartment), time-major, compartments in result order.
         *
         * @throws InvalidResultException If the result is invalid or empty.
         */
        static std::vector<LongFormatRow> toLongFormat(const SimulationResult& result);

        /**
         * @brief Rate of a named flow (e.g. "new_infections" for incidence) at every time point.
         *
         * @param result Result produced with `model` and `params`.
         * @param model Model whose flows are evaluated.
         * @param params Parameters the result was produced with.
         * @param flow_name Name of a flow of `model`.
         *
         * @throws InvalidResultException If the result is invalid or its compartments do not match the model.
         * @throws ConfigurationException If the flow is unknown or a parameter is missing.
         */
        static Eigen::VectorXd getFlowData(const SimulationResult& result,
                                           const ModelDefinition& model,
                                           const ParameterSet& params,
                                           const std::string& flow_name);

        /**
         * @brief Writes the wide table as CSV with header `time,<compartments...>`.
         *
         * Missing parent directories are created.
         *
         * @throws InvalidResultException If the result is invalid or empty.
         * @throws FileIOException If the file cannot be created or written.
         */
        static void saveResultsToCSV(const SimulationResult& result, const std::string& filename);

        /**
         * @brief Writes the long table as CSV with header `time,compartment,value`.
         *
         * @throws InvalidResultException If the result is invalid or empty.
         * @throws FileIOException If the file cannot be created or written.
         */
        static void saveLongFormatToCSV(const SimulationResult& result, const std::string& filename);
    };

} // namespace compartmental

#endif // SIMULATION_RESULT_PROCESSOR_HPP
