#include "compartmental/SimulationResultProcessor.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>

namespace fs = std::filesystem;

namespace compartmental {

    namespace {

        void requireValid(const SimulationResult& result, const std::string& function) {
            if (!result.isValid()) {
                throw InvalidResultException(function, "Simulation result object is invalid or empty.");
            }
        }

        std::ofstream openForWriting(const std::string& filename, const std::string& function) {
            const fs::path path(filename);
            if (path.has_parent_path()) {
                std::error_code ec;
                fs::create_directories(path.parent_path(), ec);
                if (ec) {
                    throw FileIOException(function, "Could not create directory " + path.parent_path().string() +
                                                    ": " + ec.message());
                }
            }
            std::ofstream file(filename);
            if (!file.is_open()) {
                throw FileIOException(function, "Could not open file for writing: " + filename);
            }
            file << std::setprecision(std::numeric_limits<double>::max_digits10);
            return file;
        }

        void finishWriting(std::ofstream& file, const std::string& filename, const std::string& function) {
            file.close();
            if (file.fail()) {
                throw FileIOException(function, "Error while writing file: " + filename);
            }
            Logger::getInstance().info(function, "Results saved to: " + filename);
        }

    } // namespace

    Eigen::VectorXd SimulationResultProcessor::getCompartmentData(const SimulationResult& result,
                                                                  const std::string& compartment) {
        requireValid(result, "SimulationResultProcessor::getCompartmentData");
        const std::size_t c = result.compartmentIndex(compartment);

        Eigen::VectorXd series(static_cast<Eigen::Index>(result.size()));
        for (std::size_t t = 0; t < result.size(); ++t) {
            series(static_cast<Eigen::Index>(t)) = result.solution[t][c];
        }
        return series;
    }

    Eigen::MatrixXd SimulationResultProcessor::toMatrix(const SimulationResult& result) {
        requireValid(result, "SimulationResultProcessor::toMatrix");

        const auto rows = static_cast<Eigen::Index>(result.size());
        const auto cols = static_cast<Eigen::Index>(result.compartment_names.size());
        Eigen::MatrixXd table(rows, cols + 1);
        for (Eigen::Index t = 0; t < rows; ++t) {
            table(t, 0) = result.time_points[t];
            table.row(t).tail(cols) = Eigen::Map<const Eigen::RowVectorXd>(result.solution[t].data(), cols);
        }
        return table;
    }

    std::vector<LongFormatRow> SimulationResultProcessor::toLongFormat(const SimulationResult& result) {
        requireValid(result, "SimulationResultProcessor::toLongFormat");

        std::vector<LongFormatRow> rows;
        rows.reserve(result.size() * result.compartment_names.size());
        for (std::size_t t = 0; t < result.size(); ++t) {
            for (std::size_t c = 0; c < result.compartment_names.size(); ++c) {
                rows.push_back({result.time_points[t], result.compartment_names[c], result.solution[t][c]});
            }
        }
        return rows;
    }

    Eigen::VectorXd SimulationResultProcessor::getFlowData(const SimulationResult& result,
                                                           const ModelDefinition& model,
                                                           const ParameterSet& params,
                                                           const std::string& flow_name) {
        requireValid(result, "SimulationResultProcessor::getFlowData");
        if (result.compartment_names != model.getCompartmentNames()) {
            throw InvalidResultException("SimulationResultProcessor::getFlowData",
                                         "Result compartments do not match model '" + model.getName() + "'.");
        }
        const std::size_t flow = model.getFlowIndex(flow_name);

        Eigen::VectorXd rates(static_cast<Eigen::Index>(result.size()));
        for (std::size_t t = 0; t < result.size(); ++t) {
            rates(static_cast<Eigen::Index>(t)) = model.computeFlowRates(result.solution[t], params)[flow];
        }
        return rates;
    }

    void SimulationResultProcessor::saveResultsToCSV(const SimulationResult& result, const std::string& filename) {
        const std::string function = "SimulationResultProcessor::saveResultsToCSV";
        requireValid(result, function);

        std::ofstream file = openForWriting(filename, function);
        file << "time";
        for (const auto& name : result.compartment_names) {
            file << "," << name;
        }
        file << "\n";

        for (std::size_t i = 0; i < result.size(); ++i) {
            file << result.time_points[i];
            for (double value : result.solution[i]) {
                file << "," << value;
            }
            file << "\n";
        }
        finishWriting(file, filename, function);
    }

    void SimulationResultProcessor::saveLongFormatToCSV(const SimulationResult& result, const std::string& filename) {
        const std::string function = "SimulationResultProcessor::saveLongFormatToCSV";
        requireValid(result, function);

        std::ofstream file = openForWriting(filename, function);
        file << "time,compartment,value\n";
        for (const auto& row : toLongFormat(result)) {
            file << row.time << "," << row.compartment << "," << row.value << "\n";
        }
        finishWriting(file, filename, function);
    }

} // namespace compartmental
