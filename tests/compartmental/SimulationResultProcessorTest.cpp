#include "gtest/gtest.h"
#include "compartmental/SimulationResultProcessor.hpp"
#include "compartmental/ModelFactory.hpp"
#include "exceptions/Exceptions.hpp"
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using namespace compartmental;

class SimulationResultProcessorTest : public ::testing::Test {
protected:
    std::string test_dir = "temp_result_processor_test";
    SimulationResult result;

    void SetUp() override {
        fs::remove_all(test_dir);
        result.compartment_names = {"S", "I", "R"};
        result.time_points = {0.0, 0.5, 1.0};
        result.solution = {{990.0, 10.0, 0.0}, {988.5, 10.5, 1.0}, {987.0, 11.0, 2.0}};
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    std::vector<std::string> readLines(const std::string& path) {
        std::ifstream file(path);
        std::vector<std::string> lines;
        std::string line;
        while (std::getline(file, line)) {
            lines.push_back(line);
        }
        return lines;
    }
};

TEST_F(SimulationResultProcessorTest, CompartmentData) {
    Eigen::VectorXd infected = SimulationResultProcessor::getCompartmentData(result, "I");
    ASSERT_EQ(infected.size(), 3);
    EXPECT_EQ(infected(2), 11.0);
    EXPECT_THROW(SimulationResultProcessor::getCompartmentData(result, "E"), OutOfRangeException);
}

TEST_F(SimulationResultProcessorTest, MatrixLayout) {
    Eigen::MatrixXd table = SimulationResultProcessor::toMatrix(result);
    ASSERT_EQ(table.rows(), 3);
    ASSERT_EQ(table.cols(), 4);
    EXPECT_EQ(table(1, 0), 0.5);
    EXPECT_EQ(table(1, 1), 988.5);
    EXPECT_EQ(table(2, 3), 2.0);
}

TEST_F(SimulationResultProcessorTest, LongFormatOrder) {
    std::vector<LongFormatRow> rows = SimulationResultProcessor::toLongFormat(result);
    ASSERT_EQ(rows.size(), 9u);
    EXPECT_EQ(rows[0].compartment, "S");
    EXPECT_EQ(rows[4].time, 0.5);
    EXPECT_EQ(rows[4].compartment, "I");
    EXPECT_EQ(rows[4].value, 10.5);
    EXPECT_EQ(rows[8].compartment, "R");
}

TEST_F(SimulationResultProcessorTest, FlowData) {
    ModelDefinition sir = ModelFactory::createSIRModel();
    ParameterSet params{{"beta", 0.3}, {"gamma", 0.1}};
    Eigen::VectorXd incidence = SimulationResultProcessor::getFlowData(result, sir, params, "new_infections");
    ASSERT_EQ(incidence.size(), 3);
    EXPECT_NEAR(incidence(0), 0.3 * 990.0 * 10.0 / 1000.0, 1e-12);

    Eigen::VectorXd recoveries = SimulationResultProcessor::getFlowData(result, sir, params, "recoveries");
    EXPECT_NEAR(recoveries(2), 1.1, 1e-12);

    EXPECT_THROW(SimulationResultProcessor::getFlowData(result, sir, params, "progression"), ConfigurationException);
    EXPECT_THROW(SimulationResultProcessor::getFlowData(result, ModelFactory::createSEIRModel(), params, "new_infections"),
                 InvalidResultException);
}

TEST_F(SimulationResultProcessorTest, SaveWideCSV) {
    const std::string path = test_dir + "/nested/wide.csv";
    SimulationResultProcessor::saveResultsToCSV(result, path);
    std::vector<std::string> lines = readLines(path);
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0], "time,S,I,R");
    EXPECT_EQ(lines[1], "0,990,10,0");
    EXPECT_EQ(lines[2], "0.5,988.5,10.5,1");
}

TEST_F(SimulationResultProcessorTest, SaveLongCSV) {
    const std::string path = test_dir + "/long.csv";
    SimulationResultProcessor::saveLongFormatToCSV(result, path);
    std::vector<std::string> lines = readLines(path);
    ASSERT_EQ(lines.size(), 10u);
    EXPECT_EQ(lines[0], "time,compartment,value");
    EXPECT_EQ(lines[1], "0,S,990");
    EXPECT_EQ(lines[9], "1,R,2");
}

TEST_F(SimulationResultProcessorTest, InvalidInputs) {
    SimulationResult empty;
    EXPECT_THROW(SimulationResultProcessor::toMatrix(empty), InvalidResultException);
    EXPECT_THROW(SimulationResultProcessor::saveResultsToCSV(empty, test_dir + "/x.csv"), InvalidResultException);

    fs::create_directories(test_dir);
    EXPECT_THROW(SimulationResultProcessor::saveResultsToCSV(result, test_dir), FileIOException);
}
