#include "gtest/gtest.h"
#include "utils/ReadSimulationConfiguration.hpp"
#include "exceptions/Exceptions.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using namespace compartmental;

class ReadSimulationConfigurationTest : public ::testing::Test {
protected:
    std::string test_dir = "temp_simulation_config_test";

    void SetUp() override {
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    std::string writeFile(const std::string& name, const std::string& content) {
        std::string path = test_dir + "/" + name;
        std::ofstream file(path);
        file << content;
        return path;
    }

    SimulationConfiguration parse(const std::string& content) {
        std::istringstream input(content);
        return parseSimulationConfiguration(input, "inline");
    }
};

TEST_F(ReadSimulationConfigurationTest, ReadsCompleteFile) {
    std::string path = writeFile("sir.txt",
        "# measles\n"
        "model sir\n"
        "population 100000\n"
        "horizon 100   # days\n"
        "step 0.5\n"
        "beta 1.875\n"
        "gamma 0.125\n"
        "initial_I 10\n"
        "initial_R 0\n"
        "solver cash_karp\n"
        "abs_error 1e-8\n"
        "rel_error 1e-7\n"
        "max_steps 5000\n"
        "invariant_tolerance 1e-3\n"
        "output out/sir.csv\n"
        "output_format long\n"
        "log_level warning\n"
        "log_file sim.log\n");

    SimulationConfiguration config = readSimulationConfiguration(path);
    EXPECT_EQ(config.variant, ModelVariant::SIR);
    EXPECT_EQ(config.population, 100000.0);
    EXPECT_EQ(config.horizon, 100.0);
    EXPECT_EQ(config.step, 0.5);
    EXPECT_DOUBLE_EQ(config.getParameterSet().get("beta"), 1.875);
    EXPECT_DOUBLE_EQ(config.getParameterSet().get("gamma"), 0.125);
    EXPECT_EQ(config.initial_counts.at("I"), 10.0);
    EXPECT_EQ(config.initial_counts.at("R"), 0.0);
    EXPECT_EQ(config.solver, "cash_karp");
    EXPECT_EQ(config.abs_error, 1e-8);
    EXPECT_EQ(config.rel_error, 1e-7);
    EXPECT_EQ(config.max_steps, 5000);
    EXPECT_EQ(config.invariant_tolerance, 1e-3);
    EXPECT_EQ(config.output_path, "out/sir.csv");
    EXPECT_EQ(config.output_format, "long");
    EXPECT_EQ(config.log_level, LogLevel::WARNING);
    EXPECT_EQ(config.log_file, "sim.log");
}

TEST_F(ReadSimulationConfigurationTest, DefaultsForOptionalKeys) {
    SimulationConfiguration config = parse("model SI\npopulation 1000\nhorizon 50\nbeta 0.5\n");
    EXPECT_EQ(config.step, 1.0);
    EXPECT_EQ(config.solver, "dopri5");
    EXPECT_EQ(config.abs_error, 1e-6);
    EXPECT_EQ(config.max_steps, 100000);
    EXPECT_EQ(config.invariant_tolerance, 1e-4);
    EXPECT_TRUE(config.output_path.empty());
    EXPECT_EQ(config.output_format, "wide");
    EXPECT_TRUE(config.initial_counts.empty());
}

TEST_F(ReadSimulationConfigurationTest, DerivesBetaFromR0) {
    SimulationConfiguration config = parse("model SEIR\npopulation 100000\nhorizon 200\nR0 2.5\nsigma 0.2\ngamma 0.2\n");
    EXPECT_DOUBLE_EQ(config.parameters.at("beta"), 0.5);

    SimulationConfiguration explicit_beta = parse("model SIR\npopulation 10\nhorizon 5\nR0 3\nbeta 0.7\ngamma 0.1\n");
    EXPECT_DOUBLE_EQ(explicit_beta.parameters.at("beta"), 0.7);

    EXPECT_THROW(parse("model SIR\npopulation 10\nhorizon 5\nR0 3\n"), ConfigurationException);
}

TEST_F(ReadSimulationConfigurationTest, UnknownKeysAreIgnored) {
    SimulationConfiguration config = parse("model SIR\npopulation 10\nhorizon 5\ncolour blue\n");
    EXPECT_EQ(config.variant, ModelVariant::SIR);
}

TEST_F(ReadSimulationConfigurationTest, MissingRequiredKeys) {
    EXPECT_THROW(parse("population 10\nhorizon 5\n"), ConfigurationException);
    EXPECT_THROW(parse("model SIR\nhorizon 5\n"), ConfigurationException);
    EXPECT_THROW(parse("model SIR\npopulation 10\n"), ConfigurationException);
}

TEST_F(ReadSimulationConfigurationTest, MalformedLines) {
    EXPECT_THROW(parse("model SIR\npopulation ten\nhorizon 5\n"), DataFormatException);
    EXPECT_THROW(parse("model SIR\npopulation 10abc\nhorizon 5\n"), DataFormatException);
    EXPECT_THROW(parse("model SIR\npopulation\nhorizon 5\n"), DataFormatException);
    EXPECT_THROW(parse("model SIR\npopulation 10 20\nhorizon 5\n"), DataFormatException);
    EXPECT_THROW(parse("model SIR\npopulation 10\nhorizon 5\nmax_steps 2.5\n"), DataFormatException);
    EXPECT_THROW(parse("model SIR\npopulation 10\nhorizon 5\noutput_format xml\n"), DataFormatException);
    EXPECT_THROW(parse("model SIR\npopulation 1000.5\nhorizon 5\n"), DataFormatException);
    EXPECT_NO_THROW(parse("model SIR\npopulation 1e5\nhorizon 5\n"));
}

TEST_F(ReadSimulationConfigurationTest, InvalidValues) {
    EXPECT_THROW(parse("model SIRD\npopulation 10\nhorizon 5\n"), ConfigurationException);
    EXPECT_THROW(parse("model SIR\npopulation -10\nhorizon 5\n"), ConfigurationException);
    EXPECT_THROW(parse("model SIR\npopulation 10\nhorizon 5\nstep 10\n"), ConfigurationException);
    EXPECT_THROW(parse("model SIR\npopulation 10\nhorizon 5\nsolver euler\n"), ConfigurationException);
    EXPECT_THROW(parse("model SIR\npopulation 10\nhorizon 5\nlog_level loud\n"), ConfigurationException);
    EXPECT_THROW(parse("model SIR\npopulation 10\nhorizon 5\nmax_steps 0\n"), ConfigurationException);
}

TEST_F(ReadSimulationConfigurationTest, MissingFile) {
    EXPECT_THROW(readSimulationConfiguration(test_dir + "/does_not_exist.txt"), FileIOException);
}

TEST(PresetConfigurationTest, ReferenceScenarios) {
    SimulationConfiguration si = presetConfiguration(ModelVariant::SI);
    EXPECT_EQ(si.population, 1000.0);
    EXPECT_EQ(si.horizon, 50.0);
    EXPECT_EQ(si.parameters.at("beta"), 0.5);

    SimulationConfiguration sir = presetConfiguration(ModelVariant::SIR);
    EXPECT_EQ(sir.population, 100000.0);
    EXPECT_EQ(sir.initial_counts.at("I"), 10.0);
    EXPECT_DOUBLE_EQ(sir.parameters.at("beta"), 1.875);

    SimulationConfiguration seir = presetConfiguration(ModelVariant::SEIR);
    EXPECT_EQ(seir.initial_counts.at("E"), 10.0);
    EXPECT_DOUBLE_EQ(seir.parameters.at("beta"), 2.5 / 7.0);
    EXPECT_DOUBLE_EQ(seir.parameters.at("sigma"), 0.2);

    for (ModelVariant variant : allModelVariants()) {
        EXPECT_NO_THROW(validateConfiguration(presetConfiguration(variant))) << toString(variant);
    }

    SimulationConfiguration fractional = presetConfiguration(ModelVariant::SI);
    fractional.population = 1000.5;
    EXPECT_THROW(validateConfiguration(fractional), ConfigurationException);
}
