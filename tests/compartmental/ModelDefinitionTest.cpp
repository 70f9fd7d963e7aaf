#include "gtest/gtest.h"
#include "compartmental/ModelDefinition.hpp"
#include "compartmental/ModelFactory.hpp"
#include "exceptions/Exceptions.hpp"
#include <cmath>
#include <numeric>
#include <vector>

using namespace compartmental;

class ModelDefinitionTest : public ::testing::Test {
protected:
    ModelDefinition si = ModelFactory::createSIModel();
    ModelDefinition sis = ModelFactory::createSISModel();
    ModelDefinition sir = ModelFactory::createSIRModel();
    ModelDefinition seir = ModelFactory::createSEIRModel();

    ParameterSet params{{"beta", 0.3}, {"gamma", 0.1}, {"sigma", 0.2}};

    state_type derivativesOf(const ModelDefinition& model, const state_type& state) {
        state_type dxdt;
        model.computeDerivatives(0.0, state, params, dxdt);
        return dxdt;
    }
};

TEST_F(ModelDefinitionTest, BuiltInStructure) {
    EXPECT_EQ(si.getCompartmentNames(), (std::vector<std::string>{"S", "I"}));
    EXPECT_EQ(sis.getCompartmentNames(), (std::vector<std::string>{"S", "I"}));
    EXPECT_EQ(sir.getCompartmentNames(), (std::vector<std::string>{"S", "I", "R"}));
    EXPECT_EQ(seir.getCompartmentNames(), (std::vector<std::string>{"S", "E", "I", "R"}));

    EXPECT_EQ(si.getParameterNames(), (std::vector<std::string>{"beta"}));
    EXPECT_EQ(seir.getParameterNames(), (std::vector<std::string>{"beta", "sigma", "gamma"}));
    EXPECT_EQ(seir.getStateSize(), 4);
    EXPECT_EQ(seir.getFlows().size(), 3u);
    EXPECT_EQ(seir.getFlows()[0].target, "E");
    EXPECT_EQ(sir.getSusceptibleCompartment(), "S");
    EXPECT_EQ(ModelFactory::create(ModelVariant::SIS).getName(), "SIS");
}

TEST_F(ModelDefinitionTest, SIDerivatives) {
    state_type dxdt = derivativesOf(si, {990.0, 10.0});
    EXPECT_NEAR(dxdt[0], -2.97, 1e-12);
    EXPECT_NEAR(dxdt[1], 2.97, 1e-12);
}

TEST_F(ModelDefinitionTest, SISDerivatives) {
    state_type dxdt = derivativesOf(sis, {990.0, 10.0});
    EXPECT_NEAR(dxdt[0], -1.97, 1e-12);
    EXPECT_NEAR(dxdt[1], 1.97, 1e-12);
}

TEST_F(ModelDefinitionTest, SIRDerivatives) {
    state_type dxdt = derivativesOf(sir, {990.0, 10.0, 0.0});
    EXPECT_NEAR(dxdt[0], -2.97, 1e-12);
    EXPECT_NEAR(dxdt[1], 1.97, 1e-12);
    EXPECT_NEAR(dxdt[2], 1.0, 1e-12);
}

TEST_F(ModelDefinitionTest, SEIRDerivatives) {
    state_type dxdt = derivativesOf(seir, {990.0, 5.0, 5.0, 0.0});
    EXPECT_NEAR(dxdt[0], -1.485, 1e-12);
    EXPECT_NEAR(dxdt[1], 0.485, 1e-12);
    EXPECT_NEAR(dxdt[2], 0.5, 1e-12);
    EXPECT_NEAR(dxdt[3], 0.5, 1e-12);
}

TEST_F(ModelDefinitionTest, DerivativesSumToZero) {
    const std::vector<std::pair<const ModelDefinition*, state_type>> cases = {
        {&si, {123.4, 56.7}},
        {&sis, {0.5, 999.5}},
        {&sir, {1e5 - 17.0, 12.0, 5.0}},
        {&seir, {400.0, 300.0, 200.0, 100.0}},
    };
    for (const auto& c : cases) {
        state_type dxdt = derivativesOf(*c.first, c.second);
        double total = std::accumulate(dxdt.begin(), dxdt.end(), 0.0);
        EXPECT_NEAR(total, 0.0, 1e-9) << c.first->getName();
    }
}

TEST_F(ModelDefinitionTest, ZeroPopulationGivesZeroTransmission) {
    state_type dxdt = derivativesOf(sir, {0.0, 0.0, 0.0});
    for (double d : dxdt) {
        EXPECT_EQ(d, 0.0);
    }
}

TEST_F(ModelDefinitionTest, NegativeCompartmentsStillConsistent) {
    state_type dxdt = derivativesOf(sir, {1010.0, -10.0, 0.0});
    EXPECT_NEAR(dxdt[0], 3.03, 1e-12);
    EXPECT_NEAR(dxdt[1], -3.03 + 1.0, 1e-12);
    EXPECT_NEAR(dxdt[2], -1.0, 1e-12);

    const std::vector<std::pair<const ModelDefinition*, state_type>> cases = {
        {&si, {-5.0, 1.0}},
        {&sis, {1001.0, -1e-3}},
        {&sir, {-5.0, 1.0, 0.0}},
        {&seir, {500.0, -2.0, 300.0, -0.5}},
    };
    for (const auto& c : cases) {
        state_type rates = derivativesOf(*c.first, c.second);
        for (double rate : rates) {
            EXPECT_TRUE(std::isfinite(rate)) << c.first->getName();
        }
        EXPECT_NEAR(std::accumulate(rates.begin(), rates.end(), 0.0), 0.0, 1e-9) << c.first->getName();
    }

    CompartmentValues named = seir.derivatives(0.0, {{"S", 500.0}, {"E", -2.0}, {"I", 300.0}, {"R", -0.5}}, params);
    EXPECT_NEAR(named.at("E"), 0.3 * 500.0 * 300.0 / 797.5 + 0.4, 1e-9);
}

TEST_F(ModelDefinitionTest, NamedDerivatives) {
    CompartmentValues d = sir.derivatives(0.0, {{"S", 990.0}, {"I", 10.0}, {"R", 0.0}}, params);
    EXPECT_NEAR(d.at("S"), -2.97, 1e-12);
    EXPECT_NEAR(d.at("R"), 1.0, 1e-12);

    EXPECT_THROW(sir.derivatives(0.0, {{"S", 990.0}, {"I", 10.0}}, params), ConfigurationException);
    EXPECT_THROW(sir.derivatives(0.0, {{"S", 990.0}, {"I", 10.0}, {"R", 0.0}, {"X", 1.0}}, params),
                 ConfigurationException);
}

TEST_F(ModelDefinitionTest, FlowRates) {
    std::vector<double> rates = seir.computeFlowRates({990.0, 5.0, 5.0, 0.0}, params);
    ASSERT_EQ(rates.size(), 3u);
    EXPECT_NEAR(rates[seir.getFlowIndex("new_infections")], 1.485, 1e-12);
    EXPECT_NEAR(rates[seir.getFlowIndex("progression")], 1.0, 1e-12);
    EXPECT_NEAR(rates[seir.getFlowIndex("recoveries")], 0.5, 1e-12);
    EXPECT_THROW(seir.getFlowIndex("deaths"), ConfigurationException);
}

TEST_F(ModelDefinitionTest, StateSizeMismatch) {
    state_type dxdt;
    EXPECT_THROW(sir.computeDerivatives(0.0, {1.0, 2.0}, params, dxdt), ConfigurationException);
}

TEST_F(ModelDefinitionTest, ParameterValidation) {
    EXPECT_NO_THROW(sir.validateParameters(params));
    EXPECT_NO_THROW(sir.validateParameters(ParameterSet{{"beta", 0.0}, {"gamma", 0.1}}));
    EXPECT_THROW(sir.validateParameters(ParameterSet{{"beta", 0.3}}), ConfigurationException);
    EXPECT_THROW(sir.validateParameters(ParameterSet{{"beta", -0.3}, {"gamma", 0.1}}), ConfigurationException);
    EXPECT_THROW(seir.validateParameters(ParameterSet{{"beta", 0.3}, {"gamma", 0.1}}), ConfigurationException);
}

TEST(ModelDefinitionConstructionTest, CustomModel) {
    ModelDefinition sirs("SIRS", {"S", "I", "R"}, {"beta", "gamma", "omega"},
                         {FlowRule::transmission("new_infections", "S", "I", "I", "beta"),
                          FlowRule::linear("recoveries", "I", "R", "gamma"),
                          FlowRule::linear("waning", "R", "S", "omega")});
    ParameterSet p{{"beta", 0.3}, {"gamma", 0.1}, {"omega", 0.05}};
    state_type dxdt;
    sirs.computeDerivatives(0.0, {900.0, 50.0, 50.0}, p, dxdt);
    EXPECT_NEAR(dxdt[0], -13.5 + 2.5, 1e-12);
    EXPECT_NEAR(dxdt[1], 13.5 - 5.0, 1e-12);
    EXPECT_NEAR(dxdt[2], 5.0 - 2.5, 1e-12);
}

TEST(ModelDefinitionConstructionTest, ConstructionFailures) {
    auto infection = FlowRule::transmission("new_infections", "S", "I", "I", "beta");

    EXPECT_THROW(ModelDefinition("empty", {}, {"beta"}, {}), ConfigurationException);
    EXPECT_THROW(ModelDefinition("dup", {"S", "S"}, {"beta"}, {}), ConfigurationException);
    EXPECT_THROW(ModelDefinition("noS", {"X", "I"}, {"beta"}, {}), ConfigurationException);
    EXPECT_THROW(ModelDefinition("dupParam", {"S", "I"}, {"beta", "beta"}, {infection}), ConfigurationException);
    EXPECT_THROW(ModelDefinition("badSource", {"S", "I"}, {"beta"},
                                 {FlowRule::linear("f", "Q", "I", "beta")}), ConfigurationException);
    EXPECT_THROW(ModelDefinition("badTarget", {"S", "I"}, {"beta"},
                                 {FlowRule::linear("f", "S", "Q", "beta")}), ConfigurationException);
    EXPECT_THROW(ModelDefinition("selfLoop", {"S", "I"}, {"beta"},
                                 {FlowRule::linear("f", "I", "I", "beta")}), ConfigurationException);
    EXPECT_THROW(ModelDefinition("badParam", {"S", "I"}, {"beta"},
                                 {FlowRule::linear("f", "I", "S", "gamma")}), ConfigurationException);
    EXPECT_THROW(ModelDefinition("badInfectious", {"S", "I"}, {"beta"},
                                 {FlowRule::transmission("f", "S", "I", "Q", "beta")}), ConfigurationException);
    EXPECT_THROW(ModelDefinition("dupFlow", {"S", "I"}, {"beta"}, {infection, infection}), ConfigurationException);
}
