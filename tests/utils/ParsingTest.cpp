#include "gtest/gtest.h"
#include "compartmental/ModelVariant.hpp"
#include "utils/Logger.hpp"
#include "exceptions/Exceptions.hpp"

using namespace compartmental;

TEST(ModelVariantTest, ParseAndPrint) {
    EXPECT_EQ(parseModelVariant("SEIR"), ModelVariant::SEIR);
    EXPECT_EQ(parseModelVariant("sis"), ModelVariant::SIS);
    EXPECT_EQ(toString(ModelVariant::SI), "SI");
    for (ModelVariant variant : allModelVariants()) {
        EXPECT_EQ(parseModelVariant(toString(variant)), variant);
    }
    EXPECT_THROW(parseModelVariant("SIRD"), ConfigurationException);
    EXPECT_THROW(parseModelVariant(""), ConfigurationException);
}

TEST(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parseLogLevel("INFO"), LogLevel::INFO);
    EXPECT_EQ(parseLogLevel("warn"), LogLevel::WARNING);
    EXPECT_EQ(parseLogLevel("Warning"), LogLevel::WARNING);
    EXPECT_EQ(parseLogLevel("error"), LogLevel::ERROR);
    EXPECT_EQ(parseLogLevel("fatal"), LogLevel::FATAL);
    EXPECT_THROW(parseLogLevel("verbose"), ConfigurationException);
}

TEST(LoggerTest, LevelFiltering) {
    Logger& logger = Logger::getInstance();
    LogLevel previous = logger.getLogLevel();
    logger.setLogLevel(LogLevel::ERROR);
    EXPECT_EQ(logger.getLogLevel(), LogLevel::ERROR);

    testing::internal::CaptureStdout();
    logger.info("LoggerTest", "hidden message");
    std::string out = testing::internal::GetCapturedStdout();
    EXPECT_EQ(out.find("hidden message"), std::string::npos);

    logger.setLogLevel(previous);
}

TEST(ExceptionsTest, IntegrationExceptionCarriesLastTime) {
    IntegrationException e("Simulator::integrate", "step budget exhausted", 12.5);
    EXPECT_EQ(e.getLastTimeReached(), 12.5);
    EXPECT_NE(std::string(e.what()).find("step budget exhausted"), std::string::npos);
    EXPECT_EQ(e.getFunctionName(), "Simulator::integrate");

    try {
        THROW_CONFIGURATION_ERROR("ExceptionsTest", "bad input");
    } catch (const ModelException& caught) {
        EXPECT_NE(std::string(caught.what()).find("bad input"), std::string::npos);
        EXPECT_GT(caught.getLine(), 0);
    }
}

TEST(LoggerTest, ConsoleOutputCanBeSilenced) {
    Logger& logger = Logger::getInstance();
    logger.setConsoleOutput(false);

    testing::internal::CaptureStderr();
    logger.error("LoggerTest", "silenced message");
    std::string err = testing::internal::GetCapturedStderr();
    EXPECT_TRUE(err.empty());

    logger.setConsoleOutput(true);
    testing::internal::CaptureStderr();
    logger.error("LoggerTest", "visible message");
    err = testing::internal::GetCapturedStderr();
    EXPECT_NE(err.find("[ERROR]"), std::string::npos);
    EXPECT_NE(err.find("visible message"), std::string::npos);
}
