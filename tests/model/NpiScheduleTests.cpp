#include "model/parameters/NpiSchedule.hpp"
#include "model/parameters/ParameterBuilder.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/DateUtils.hpp"
#include "model/ModelConstants.hpp"
#include "TestHelpers.hpp"
#include <gtest/gtest.h>

using namespace episim;
using nlohmann::json;

TEST(NpiScheduleTest, ActiveChangePoint) {
    NpiSchedule schedule({3, 10}, {0.8, 0.5}, {0.2, 0.3}, {0.7, 0.6});
    EXPECT_FALSE(schedule.activeAt(2).has_value());
    ASSERT_TRUE(schedule.activeAt(3).has_value());
    EXPECT_DOUBLE_EQ(schedule.activeAt(9)->kappa0, 0.8);
    EXPECT_DOUBLE_EQ(schedule.activeAt(10)->phi, 0.3);
    EXPECT_DOUBLE_EQ(schedule.activeAt(100)->delta, 0.6);
    EXPECT_EQ(schedule.getSteps(), (std::vector<int>{3, 10}));
    EXPECT_EQ(schedule.getKappa0s(), (std::vector<double>{0.8, 0.5}));
}

TEST(NpiScheduleTest, EmptySchedule) {
    NpiSchedule schedule;
    EXPECT_TRUE(schedule.empty());
    EXPECT_FALSE(schedule.activeAt(1).has_value());
}

TEST(NpiScheduleTest, MisalignedVectors) {
    EXPECT_THROW(NpiSchedule({1, 2}, {0.8}, {0.2, 0.2}, {0.7, 0.7}), NPIScheduleException);
    EXPECT_THROW(NpiSchedule({1}, {0.8}, {0.2}, {}), NPIScheduleException);
}

TEST(NpiScheduleTest, StepsMustIncrease) {
    EXPECT_THROW(NpiSchedule({5, 5}, {0.8, 0.5}, {0.2, 0.2}, {0.7, 0.7}), NPIScheduleException);
    EXPECT_THROW(NpiSchedule({5, 3}, {0.8, 0.5}, {0.2, 0.2}, {0.7, 0.7}), NPIScheduleException);
    EXPECT_THROW(NpiSchedule({0}, {0.8}, {0.2}, {0.7}), NPIScheduleException);
}

class NpiScheduleBuilderTest : public test::TempDirTest {
protected:
    json npiSection() { return test::makeConfig(constants::BASIC_ENGINE_ID, 2).at("NPI"); }
    const boost::gregorian::date start = DateUtils::parseDate("2020-03-01");
};

TEST_F(NpiScheduleBuilderTest, BuildsFromConfig) {
    json section = npiSection();
    section["tᶜs"] = json::array({2, 8});
    section["κ₀s"] = json::array({0.8, 0.4});
    section["ϕs"] = json::array({0.2, 0.2});
    section["δs"] = json::array({0.8, 0.5});
    NpiSchedule schedule = ParameterBuilder::buildNpiSchedule(section, std::nullopt, start, 10, logger);
    ASSERT_EQ(schedule.size(), 2u);
    EXPECT_EQ(schedule.getChangePoints()[1].step, 8);
    EXPECT_DOUBLE_EQ(schedule.getChangePoints()[1].delta, 0.5);
}

TEST_F(NpiScheduleBuilderTest, DisabledInterventions) {
    json section = npiSection();
    section["are_there_npi"] = false;
    NpiSchedule schedule = ParameterBuilder::buildNpiSchedule(section, std::nullopt, start, 10, logger);
    EXPECT_TRUE(schedule.empty());
    EXPECT_TRUE(logged("NPIs disabled"));
}

TEST_F(NpiScheduleBuilderTest, FractionalStep) {
    json section = npiSection();
    section["tᶜs"] = json::array({2.5});
    EXPECT_THROW(ParameterBuilder::buildNpiSchedule(section, std::nullopt, start, 10, logger), NPIScheduleException);
}

TEST_F(NpiScheduleBuilderTest, MisalignedConfigVectors) {
    json section = npiSection();
    section["κ₀s"] = json::array({0.8, 0.5});
    EXPECT_THROW(ParameterBuilder::buildNpiSchedule(section, std::nullopt, start, 10, logger), NPIScheduleException);
}

TEST_F(NpiScheduleBuilderTest, MobilityReductionsReplaceChangePoints) {
    std::vector<MobilityReduction> reductions = {
        {DateUtils::parseDate("2020-02-28"), 0.9},
        {DateUtils::parseDate("2020-03-01"), 0.8},
        {DateUtils::parseDate("2020-03-04"), 0.6},
        {DateUtils::parseDate("2020-04-01"), 0.1}
    };
    NpiSchedule schedule = ParameterBuilder::buildNpiSchedule(npiSection(), reductions, start, 10, logger);
    EXPECT_EQ(schedule.getSteps(), (std::vector<int>{1, 4}));
    EXPECT_EQ(schedule.getKappa0s(), (std::vector<double>{0.8, 0.6}));
    EXPECT_EQ(schedule.getPhis(), (std::vector<double>{0.2, 0.2}));
    EXPECT_EQ(schedule.getDeltas(), (std::vector<double>{0.8, 0.8}));
}

TEST_F(NpiScheduleBuilderTest, EmptyConfigVectorsWithReductions) {
    json npi = npiSection();
    npi["κ₀s"] = json::array();
    npi["ϕs"] = json::array();
    npi["δs"] = json::array();
    npi["tᶜs"] = json::array();
    std::vector<MobilityReduction> reductions = {{DateUtils::parseDate("2020-03-02"), 0.7}};
    NpiSchedule schedule = ParameterBuilder::buildNpiSchedule(npi, reductions, start, 10, logger);
    EXPECT_EQ(schedule.getSteps(), (std::vector<int>{2}));
    EXPECT_EQ(schedule.getKappa0s(), (std::vector<double>{0.7}));
    EXPECT_EQ(schedule.getPhis(), (std::vector<double>{1.0}));
    EXPECT_EQ(schedule.getDeltas(), (std::vector<double>{0.0}));
}

TEST_F(NpiScheduleBuilderTest, ReductionsOutsideHorizon) {
    std::vector<MobilityReduction> reductions = {{DateUtils::parseDate("2021-01-01"), 0.5}};
    NpiSchedule schedule = ParameterBuilder::buildNpiSchedule(npiSection(), reductions, start, 10, logger);
    EXPECT_TRUE(schedule.empty());
    EXPECT_TRUE(logged("No mobility reduction"));
}
