#include "model/SimulationDriver.hpp"
#include "model/HoldStateSpreadingEngine.hpp"
#include "model/MassBalanceDiagnostics.hpp"
#include "engine/EngineRegistry.hpp"
#include "io/CompartmentState.hpp"
#include "exceptions/Exceptions.hpp"
#include "TestHelpers.hpp"
#include <gtest/gtest.h>

using namespace episim;

class SimulationDriverTest : public test::TempDirTest {
protected:
    SpreadingEngineRegistry registry;
    PopulationParams population = test::makePopulation((Eigen::MatrixXd(2, 2) << 100, 50, 80, 40).finished());

    const IEngineVariant& basic() { return EngineRegistry::resolve(constants::BASIC_ENGINE_ID); }
    const IEngineVariant& vaccination() { return EngineRegistry::resolve(constants::VACCINATION_ENGINE_ID); }

    EpidemicParams susceptibleOnly(int T, int V) {
        EpidemicParams epidemic = test::makeEpidemic(2, 2, T, V);
        CompartmentArray& S = epidemic.density(Compartment::S);
        for (int g = 0; g < 2; ++g)
            for (int m = 0; m < 2; ++m)
                S(g, m, 0, 0) = 1.0;
        return epidemic;
    }

    VaccinationParams campaign(int T) {
        VaccinationParams vaccination;
        vaccination.changeSteps = {1, 2, T};
        vaccination.dailyDoses = Eigen::MatrixXd::Zero(2, 3);
        return vaccination;
    }
};

TEST_F(SimulationDriverTest, RunsRegisteredEngine) {
    registry.registerEngine(constants::BASIC_ENGINE_ID, [] { return std::make_unique<test::DecaySpreadingEngine>(0.5); });
    SimulationDriver driver(registry, logger);
    EpidemicParams epidemic = susceptibleOnly(3, 1);

    driver.run(basic(), population, epidemic, NpiSchedule(), std::nullopt);
    EXPECT_DOUBLE_EQ(epidemic.density(Compartment::S)(1, 1, 2, 0), 0.25);
    EXPECT_DOUBLE_EQ(epidemic.density(Compartment::D)(1, 1, 2, 0), 0.75);
    EXPECT_TRUE(logged("Running decay for MMCACovid19"));
    EXPECT_TRUE(logged("Engine finished"));
}

TEST_F(SimulationDriverTest, EngineFailureIsWrapped) {
    registry.registerEngine(constants::BASIC_ENGINE_ID, [] { return std::make_unique<test::ThrowingSpreadingEngine>(); });
    SimulationDriver driver(registry, logger);
    EpidemicParams epidemic = susceptibleOnly(3, 1);
    try {
        driver.run(basic(), population, epidemic, NpiSchedule(), std::nullopt);
        FAIL() << "Expected SpreadingEngineException";
    } catch (const SpreadingEngineException& e) {
        EXPECT_NE(std::string(e.what()).find("throwing failed: integration diverged"), std::string::npos);
    }
}

TEST_F(SimulationDriverTest, NoEngineRegistered) {
    SimulationDriver driver(registry, logger);
    EpidemicParams epidemic = susceptibleOnly(3, 1);
    EXPECT_THROW(driver.run(basic(), population, epidemic, NpiSchedule(), std::nullopt), SpreadingEngineException);
}

TEST_F(SimulationDriverTest, RegistryRejectsEmptyFactoriesAndNullEngines) {
    EXPECT_THROW(registry.registerEngine("x", SpreadingEngineRegistry::Factory()), InvalidParameterException);
    registry.registerEngine("null", [] { return std::unique_ptr<ISpreadingEngine>(); });
    EXPECT_TRUE(registry.contains("null"));
    EXPECT_THROW(registry.create("null"), SpreadingEngineException);
    EXPECT_EQ(registry.registeredIds(), (std::vector<std::string>{"null"}));
}

TEST_F(SimulationDriverTest, NpiStepOutsideHorizon) {
    registry.registerEngine(constants::BASIC_ENGINE_ID, [] { return std::make_unique<HoldStateSpreadingEngine>(); });
    SimulationDriver driver(registry, logger);
    EpidemicParams epidemic = susceptibleOnly(3, 1);
    NpiSchedule late({2, 4}, {0.8, 0.5}, {0.2, 0.2}, {0.7, 0.7});
    EXPECT_THROW(driver.run(basic(), population, epidemic, late, std::nullopt), InvalidParameterException);

    NpiSchedule inside({1, 3}, {0.8, 0.5}, {0.2, 0.2}, {0.7, 0.7});
    EXPECT_NO_THROW(driver.run(basic(), population, epidemic, inside, std::nullopt));
}

TEST_F(SimulationDriverTest, VaccinationParamsMustMatchVariant) {
    const NpiSchedule none;
    EpidemicParams basicRun = susceptibleOnly(3, 1);
    EXPECT_THROW(SimulationDriver::checkInputs(basic(), population, basicRun, none, campaign(3)),
                 InvalidParameterException);

    EpidemicParams vacRun = susceptibleOnly(3, 3);
    EXPECT_THROW(SimulationDriver::checkInputs(vaccination(), population, vacRun, none, std::nullopt),
                 InvalidParameterException);
    EXPECT_NO_THROW(SimulationDriver::checkInputs(vaccination(), population, vacRun, none, campaign(3)));

    VaccinationParams wrongRows = campaign(3);
    wrongRows.dailyDoses = Eigen::MatrixXd::Zero(3, 3);
    EXPECT_THROW(SimulationDriver::checkInputs(vaccination(), population, vacRun, none, wrongRows),
                 InvalidParameterException);
}

TEST_F(SimulationDriverTest, ShapeChecks) {
    const NpiSchedule none;
    EpidemicParams wrongStatuses = susceptibleOnly(3, 3);
    EXPECT_THROW(SimulationDriver::checkInputs(basic(), population, wrongStatuses, none, std::nullopt),
                 InvalidParameterException);

    EpidemicParams wrongPatches = test::makeEpidemic(2, 3, 3, 1);
    EXPECT_THROW(SimulationDriver::checkInputs(basic(), population, wrongPatches, none, std::nullopt),
                 InvalidParameterException);

    PopulationParams broken = population;
    broken.edges.push_back({1, 1, 0.5});
    EpidemicParams epidemic = susceptibleOnly(3, 1);
    EXPECT_THROW(SimulationDriver::checkInputs(basic(), broken, epidemic, none, std::nullopt),
                 InvalidParameterException);

    epidemic.eta = Eigen::MatrixXd::Zero(2, 2);
    EXPECT_THROW(SimulationDriver::checkInputs(basic(), population, epidemic, none, std::nullopt),
                 InvalidParameterException);
}

TEST_F(SimulationDriverTest, HoldStateEngineRepeatsInitialState) {
    registry.registerEngine(constants::VACCINATION_ENGINE_ID, [] { return std::make_unique<HoldStateSpreadingEngine>(); });
    SimulationDriver driver(registry, logger);
    EpidemicParams epidemic = susceptibleOnly(4, 3);
    epidemic.density(Compartment::R)(0, 1, 0, 2) = 0.3;

    driver.run(vaccination(), population, epidemic, NpiSchedule(), campaign(4));
    EXPECT_DOUBLE_EQ(epidemic.density(Compartment::S)(1, 0, 3, 0), 1.0);
    EXPECT_DOUBLE_EQ(epidemic.density(Compartment::R)(0, 1, 3, 2), 0.3);
}

TEST_F(SimulationDriverTest, MassBalanceOfConservingRun) {
    registry.registerEngine(constants::BASIC_ENGINE_ID, [] { return std::make_unique<test::DecaySpreadingEngine>(0.2); });
    SimulationDriver driver(registry, logger);
    EpidemicParams epidemic = susceptibleOnly(5, 1);
    driver.run(basic(), population, epidemic, NpiSchedule(), std::nullopt);

    CompartmentState state(epidemic, population, {}, boost::gregorian::date(2020, 3, 1));
    MassBalanceReport report = MassBalanceDiagnostics::evaluate(state, population, basic().getInitialCompartmentCount());
    EXPECT_EQ(report.cellCount, 20u);
    EXPECT_LT(report.maxRelativeDeviation, 1e-12);
    MassBalanceDiagnostics::log(report, logger);
    EXPECT_FALSE(logged("[WARNING]"));
}

TEST_F(SimulationDriverTest, MassBalanceReportsLeaks) {
    EpidemicParams epidemic = susceptibleOnly(2, 1);
    epidemic.density(Compartment::S)(0, 0, 1, 0) = 0.5;
    epidemic.density(Compartment::S)(1, 1, 1, 0) = 1.0;
    epidemic.density(Compartment::S)(0, 1, 1, 0) = 1.0;
    epidemic.density(Compartment::S)(1, 0, 1, 0) = 1.0;

    CompartmentState state(epidemic, population, {}, boost::gregorian::date(2020, 3, 1));
    MassBalanceReport report = MassBalanceDiagnostics::evaluate(state, population, 10);
    EXPECT_DOUBLE_EQ(report.maxRelativeDeviation, 0.5);
    EXPECT_DOUBLE_EQ(report.meanRelativeDeviation, 0.5 / 8.0);
    MassBalanceDiagnostics::log(report, logger);
    EXPECT_TRUE(logged("[WARNING]"));
    EXPECT_THROW(MassBalanceDiagnostics::evaluate(state, population, 0), InvalidParameterException);
}
