#include "model/InitialConditionResolver.hpp"
#include "engine/EngineRegistry.hpp"
#include "io/NetCDFOutputFormat.hpp"
#include "io/Hdf5OutputFormat.hpp"
#include "exceptions/Exceptions.hpp"
#include "model/ModelConstants.hpp"
#include "TestHelpers.hpp"
#include <gtest/gtest.h>

using namespace episim;

class InitialConditionResolverTest : public test::TempDirTest {
protected:
    Eigen::MatrixXd counts = (Eigen::MatrixXd(3, 2) << 100, 50,
                                                       80, 40,
                                                       20, 10).finished();
    PopulationParams population = test::makePopulation(counts);

    const IEngineVariant& basic() { return EngineRegistry::resolve(constants::BASIC_ENGINE_ID); }
    const IEngineVariant& vaccination() { return EngineRegistry::resolve(constants::VACCINATION_ENGINE_ID); }

    SimulationConfig config(const std::string& engineId) {
        return SimulationConfig(test::makeConfig(engineId, 3));
    }
};

TEST_F(InitialConditionResolverTest, ApportionsSeedsOverAgeGroups) {
    const std::vector<double> fractions(constants::DEFAULT_SEED_AGE_FRACTIONS.begin(),
                                        constants::DEFAULT_SEED_AGE_FRACTIONS.end());
    SeedApportionment seeded = InitialConditionResolver::apportionSeeds({{0, 10.0}}, counts, fractions, logger);

    EXPECT_NEAR(seeded.asymptomatic(0, 0), 1.2, 1e-12);
    EXPECT_NEAR(seeded.asymptomatic(1, 0), 1.6, 1e-12);
    EXPECT_NEAR(seeded.asymptomatic(2, 0), 7.2, 1e-12);
    EXPECT_NEAR(seeded.susceptible(0, 0), 98.8, 1e-12);
    EXPECT_NEAR(seeded.susceptible(1, 0), 78.4, 1e-12);
    EXPECT_NEAR(seeded.susceptible(2, 0), 12.8, 1e-12);
    EXPECT_DOUBLE_EQ(seeded.asymptomatic.col(1).sum(), 0.0);
    EXPECT_DOUBLE_EQ(seeded.susceptible(2, 1), 10.0);
}

TEST_F(InitialConditionResolverTest, AgeSharesAddUpToTheSeedExactly) {
    const std::vector<double> fractions(constants::DEFAULT_SEED_AGE_FRACTIONS.begin(),
                                        constants::DEFAULT_SEED_AGE_FRACTIONS.end());
    const Eigen::MatrixXd population = Eigen::MatrixXd::Constant(3, 1, 1e6);
    for (int k = 1; k <= 2000; ++k) {
        const double seed = k * 0.37;
        SeedApportionment seeded = InitialConditionResolver::apportionSeeds({{0, seed}}, population, fractions, logger);
        const double total = seeded.asymptomatic(0, 0) + seeded.asymptomatic(1, 0) + seeded.asymptomatic(2, 0);
        ASSERT_EQ(total, seed) << "seed " << seed;
    }
    SeedApportionment seeded = InitialConditionResolver::apportionSeeds({{0, 731.12}}, population, fractions, logger);
    EXPECT_EQ(seeded.asymptomatic(0, 0) + seeded.asymptomatic(1, 0) + seeded.asymptomatic(2, 0), 731.12);
}

TEST_F(InitialConditionResolverTest, SeedsAtTheSamePatchAccumulate) {
    const std::vector<double> fractions = {0.5, 0.25, 0.25};
    SeedApportionment seeded = InitialConditionResolver::apportionSeeds({{1, 4.0}, {1, 8.0}}, counts, fractions, logger);
    EXPECT_DOUBLE_EQ(seeded.asymptomatic(0, 1), 6.0);
    EXPECT_DOUBLE_EQ(seeded.asymptomatic(2, 1), 3.0);
    EXPECT_DOUBLE_EQ(seeded.asymptomatic.sum(), 12.0);
}

TEST_F(InitialConditionResolverTest, OverSeededCellIsClamped) {
    const std::vector<double> fractions = {0.0, 0.0, 1.0};
    SeedApportionment seeded = InitialConditionResolver::apportionSeeds({{1, 25.0}}, counts, fractions, logger);
    EXPECT_DOUBLE_EQ(seeded.susceptible(2, 1), 0.0);
    EXPECT_DOUBLE_EQ(seeded.asymptomatic(2, 1), 25.0);
    EXPECT_TRUE(logged("clamped"));
}

TEST_F(InitialConditionResolverTest, RejectsInvalidSeeds) {
    const std::vector<double> fractions = {0.2, 0.3, 0.5};
    EXPECT_THROW(InitialConditionResolver::apportionSeeds({{0, -1.0}}, counts, fractions, logger),
                 InvalidParameterException);
    EXPECT_THROW(InitialConditionResolver::apportionSeeds({{0, 1.0}}, counts, {0.5, 0.5}, logger),
                 InvalidParameterException);
}

TEST_F(InitialConditionResolverTest, SeedAgeFractions) {
    nlohmann::json section = nlohmann::json::object();
    EXPECT_EQ(InitialConditionResolver::seedAgeFractions(section, 3), (std::vector<double>{0.12, 0.16, 0.72}));
    EXPECT_THROW(InitialConditionResolver::seedAgeFractions(section, 2), InvalidParameterException);

    section["seed_age_fractions"] = {0.4, 0.6};
    EXPECT_EQ(InitialConditionResolver::seedAgeFractions(section, 2), (std::vector<double>{0.4, 0.6}));
    section["seed_age_fractions"] = {0.4, 0.4};
    EXPECT_THROW(InitialConditionResolver::seedAgeFractions(section, 2), InvalidParameterException);
    section["seed_age_fractions"] = {1.4, -0.4};
    EXPECT_THROW(InitialConditionResolver::seedAgeFractions(section, 2), InvalidParameterException);
}

TEST_F(InitialConditionResolverTest, AppliesSeedsAsDensities) {
    test::writeDataFolder(tempDir.string(), population.ageLabels, counts, {{0, 10.0}});
    TabularDataLoader loader(tempDir.string());
    InitialConditionResolver resolver(basic(), loader, logger);
    EpidemicParams epidemic = test::makeEpidemic(3, 2, 4, 1);

    InitialConditionSelection selection = resolver.apply(config(constants::BASIC_ENGINE_ID), std::nullopt,
                                                         population, epidemic);
    EXPECT_EQ(selection.source, InitialConditionSource::Seeds);
    EXPECT_NEAR(epidemic.density(Compartment::A)(2, 0, 0, 0), 7.2 / 20.0, 1e-12);
    EXPECT_NEAR(epidemic.density(Compartment::S)(0, 0, 0, 0), 98.8 / 100.0, 1e-12);
    EXPECT_DOUBLE_EQ(epidemic.density(Compartment::S)(1, 1, 0, 0), 1.0);
    EXPECT_DOUBLE_EQ(epidemic.density(Compartment::S)(0, 0, 1, 0), 0.0);
}

TEST_F(InitialConditionResolverTest, SeedsGoToNonVaccinatedStatus) {
    test::writeDataFolder(tempDir.string(), population.ageLabels, counts, {{1, 5.0}});
    TabularDataLoader loader(tempDir.string());
    InitialConditionResolver resolver(vaccination(), loader, logger);
    EpidemicParams epidemic = test::makeEpidemic(3, 2, 2, 3);

    resolver.apply(config(constants::VACCINATION_ENGINE_ID), std::nullopt, population, epidemic);
    EXPECT_DOUBLE_EQ(epidemic.density(Compartment::S)(0, 0, 0, 0), 1.0);
    EXPECT_DOUBLE_EQ(epidemic.density(Compartment::S)(0, 0, 0, 1), 0.0);
    EXPECT_GT(epidemic.density(Compartment::A)(2, 1, 0, 0), 0.0);
    EXPECT_DOUBLE_EQ(epidemic.density(Compartment::A)(2, 1, 0, 2), 0.0);
}

TEST_F(InitialConditionResolverTest, SeedPatchOutsideRange) {
    test::writeDataFolder(tempDir.string(), population.ageLabels, counts, {{2, 1.0}});
    TabularDataLoader loader(tempDir.string());
    InitialConditionResolver resolver(basic(), loader, logger);
    EpidemicParams epidemic = test::makeEpidemic(3, 2, 2, 1);
    try {
        resolver.apply(config(constants::BASIC_ENGINE_ID), std::nullopt, population, epidemic);
        FAIL() << "Expected TabularSchemaException";
    } catch (const TabularSchemaException& e) {
        EXPECT_EQ(e.getErrorType(), TabularSchemaException::ErrorType::InvalidIndex);
    }
}

TEST_F(InitialConditionResolverTest, SelectionPrecedence) {
    test::writeDataFolder(tempDir.string(), population.ageLabels, counts, {{0, 1.0}});
    test::writeText(path("initial_conditions.nc"), "");
    test::writeText(path("override.nc"), "");
    TabularDataLoader loader(tempDir.string());
    InitialConditionResolver resolver(basic(), loader, logger);

    SimulationConfig seedsOnly = config(constants::BASIC_ENGINE_ID);
    EXPECT_EQ(resolver.select(seedsOnly, std::nullopt).source, InitialConditionSource::Seeds);

    SimulationConfig withFile = config(constants::BASIC_ENGINE_ID);
    withFile.document()["data"]["initial_condition_filename"] = "initial_conditions.nc";
    InitialConditionSelection fromConfig = resolver.select(withFile, std::nullopt);
    EXPECT_EQ(fromConfig.source, InitialConditionSource::File);
    EXPECT_EQ(fromConfig.path, path("initial_conditions.nc"));

    InitialConditionSelection overridden = resolver.select(withFile, path("override.nc"));
    EXPECT_EQ(overridden.path, path("override.nc"));

    InitialConditionSelection fallback = resolver.select(withFile, path("missing.nc"));
    EXPECT_EQ(fallback.path, path("initial_conditions.nc"));
    EXPECT_TRUE(logged("falling back"));
}

TEST_F(InitialConditionResolverTest, NothingDeclared) {
    nlohmann::json doc = test::makeConfig(constants::BASIC_ENGINE_ID, 3);
    doc["data"].erase("seeds_filename");
    TabularDataLoader loader(tempDir.string());
    InitialConditionResolver resolver(basic(), loader, logger);
    try {
        resolver.select(SimulationConfig(doc), std::nullopt);
        FAIL() << "Expected MissingParameterException";
    } catch (const MissingParameterException& e) {
        EXPECT_EQ(e.getParameterName(), "data.initial_condition_filename");
    }
}

TEST_F(InitialConditionResolverTest, DeclaredFileMustExist) {
    SimulationConfig withFile = config(constants::BASIC_ENGINE_ID);
    withFile.document()["data"]["initial_condition_filename"] = "initial_conditions.nc";
    TabularDataLoader loader(tempDir.string());
    InitialConditionResolver resolver(basic(), loader, logger);
    EXPECT_THROW(resolver.select(withFile, std::nullopt), MissingInputFileException);
}

TEST_F(InitialConditionResolverTest, WrittenInitialConditionIsReadBack) {
    TabularDataLoader loader(tempDir.string());
    InitialConditionResolver resolver(basic(), loader, logger);
    NdArray stored({3, 2, 10});
    stored.at({0, 0, 0}) = 90.0;
    stored.at({0, 0, 3}) = 10.0;
    stored.at({2, 1, 9}) = 1.0;
    resolver.writeInitialCondition(stored, population, path("initial_conditions.nc"), "netcdf");

    NetCDFOutputFormat format;
    EXPECT_EQ(format.listVariables(path("initial_conditions.nc")), (std::vector<std::string>{"data"}));
    EXPECT_EQ(format.readCoordinates(path("initial_conditions.nc"), "epi_states").size(), 10u);

    SimulationConfig withFile = config(constants::BASIC_ENGINE_ID);
    withFile.document()["data"]["initial_condition_filename"] = "initial_conditions.nc";
    EpidemicParams epidemic = test::makeEpidemic(3, 2, 3, 1);
    InitialConditionSelection selection = resolver.apply(withFile, std::nullopt, population, epidemic);
    EXPECT_EQ(selection.source, InitialConditionSource::File);
    EXPECT_DOUBLE_EQ(epidemic.density(Compartment::S)(0, 0, 0, 0), 0.9);
    EXPECT_DOUBLE_EQ(epidemic.density(Compartment::I)(0, 0, 0, 0), 0.1);
    EXPECT_DOUBLE_EQ(epidemic.density(Compartment::D)(2, 1, 0, 0), 0.1);
    EXPECT_DOUBLE_EQ(epidemic.density(Compartment::CH)(0, 0, 0, 0), 0.0);
}

TEST_F(InitialConditionResolverTest, InitFormatSelectsReader) {
    TabularDataLoader loader(tempDir.string());
    InitialConditionResolver resolver(vaccination(), loader, logger);
    NdArray stored({3, 2, 3, 11});
    stored.at({1, 1, 2, 10}) = 4.0;
    resolver.writeInitialCondition(stored, population, path("initial_conditions.h5"), "hdf5");

    Hdf5OutputFormat format;
    EXPECT_EQ(format.readDimensionNames(path("initial_conditions.h5"), "data"),
              (std::vector<std::string>{"G", "M", "V", "epi_states"}));

    SimulationConfig withFile = config(constants::VACCINATION_ENGINE_ID);
    withFile.document()["data"]["initial_condition_filename"] = "initial_conditions.h5";
    withFile.document()["simulation"]["init_format"] = "hdf5";
    EpidemicParams epidemic = test::makeEpidemic(3, 2, 2, 3);
    resolver.apply(withFile, std::nullopt, population, epidemic);
    EXPECT_DOUBLE_EQ(epidemic.density(Compartment::CH)(1, 1, 0, 2), 0.1);
}

TEST_F(InitialConditionResolverTest, ShapeMismatch) {
    TabularDataLoader loader(tempDir.string());
    InitialConditionResolver writer(vaccination(), loader, logger);
    NdArray stored({3, 2, 3, 11});
    writer.writeInitialCondition(stored, population, path("initial_conditions.nc"), "netcdf");

    InitialConditionResolver resolver(basic(), loader, logger);
    SimulationConfig withFile = config(constants::BASIC_ENGINE_ID);
    withFile.document()["data"]["initial_condition_filename"] = "initial_conditions.nc";
    EpidemicParams epidemic = test::makeEpidemic(3, 2, 2, 1);
    EXPECT_THROW(resolver.apply(withFile, std::nullopt, population, epidemic), InitialConditionShapeException);
}

TEST_F(InitialConditionResolverTest, ZeroPopulationGivesZeroDensity) {
    Eigen::MatrixXd sparse = counts;
    sparse(1, 1) = 0.0;
    PopulationParams thin = test::makePopulation(sparse);
    NdArray stored({3, 2, 10});
    stored.at({1, 1, 0}) = 3.0;
    EpidemicParams epidemic = test::makeEpidemic(3, 2, 2, 1);
    basic().setInitialCompartments(epidemic, thin, stored);
    EXPECT_DOUBLE_EQ(epidemic.density(Compartment::S)(1, 1, 0, 0), 0.0);
}
