#include "config/SimulationConfig.hpp"
#include "config/ConfigTemplate.hpp"
#include "config/SchemaValidator.hpp"
#include "engine/EngineRegistry.hpp"
#include "exceptions/Exceptions.hpp"
#include "model/ModelConstants.hpp"
#include "utils/DateUtils.hpp"
#include "TestHelpers.hpp"
#include <gtest/gtest.h>
#include <filesystem>

using namespace episim;
namespace fs = std::filesystem;

class SimulationConfigTest : public test::TempDirTest {};

TEST_F(SimulationConfigTest, ReadsSimulationSection) {
    SimulationConfig config(test::makeConfig(constants::BASIC_ENGINE_ID, 2, "2020-03-10"));
    EXPECT_EQ(config.engineId(), constants::BASIC_ENGINE_ID);
    EXPECT_EQ(DateUtils::formatDate(config.startDate()), "2020-03-01");
    EXPECT_EQ(config.horizonLength(), 10);
    EXPECT_TRUE(config.saveFullOutput());
    EXPECT_TRUE(config.saveObservables());
    EXPECT_FALSE(config.saveTimeStep().has_value());
    EXPECT_EQ(config.outputFormat(), "netcdf");
    EXPECT_EQ(config.outputFolder(), "output");
}

TEST_F(SimulationConfigTest, DefaultsWhenKeysAreAbsent) {
    nlohmann::json doc = test::makeConfig(constants::BASIC_ENGINE_ID, 2);
    for (const char* key : {"save_full_output", "save_observables", "output_format", "init_format", "output_folder"}) {
        doc["simulation"].erase(key);
    }
    SimulationConfig config(doc);
    EXPECT_FALSE(config.saveFullOutput());
    EXPECT_FALSE(config.saveObservables());
    EXPECT_EQ(config.outputFormat(), constants::DEFAULT_OUTPUT_FORMAT);
    EXPECT_EQ(config.initFormat(), constants::DEFAULT_OUTPUT_FORMAT);
    EXPECT_EQ(config.outputFolder(), constants::DEFAULT_OUTPUT_FOLDER);
}

TEST_F(SimulationConfigTest, EndBeforeStartIsRejected) {
    SimulationConfig config(test::makeConfig(constants::BASIC_ENGINE_ID, 2, "2020-02-28"));
    EXPECT_THROW(config.horizonLength(), InvalidParameterException);
}

TEST_F(SimulationConfigTest, MissingStartDate) {
    nlohmann::json doc = test::makeConfig(constants::BASIC_ENGINE_ID, 2);
    doc["simulation"].erase("start_date");
    SimulationConfig config(doc);
    try {
        config.startDate();
        FAIL() << "Expected MissingParameterException";
    } catch (const MissingParameterException& e) {
        EXPECT_EQ(e.getParameterName(), "simulation.start_date");
    }
}

TEST_F(SimulationConfigTest, OverridesReplaceDatesAndExportFlags) {
    SimulationConfig config(test::makeConfig(constants::BASIC_ENGINE_ID, 2));
    RunOverrides overrides;
    overrides.startDate = "2020-03-02";
    overrides.endDate = "2020-03-31";
    overrides.exportTimeStep = 7;
    overrides.exportFull = false;
    config.applyOverrides(overrides);

    EXPECT_EQ(DateUtils::formatDate(config.startDate()), "2020-03-02");
    EXPECT_EQ(config.horizonLength(), 30);
    ASSERT_TRUE(config.saveTimeStep().has_value());
    EXPECT_EQ(*config.saveTimeStep(), 7);
    EXPECT_FALSE(config.saveFullOutput());
}

TEST_F(SimulationConfigTest, EmptyOverridesLeaveConfigUntouched) {
    const nlohmann::json doc = test::makeConfig(constants::BASIC_ENGINE_ID, 2);
    SimulationConfig config(doc);
    config.applyOverrides(RunOverrides{});
    EXPECT_EQ(config.document(), doc);
}

TEST_F(SimulationConfigTest, MalformedOverrideDateIsRejected) {
    SimulationConfig config(test::makeConfig(constants::BASIC_ENGINE_ID, 2));
    RunOverrides overrides;
    overrides.endDate = "31/03/2020";
    EXPECT_THROW(config.applyOverrides(overrides), InvalidParameterException);
    EXPECT_EQ(DateUtils::formatDate(config.endDate()), "2020-03-05");
}

TEST_F(SimulationConfigTest, WrongTypesAreRejected) {
    nlohmann::json doc = test::makeConfig(constants::BASIC_ENGINE_ID, 2);
    doc["simulation"]["save_full_output"] = "yes";
    doc["simulation"]["save_time_step"] = 2.5;
    SimulationConfig config(doc);
    EXPECT_THROW(config.saveFullOutput(), InvalidParameterException);
    EXPECT_THROW(config.saveTimeStep(), InvalidParameterException);
}

TEST_F(SimulationConfigTest, DataFilenames) {
    SimulationConfig config(test::makeConfig(constants::BASIC_ENGINE_ID, 2));
    ASSERT_TRUE(config.dataFilename("seeds_filename").has_value());
    EXPECT_EQ(*config.dataFilename("seeds_filename"), "seeds.csv");
    EXPECT_FALSE(config.dataFilename("initial_condition_filename").has_value());

    config.document()["data"]["kappa0_filename"] = "";
    EXPECT_FALSE(config.dataFilename("kappa0_filename").has_value());
}

TEST_F(SimulationConfigTest, SaveAndLoad) {
    SimulationConfig config(test::makeConfig(constants::VACCINATION_ENGINE_ID, 2));
    const std::string file = path("config.json");
    config.save(file);
    SimulationConfig loaded = SimulationConfig::fromFile(file);
    EXPECT_EQ(loaded.document(), config.document());
}

TEST_F(SimulationConfigTest, FromFileErrors) {
    EXPECT_THROW(SimulationConfig::fromFile(path("absent.json")), MissingInputFileException);

    test::writeText(path("broken.json"), "{ \"simulation\": ");
    EXPECT_THROW(SimulationConfig::fromFile(path("broken.json")), ConfigSchemaException);

    test::writeText(path("array.json"), "[1, 2, 3]");
    EXPECT_THROW(SimulationConfig::fromFile(path("array.json")), ConfigSchemaException);
}

TEST_F(SimulationConfigTest, TemplateValidatesForEveryEngine) {
    for (const auto& engineId : EngineRegistry::knownIds()) {
        const IEngineVariant& variant = EngineRegistry::resolve(engineId);
        SimulationConfig config(ConfigTemplate::create(variant, 4, 3));
        EXPECT_NO_THROW(SchemaValidator::validate(config, variant)) << engineId;
        EXPECT_EQ(config.engineId(), engineId);
        EXPECT_EQ(config.section("population_params").at("G_labels").size(), 3u);
        EXPECT_EQ(config.section("population_params").at("C").size(), 3u);
    }
}

TEST_F(SimulationConfigTest, TemplateWritesModelFolder) {
    const IEngineVariant& variant = EngineRegistry::resolve(constants::VACCINATION_ENGINE_ID);
    const std::string folder = path("models/demo");
    const std::string configPath = ConfigTemplate::writeModel(variant, 3, 2, folder, logger);

    EXPECT_EQ(configPath, (fs::path(folder) / ConfigTemplate::CONFIG_FILENAME).string());
    EXPECT_TRUE(fs::exists(configPath));
    EXPECT_TRUE(fs::exists(fs::path(folder) / ConfigTemplate::METAPOPULATION_FILENAME));
    EXPECT_TRUE(fs::exists(fs::path(folder) / ConfigTemplate::MOBILITY_FILENAME));

    SimulationConfig loaded = SimulationConfig::fromFile(configPath);
    EXPECT_NO_THROW(SchemaValidator::validateConfig(loaded));
    EXPECT_TRUE(loaded.hasSection("vaccination"));
}
