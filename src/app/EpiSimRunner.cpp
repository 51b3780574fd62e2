#include "app/EpiSimRunner.hpp"
#include "config/ConfigTemplate.hpp"
#include "config/SchemaValidator.hpp"
#include "engine/EngineRegistry.hpp"
#include "io/CompartmentState.hpp"
#include "io/OutputFormatFactory.hpp"
#include "io/OutputSerializer.hpp"
#include "io/TabularDataLoader.hpp"
#include "model/HoldStateSpreadingEngine.hpp"
#include "model/SimulationDriver.hpp"
#include "model/parameters/ParameterBuilder.hpp"
#include "utils/DateUtils.hpp"
#include "utils/FileUtils.hpp"
#include "exceptions/Exceptions.hpp"
#include <filesystem>

namespace episim {

namespace {

void requireDirectory(const std::string& path, const std::string& funcName, const std::string& what) {
    std::error_code ec;
    if (!std::filesystem::is_directory(path, ec)) {
        throw MissingInputFileException(funcName, path, what + " is not a directory");
    }
}

} // namespace

EpiSimRunner::EpiSimRunner(Logger& logger) : logger_(logger) {}

EpiSimRunner::EpiSimRunner(Logger& logger, SpreadingEngineRegistry engines)
    : logger_(logger), engines_(std::move(engines)) {}

RunResult EpiSimRunner::run(const RunOptions& options) const {
    const std::string funcName = "EpiSimRunner::run";

    SimulationConfig config = SimulationConfig::fromFile(options.configPath);
    config.applyOverrides(options.overrides);
    const IEngineVariant& variant = SchemaValidator::validateConfig(config);

    requireDirectory(options.dataFolder, funcName, "data folder");
    requireDirectory(options.instanceFolder, funcName, "instance folder");

    const boost::gregorian::date startDate = config.startDate();
    const int T = config.horizonLength();
    logger_.info(funcName, "Running " + variant.getId() + " from " + DateUtils::formatDate(startDate) +
                 " to " + DateUtils::formatDate(config.endDate()) + " (" + std::to_string(T) + " steps)");

    // Parameters
    TabularDataLoader loader(options.dataFolder);
    PopulationParams population = variant.buildPopulationParams(config, loader, logger_);
    EpidemicParams epidemic = variant.buildEpidemicParams(config, population, T, logger_);

    std::optional<std::vector<MobilityReduction>> reductions;
    if (std::optional<std::string> kappa0File = config.dataFilename("kappa0_filename")) {
        reductions = loader.loadMobilityReduction(*kappa0File);
    }
    NpiSchedule npi = ParameterBuilder::buildNpiSchedule(config.section("NPI"), reductions, startDate, T, logger_);
    std::optional<VaccinationParams> vaccination = variant.buildVaccinationParams(config, population, T);

    // Initial condition
    InitialConditionResolver resolver(variant, loader, logger_);
    InitialConditionSelection selection = resolver.apply(config, options.overrides.initialConditionPath,
                                                         population, epidemic);

    // Integration
    SpreadingEngineRegistry dryRunEngines;
    if (options.dryRun) {
        logger_.info(funcName, "Dry run: the initial state is held over the whole horizon");
        dryRunEngines.registerEngine(variant.getId(), [] { return std::make_unique<HoldStateSpreadingEngine>(); });
    }
    const SpreadingEngineRegistry& registry = options.dryRun ? dryRunEngines : engines_;
    SimulationDriver driver(registry, logger_);
    driver.run(variant, population, epidemic, npi, vaccination);

    CompartmentState state(epidemic, population, variant.getVaccinationLabels(), startDate);

    RunResult result;
    result.engineId = variant.getId();
    result.T = T;
    result.initialConditionSource = selection.source;
    result.massBalance = MassBalanceDiagnostics::evaluate(state, population, variant.getInitialCompartmentCount());
    MassBalanceDiagnostics::log(result.massBalance, logger_);

    // Outputs
    const std::string outputFolder = FileUtils::getOutputPath(options.instanceFolder, config.outputFolder());
    OutputSerializer serializer(OutputFormatFactory::create(config.outputFormat(), logger_), outputFolder, logger_);

    if (config.saveFullOutput()) {
        result.writtenFiles.push_back(serializer.writeFullDump(state));
    }
    if (std::optional<int> step = config.saveTimeStep()) {
        try {
            result.writtenFiles.push_back(serializer.writeSnapshot(state, *step));
        } catch (const ExportIndexOutOfRangeException& e) {
            logger_.error(funcName, std::string("Snapshot skipped: ") + e.what());
        }
    }
    if (config.saveObservables()) {
        result.writtenFiles.push_back(serializer.writeObservables(state, epidemic));
    }

    logger_.info(funcName, "Done: " + std::to_string(result.writtenFiles.size()) + " file(s) written to " + outputFolder);
    return result;
}

std::string EpiSimRunner::setup(const SetupOptions& options) const {
    const std::string funcName = "EpiSimRunner::setup";
    if (options.name.empty()) {
        THROW_INVALID_PARAM(funcName, "model name cannot be empty");
    }
    const IEngineVariant& variant = EngineRegistry::resolve(options.engineId);
    logger_.info(funcName, "Creating config file for engine: " + variant.getId());

    const std::string modelFolder = FileUtils::joinPaths(options.outputFolder, options.name);
    return ConfigTemplate::writeModel(variant, options.patches, options.ageGroups, modelFolder, logger_);
}

std::string EpiSimRunner::init(const InitOptions& options) const {
    const std::string funcName = "EpiSimRunner::init";

    SimulationConfig config = SimulationConfig::fromFile(options.configPath);
    const IEngineVariant& variant = SchemaValidator::validateConfig(config);
    requireDirectory(options.dataFolder, funcName, "data folder");
    logger_.info(funcName, "Generating initial conditions for " + variant.getId());

    TabularDataLoader loader(options.dataFolder);
    PopulationParams population = variant.buildPopulationParams(config, loader, logger_);

    // A seeds path valid from the working directory wins over one relative to the data folder.
    std::string seedsPath = options.seedsPath;
    if (FileUtils::fileExists(seedsPath)) {
        seedsPath = std::filesystem::absolute(seedsPath).string();
    }

    InitialConditionResolver resolver(variant, loader, logger_);
    std::vector<double> fractions = InitialConditionResolver::seedAgeFractions(config.section("population_params"),
                                                                               population.G);
    NdArray counts = resolver.synthesizeFromSeeds(loader.loadSeeds(seedsPath), population, fractions);

    const std::string outputPath = FileUtils::joinPaths(options.dataFolder, options.outputFilename);
    resolver.writeInitialCondition(counts, population, outputPath, config.initFormat());
    return outputPath;
}

template <typename Command>
int EpiSimRunner::execute(const std::string& name, Command command) const {
    try {
        command();
        return 0;
    } catch (const ModelException& e) {
        logger_.fatal("EpiSimRunner", name + " failed: " + e.what());
    } catch (const std::exception& e) {
        logger_.fatal("EpiSimRunner", name + " failed with an unexpected error: " + e.what());
    }
    return 1;
}

int EpiSimRunner::executeRun(const RunOptions& options) const {
    return execute("run", [&] { run(options); });
}

int EpiSimRunner::executeSetup(const SetupOptions& options) const {
    return execute("setup", [&] { setup(options); });
}

int EpiSimRunner::executeInit(const InitOptions& options) const {
    return execute("init", [&] { init(options); });
}

} // namespace episim
