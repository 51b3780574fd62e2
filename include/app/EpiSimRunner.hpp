#ifndef EPISIM_RUNNER_HPP
#define EPISIM_RUNNER_HPP

#include <optional>
#include <string>
#include <vector>
#include "config/SimulationConfig.hpp"
#include "model/InitialConditionResolver.hpp"
#include "model/MassBalanceDiagnostics.hpp"
#include "model/SpreadingEngineRegistry.hpp"
#include "model/ModelConstants.hpp"
#include "utils/Logger.hpp"

namespace episim {

/**
 * @brief Arguments of the `run` command.
 */
struct RunOptions {
    std::string configPath;
    std::string dataFolder;
    std::string instanceFolder = ".";
    RunOverrides overrides;
    /** Hold the initial state instead of integrating (no engine needs to be registered). */
    bool dryRun = false;
};

/**
 * @brief Arguments of the `setup` command.
 */
struct SetupOptions {
    std::string name;
    int patches = 0;
    int ageGroups = 0;
    std::string outputFolder = "models";
    std::string engineId = constants::VACCINATION_ENGINE_ID;
};

/**
 * @brief Arguments of the `init` command.
 */
struct InitOptions {
    std::string configPath;
    std::string dataFolder;
    std::string seedsPath;
    std::string outputFilename = "initial_conditions.nc";
};

/**
 * @brief What a completed run produced.
 */
struct RunResult {
    std::string engineId;
    int T = 0;
    InitialConditionSource initialConditionSource = InitialConditionSource::File;
    std::vector<std::string> writtenFiles;
    MassBalanceReport massBalance;
};

/**
 * @class EpiSimRunner
 * @brief Sequences the commands of the command-line tool.
 *
 * run(), setup() and init() throw on failure. The execute*() variants are the
 * command boundary: they log the failure once and return the process exit code.
 */
class EpiSimRunner {
public:
    explicit EpiSimRunner(Logger& logger);
    EpiSimRunner(Logger& logger, SpreadingEngineRegistry engines);

    /** @brief Engines available to run(); register integrators here. */
    SpreadingEngineRegistry& engines() { return engines_; }
    const SpreadingEngineRegistry& engines() const { return engines_; }

    /**
     * @brief Validate, load, build, initialize, integrate and serialize one simulation.
     *
     * A snapshot step outside the horizon is logged and skipped; the other
     * outputs are still written.
     */
    RunResult run(const RunOptions& options) const;

    /**
     * @brief Scaffolds a model folder.
     * @return Path of the written config file.
     */
    std::string setup(const SetupOptions& options) const;

    /**
     * @brief Synthesizes an initial-condition file from seeds.
     * @return Path of the written file.
     */
    std::string init(const InitOptions& options) const;

    int executeRun(const RunOptions& options) const;
    int executeSetup(const SetupOptions& options) const;
    int executeInit(const InitOptions& options) const;

private:
    template <typename Command>
    int execute(const std::string& name, Command command) const;

    Logger& logger_;
    SpreadingEngineRegistry engines_;
};

} // namespace episim

#endif // EPISIM_RUNNER_HPP
