#ifndef INITIAL_CONDITION_RESOLVER_HPP
#define INITIAL_CONDITION_RESOLVER_HPP

#include <optional>
#include <string>
#include <vector>
#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include "config/SimulationConfig.hpp"
#include "engine/IEngineVariant.hpp"
#include "io/ArrayDataset.hpp"
#include "io/TabularDataLoader.hpp"
#include "model/parameters/EpidemicParams.hpp"
#include "model/parameters/PopulationParams.hpp"
#include "utils/Logger.hpp"

namespace episim {

/**
 * @brief Where the t = 0 state of a run comes from.
 */
enum class InitialConditionSource {
    File,   ///< A stored initial-condition array.
    Seeds   ///< Synthesized from a seed table.
};

/**
 * @brief Outcome of the initial-condition selection.
 */
struct InitialConditionSelection {
    InitialConditionSource source;
    std::string path;       ///< Resolved path of the array file or the seed table.
};

/**
 * @brief Seeded S and A counts, age x patch (G x M).
 */
struct SeedApportionment {
    Eigen::MatrixXd susceptible;
    Eigen::MatrixXd asymptomatic;
};

/**
 * @class InitialConditionResolver
 * @brief Determines and applies the initial state of a run.
 *
 * The state either comes from a stored array of counts or is synthesized
 * from a table of seeded asymptomatic individuals. Either way it ends up as
 * densities at t = 0.
 */
class InitialConditionResolver {
public:
    /**
     * @param variant Engine variant of the run; fixes the array shape.
     * @param loader Loader bound to the run's data folder.
     * @param logger Run logger.
     */
    InitialConditionResolver(const IEngineVariant& variant, const TabularDataLoader& loader, Logger& logger);

    /**
     * @brief Chooses the initial-condition source.
     *
     * Precedence: @p overridePath when it names an existing file, then
     * `data.initial_condition_filename`, then `data.seeds_filename`.
     *
     * @throws MissingInputFileException If `initial_condition_filename` is declared but absent.
     * @throws MissingParameterException If no source is available.
     */
    InitialConditionSelection select(const SimulationConfig& config,
                                     const std::optional<std::string>& overridePath) const;

    /**
     * @brief Selects a source and writes the t = 0 densities.
     * @return The selection that was applied.
     */
    InitialConditionSelection apply(const SimulationConfig& config,
                                    const std::optional<std::string>& overridePath,
                                    const PopulationParams& population,
                                    EpidemicParams& epidemic) const;

    /**
     * @brief Reads the array `data` of an initial-condition file.
     * @param format Value of `simulation.init_format`.
     */
    NdArray readInitialCondition(const std::string& path, const std::string& format) const;

    /**
     * @brief Builds an initial-condition array from a seed table.
     *
     * @param seeds Seeded patches; repeated patches accumulate.
     * @param population Population the seeds are taken from.
     * @param fractions Share of each seed per age group.
     * @throws TabularSchemaException If a patch index lies outside [0, M).
     */
    NdArray synthesizeFromSeeds(const std::vector<SeedEntry>& seeds,
                                const PopulationParams& population,
                                const std::vector<double>& fractions) const;

    /**
     * @brief Splits seeds over age groups and derives the susceptible remainder.
     *
     * Age group g receives fractions[g] x seed, the last group receives the
     * residual so the column sums equal the seed counts exactly. S = n - A is
     * clamped at 0 with a warning.
     */
    static SeedApportionment apportionSeeds(const std::vector<SeedEntry>& seeds,
                                            const Eigen::MatrixXd& population,
                                            const std::vector<double>& fractions,
                                            Logger& logger);

    /**
     * @brief Seed age fractions: `population_params.seed_age_fractions` or the built-in default.
     * @throws InvalidParameterException If the count differs from G or the sum is not 1.
     */
    static std::vector<double> seedAgeFractions(const nlohmann::json& populationSection, int G);

    /**
     * @brief Wraps an initial-condition array in a dataset with the variant's dimensions.
     */
    ArrayDataset buildInitialConditionDataset(const NdArray& counts, const PopulationParams& population) const;

    /**
     * @brief Writes an initial-condition file readable by readInitialCondition().
     */
    void writeInitialCondition(const NdArray& counts, const PopulationParams& population,
                               const std::string& path, const std::string& format) const;

private:
    const IEngineVariant& variant_;
    const TabularDataLoader& loader_;
    Logger& logger_;
};

} // namespace episim

#endif // INITIAL_CONDITION_RESOLVER_HPP
