#ifndef PARAMETER_BUILDER_HPP
#define PARAMETER_BUILDER_HPP

#include <optional>
#include <vector>
#include <nlohmann/json.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "config/SimulationConfig.hpp"
#include "io/TabularDataLoader.hpp"
#include "model/parameters/PopulationParams.hpp"
#include "model/parameters/EpidemicParams.hpp"
#include "model/parameters/NpiSchedule.hpp"
#include "model/parameters/VaccinationParams.hpp"
#include "utils/Logger.hpp"

namespace episim {

/**
 * @class ParameterBuilder
 * @brief Turns validated config sections and loaded tables into parameter structures.
 *
 * Holds the construction steps both engine variants share. Variant-specific
 * additions live in the engine variant classes.
 */
class ParameterBuilder {
public:
    /**
     * @brief Builds population parameters.
     *
     * Counts are rounded and clamped at zero. A patch whose rounded total
     * deviates from the declared total by more than G/2 is reported as a
     * warning. Self-loop edges are dropped.
     *
     * @param populationSection The `population_params` section.
     * @param table Loaded metapopulation table.
     * @param edges Loaded mobility edges.
     * @param logger Run logger.
     * @return PopulationParams Validated structure.
     * @throws MissingParameterException If a required key is absent.
     * @throws InvalidParameterException On a shape mismatch.
     * @throws TabularSchemaException If an edge index lies outside [0, M).
     */
    static PopulationParams buildPopulationParams(const nlohmann::json& populationSection,
                                                  const MetapopulationTable& table,
                                                  const std::vector<MobilityEdge>& edges,
                                                  Logger& logger);

    /**
     * @brief Loads the metapopulation and mobility tables named in `data` and builds population parameters.
     * @throws MissingParameterException If a table is not declared.
     * @throws MissingInputFileException If a declared table does not exist.
     */
    static PopulationParams loadPopulationParams(const SimulationConfig& config,
                                                 const TabularDataLoader& loader,
                                                 Logger& logger);

    /**
     * @brief File name declared under `data.<key>`.
     * @throws MissingParameterException If the key is absent or empty.
     */
    static std::string requireDataFilename(const SimulationConfig& config, const std::string& key);

    /**
     * @brief Reads the age labels from `population_params.G_labels`.
     */
    static std::vector<std::string> readAgeLabels(const nlohmann::json& populationSection);

    /**
     * @brief Removes edges whose origin equals destination. Their weight is discarded.
     * @return Number of edges removed.
     */
    static size_t dropSelfLoops(std::vector<MobilityEdge>& edges);

    /**
     * @brief Builds the rates shared by both variants as G x V matrices.
     *
     * Density arrays are allocated (zero) with shape (G, M, T, V).
     *
     * @throws MissingParameterException If βᴵ is absent, or if neither βᴬ nor scale_β is given.
     */
    static EpidemicParams buildEpidemicParams(const nlohmann::json& epidemicSection,
                                              int G, int M, int T, int V);

    /**
     * @brief Builds the intervention schedule from the `NPI` section.
     *
     * With `are_there_npi: false` the schedule is empty. When @p reductions is
     * given, one change-point per row on or after @p startDate replaces the
     * config change-points; ϕ and δ are taken from the first config entries.
     *
     * @throws NPIScheduleException On misaligned vectors or unordered steps.
     */
    static NpiSchedule buildNpiSchedule(const nlohmann::json& npiSection,
                                        const std::optional<std::vector<MobilityReduction>>& reductions,
                                        const boost::gregorian::date& startDate,
                                        int T, Logger& logger);

    /**
     * @brief Builds the vaccination campaign from the `vaccination` section.
     *
     * tᵛs = [start, start + duration, T]; the daily doses per age group are
     * ϵᵍ x round(total population x percentage_of_vacc_per_day) during the
     * campaign (when are_there_vaccines is set) and zero elsewhere.
     */
    static VaccinationParams buildVaccinationParams(const nlohmann::json& vaccinationSection,
                                                    const PopulationParams& population, int T);
};

} // namespace episim

#endif // PARAMETER_BUILDER_HPP
