#ifndef I_ENGINE_VARIANT_HPP
#define I_ENGINE_VARIANT_HPP

#include <optional>
#include <string>
#include <vector>
#include <Eigen/Dense>
#include "config/SimulationConfig.hpp"
#include "io/ArrayDataset.hpp"
#include "io/TabularDataLoader.hpp"
#include "model/parameters/PopulationParams.hpp"
#include "model/parameters/EpidemicParams.hpp"
#include "model/parameters/VaccinationParams.hpp"
#include "utils/Logger.hpp"

namespace episim {

/**
 * @brief Capabilities of one spreading-engine variant.
 *
 * Everything that differs between the basic and the vaccination engine is
 * reached through this interface, so the run pipeline never branches on the
 * variant itself.
 */
class IEngineVariant {
public:
    virtual ~IEngineVariant() = default;

    /**
     * @brief Identifier used in `simulation.engine`.
     */
    virtual const std::string& getId() const = 0;

    /**
     * @brief Top-level config sections this variant cannot run without.
     */
    virtual const std::vector<std::string>& getRequiredSections() const = 0;

    /**
     * @brief Labels of the vaccination-status axis; empty when the variant has no such axis.
     */
    virtual const std::vector<std::string>& getVaccinationLabels() const = 0;

    /**
     * @brief Number of compartments integrated from an initial condition.
     */
    virtual int getInitialCompartmentCount() const = 0;

    /**
     * @brief Dimension names of an initial-condition array, outermost first.
     */
    virtual std::vector<std::string> getInitialConditionDimensions() const = 0;

    /**
     * @brief Exact shape an initial-condition array must have.
     */
    virtual std::vector<size_t> getInitialConditionShape(int G, int M) const = 0;

    /**
     * @brief Loads the metapopulation and mobility tables and builds population parameters.
     * @throws MissingInputFileException, TabularSchemaException, MissingParameterException
     */
    virtual PopulationParams buildPopulationParams(const SimulationConfig& config,
                                                   const TabularDataLoader& loader,
                                                   Logger& logger) const = 0;

    /**
     * @brief Builds rates and allocates density arrays for a horizon of T steps.
     * @throws MissingParameterException If a rate cannot be read or derived
     */
    virtual EpidemicParams buildEpidemicParams(const SimulationConfig& config,
                                               const PopulationParams& population,
                                               int T, Logger& logger) const = 0;

    /**
     * @brief Builds the vaccination campaign; std::nullopt for variants without one.
     */
    virtual std::optional<VaccinationParams> buildVaccinationParams(const SimulationConfig& config,
                                                                    const PopulationParams& population,
                                                                    int T) const = 0;

    /**
     * @brief Writes t = 0 densities from an array of counts.
     *
     * Counts are divided by the local population; non-finite results become 0.
     * @throws InitialConditionShapeException If the array shape differs from getInitialConditionShape()
     */
    virtual void setInitialCompartments(EpidemicParams& epidemic,
                                        const PopulationParams& population,
                                        const NdArray& counts) const = 0;

    /**
     * @brief Lays out seeded S and A counts (G x M each) as an initial-condition array.
     *
     * Seeds are placed in the first vaccination status.
     */
    virtual NdArray layoutInitialCondition(const Eigen::MatrixXd& susceptible,
                                           const Eigen::MatrixXd& asymptomatic) const = 0;

    /** @brief Size of the vaccination axis used internally (1 when absent). */
    int getNumVaccinationStatuses() const {
        return getVaccinationLabels().empty() ? 1 : static_cast<int>(getVaccinationLabels().size());
    }

    bool hasVaccinationAxis() const { return !getVaccinationLabels().empty(); }
};

} // namespace episim

#endif // I_ENGINE_VARIANT_HPP
