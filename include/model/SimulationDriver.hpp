#ifndef SIMULATION_DRIVER_HPP
#define SIMULATION_DRIVER_HPP

#include <optional>
#include "engine/IEngineVariant.hpp"
#include "model/SpreadingEngineRegistry.hpp"
#include "model/parameters/NpiSchedule.hpp"
#include "utils/Logger.hpp"

namespace episim {

/**
 * @class SimulationDriver
 * @brief Hands a fully prepared run to the spreading engine of its variant.
 *
 * Checks that the prepared structures agree with each other, then lets the
 * engine fill the density arrays in place. Engine failures surface as
 * SpreadingEngineException; there is no retry and no partial result.
 */
class SimulationDriver {
public:
    SimulationDriver(const SpreadingEngineRegistry& registry, Logger& logger);

    /**
     * @brief Runs the engine registered for @p variant.
     *
     * @throws InvalidParameterException If shapes disagree, vaccination parameters are
     *         present without a vaccination axis (or missing with one), or an NPI step
     *         lies outside [1, T].
     * @throws SpreadingEngineException If no engine is registered or the engine fails.
     */
    void run(const IEngineVariant& variant,
             const PopulationParams& population,
             EpidemicParams& epidemic,
             const NpiSchedule& npi,
             const std::optional<VaccinationParams>& vaccination) const;

    /**
     * @brief Consistency checks performed before the engine is called.
     */
    static void checkInputs(const IEngineVariant& variant,
                            const PopulationParams& population,
                            const EpidemicParams& epidemic,
                            const NpiSchedule& npi,
                            const std::optional<VaccinationParams>& vaccination);

private:
    const SpreadingEngineRegistry& registry_;
    Logger& logger_;
};

} // namespace episim

#endif // SIMULATION_DRIVER_HPP
