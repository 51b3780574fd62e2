#ifndef MASS_BALANCE_DIAGNOSTICS_HPP
#define MASS_BALANCE_DIAGNOSTICS_HPP

#include <cstddef>
#include "io/CompartmentState.hpp"
#include "model/parameters/PopulationParams.hpp"
#include "utils/Logger.hpp"

namespace episim {

/**
 * @brief Relative deviation of summed compartment counts from the local population.
 */
struct MassBalanceReport {
    double meanRelativeDeviation = 0.0;
    double maxRelativeDeviation = 0.0;
    std::size_t cellCount = 0;      ///< (age, patch, step) cells with positive population.
};

/**
 * @class MassBalanceDiagnostics
 * @brief Post-run check that compartments still add up to the population.
 */
class MassBalanceDiagnostics {
public:
    /**
     * @brief Evaluates |sum - n| / n over every populated (age, patch, step) cell.
     *
     * @param state Counts of the finished run.
     * @param population Population the run was built from.
     * @param compartmentCount Number of leading compartments that partition the population.
     * @throws InvalidParameterException If @p compartmentCount is outside [1, 11].
     */
    static MassBalanceReport evaluate(const CompartmentState& state,
                                      const PopulationParams& population,
                                      int compartmentCount);

    /** @brief Logs a report at info level, or warning level when the max deviation exceeds @p tolerance. */
    static void log(const MassBalanceReport& report, Logger& logger, double tolerance = 1e-6);
};

} // namespace episim

#endif // MASS_BALANCE_DIAGNOSTICS_HPP
