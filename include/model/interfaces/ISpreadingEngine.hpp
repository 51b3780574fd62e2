#ifndef I_SPREADING_ENGINE_HPP
#define I_SPREADING_ENGINE_HPP

#include <string>
#include "model/parameters/PopulationParams.hpp"
#include "model/parameters/EpidemicParams.hpp"
#include "model/parameters/NpiSchedule.hpp"
#include "model/parameters/VaccinationParams.hpp"

namespace episim {

/**
 * @brief Interface for the numerical integrator of the metapopulation model.
 *
 * An engine receives densities at t = 0 and fills every later step of the
 * density arrays in place. It owns the arrays for the duration of run();
 * afterwards they are read-only.
 */
class ISpreadingEngine {
public:
    virtual ~ISpreadingEngine() = default;

    /**
     * @brief Human-readable engine name for logs.
     */
    virtual std::string getName() const = 0;

    /**
     * @brief Integrates the model over the T steps of @p epidemic.
     *
     * @param population Demographics and mobility.
     * @param epidemic Rates and density arrays; t = 0 is set on entry.
     * @param npi Intervention schedule (may be empty).
     * @param vaccination Vaccination campaign, or nullptr for engines without one.
     *
     * @throws ModelException Or any std::exception on numerical failure.
     */
    virtual void run(const PopulationParams& population,
                     EpidemicParams& epidemic,
                     const NpiSchedule& npi,
                     const VaccinationParams* vaccination) = 0;
};

} // namespace episim

#endif // I_SPREADING_ENGINE_HPP
