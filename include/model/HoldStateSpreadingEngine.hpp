#ifndef HOLD_STATE_SPREADING_ENGINE_HPP
#define HOLD_STATE_SPREADING_ENGINE_HPP

#include "model/interfaces/ISpreadingEngine.hpp"

namespace episim {

/**
 * @brief Engine that keeps the initial state constant over the horizon.
 *
 * Copies t = 0 into every later step. Used for dry runs of the pipeline.
 */
class HoldStateSpreadingEngine : public ISpreadingEngine {
public:
    std::string getName() const override { return "hold-state"; }

    void run(const PopulationParams& population,
             EpidemicParams& epidemic,
             const NpiSchedule& npi,
             const VaccinationParams* vaccination) override;
};

} // namespace episim

#endif // HOLD_STATE_SPREADING_ENGINE_HPP
