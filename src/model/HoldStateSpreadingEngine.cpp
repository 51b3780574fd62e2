#include "model/HoldStateSpreadingEngine.hpp"

namespace episim {

void HoldStateSpreadingEngine::run(const PopulationParams& /*population*/,
                                   EpidemicParams& epidemic,
                                   const NpiSchedule& /*npi*/,
                                   const VaccinationParams* /*vaccination*/) {
    for (auto& rho : epidemic.rho) {
        for (Eigen::Index g = 0; g < rho.dimension(0); ++g) {
            for (Eigen::Index m = 0; m < rho.dimension(1); ++m) {
                for (Eigen::Index t = 1; t < rho.dimension(2); ++t) {
                    for (Eigen::Index v = 0; v < rho.dimension(3); ++v) {
                        rho(g, m, t, v) = rho(g, m, 0, v);
                    }
                }
            }
        }
    }
}

} // namespace episim
