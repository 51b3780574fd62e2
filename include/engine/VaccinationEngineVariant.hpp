#ifndef VACCINATION_ENGINE_VARIANT_HPP
#define VACCINATION_ENGINE_VARIANT_HPP

#include "engine/IEngineVariant.hpp"

namespace episim {

/**
 * @brief Engine with a vaccination-status axis (NV, V, PV).
 *
 * Initial conditions have shape (G, M, 3, 11). Besides the shared rates the
 * variant reads Λ, Γ, rᵥ, kᵥ and the optional risk reductions, which lower
 * θ, γ and ω for every vaccinated status.
 */
class VaccinationEngineVariant : public IEngineVariant {
public:
    const std::string& getId() const override;
    const std::vector<std::string>& getRequiredSections() const override;
    const std::vector<std::string>& getVaccinationLabels() const override;
    int getInitialCompartmentCount() const override { return constants::NUM_COMPARTMENTS; }
    std::vector<std::string> getInitialConditionDimensions() const override;
    std::vector<size_t> getInitialConditionShape(int G, int M) const override;

    PopulationParams buildPopulationParams(const SimulationConfig& config,
                                           const TabularDataLoader& loader,
                                           Logger& logger) const override;

    EpidemicParams buildEpidemicParams(const SimulationConfig& config,
                                       const PopulationParams& population,
                                       int T, Logger& logger) const override;

    std::optional<VaccinationParams> buildVaccinationParams(const SimulationConfig& config,
                                                            const PopulationParams& population,
                                                            int T) const override;

    void setInitialCompartments(EpidemicParams& epidemic,
                                const PopulationParams& population,
                                const NdArray& counts) const override;

    NdArray layoutInitialCondition(const Eigen::MatrixXd& susceptible,
                                   const Eigen::MatrixXd& asymptomatic) const override;
};

} // namespace episim

#endif // VACCINATION_ENGINE_VARIANT_HPP
