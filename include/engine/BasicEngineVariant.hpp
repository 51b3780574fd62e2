#ifndef BASIC_ENGINE_VARIANT_HPP
#define BASIC_ENGINE_VARIANT_HPP

#include "engine/IEngineVariant.hpp"

namespace episim {

/**
 * @brief Engine without vaccination stratification.
 *
 * Initial conditions carry the ten integrated compartments S..D with shape
 * (G, M, 10); CH is produced by the engine.
 */
class BasicEngineVariant : public IEngineVariant {
public:
    static constexpr int INITIAL_COMPARTMENTS = 10;

    const std::string& getId() const override;
    const std::vector<std::string>& getRequiredSections() const override;
    const std::vector<std::string>& getVaccinationLabels() const override;
    int getInitialCompartmentCount() const override { return INITIAL_COMPARTMENTS; }
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

#endif // BASIC_ENGINE_VARIANT_HPP
