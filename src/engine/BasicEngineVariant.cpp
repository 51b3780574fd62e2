#include "engine/BasicEngineVariant.hpp"
#include "model/parameters/ParameterBuilder.hpp"
#include "exceptions/Exceptions.hpp"

namespace episim {

const std::string& BasicEngineVariant::getId() const {
    return constants::BASIC_ENGINE_ID;
}

const std::vector<std::string>& BasicEngineVariant::getRequiredSections() const {
    static const std::vector<std::string> sections = {
        "simulation", "data", "epidemic_params", "population_params", "NPI"
    };
    return sections;
}

const std::vector<std::string>& BasicEngineVariant::getVaccinationLabels() const {
    static const std::vector<std::string> none;
    return none;
}

std::vector<std::string> BasicEngineVariant::getInitialConditionDimensions() const {
    return {"G", "M", "epi_states"};
}

std::vector<size_t> BasicEngineVariant::getInitialConditionShape(int G, int M) const {
    return {static_cast<size_t>(G), static_cast<size_t>(M), static_cast<size_t>(INITIAL_COMPARTMENTS)};
}

PopulationParams BasicEngineVariant::buildPopulationParams(const SimulationConfig& config,
                                                           const TabularDataLoader& loader,
                                                           Logger& logger) const {
    return ParameterBuilder::loadPopulationParams(config, loader, logger);
}

EpidemicParams BasicEngineVariant::buildEpidemicParams(const SimulationConfig& config,
                                                       const PopulationParams& population,
                                                       int T, Logger& logger) const {
    EpidemicParams params = ParameterBuilder::buildEpidemicParams(
        config.section("epidemic_params"), population.G, population.M, T, 1);
    logger.debug("BasicEngineVariant::buildEpidemicParams",
                 "βᴵ = " + std::to_string(params.beta_I) + ", βᴬ = " + std::to_string(params.beta_A) +
                 ", T = " + std::to_string(T));
    return params;
}

std::optional<VaccinationParams> BasicEngineVariant::buildVaccinationParams(const SimulationConfig&,
                                                                            const PopulationParams&,
                                                                            int) const {
    return std::nullopt;
}

void BasicEngineVariant::setInitialCompartments(EpidemicParams& epidemic,
                                                const PopulationParams& population,
                                                const NdArray& counts) const {
    const std::vector<size_t> expected = getInitialConditionShape(population.G, population.M);
    if (counts.shape != expected) {
        NdArray reference(expected);
        throw InitialConditionShapeException("BasicEngineVariant::setInitialCompartments",
            "expected " + reference.shapeString() + " (G, M, compartments) but got " + counts.shapeString());
    }

    for (int c = 0; c < INITIAL_COMPARTMENTS; ++c) {
        CompartmentArray& rho = epidemic.rho[static_cast<size_t>(c)];
        for (int g = 0; g < population.G; ++g) {
            for (int m = 0; m < population.M; ++m) {
                const double count = counts.at({static_cast<size_t>(g), static_cast<size_t>(m), static_cast<size_t>(c)});
                rho(g, m, 0, 0) = countToDensity(count, population.n(g, m));
            }
        }
    }
}

NdArray BasicEngineVariant::layoutInitialCondition(const Eigen::MatrixXd& susceptible,
                                                   const Eigen::MatrixXd& asymptomatic) const {
    const size_t G = static_cast<size_t>(susceptible.rows());
    const size_t M = static_cast<size_t>(susceptible.cols());
    NdArray array({G, M, static_cast<size_t>(INITIAL_COMPARTMENTS)});
    const size_t sIdx = static_cast<size_t>(compartmentIndex(Compartment::S));
    const size_t aIdx = static_cast<size_t>(compartmentIndex(Compartment::A));
    for (size_t g = 0; g < G; ++g) {
        for (size_t m = 0; m < M; ++m) {
            array.at({g, m, sIdx}) = susceptible(static_cast<Eigen::Index>(g), static_cast<Eigen::Index>(m));
            array.at({g, m, aIdx}) = asymptomatic(static_cast<Eigen::Index>(g), static_cast<Eigen::Index>(m));
        }
    }
    return array;
}

} // namespace episim
