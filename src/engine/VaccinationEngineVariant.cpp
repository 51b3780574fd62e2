#include "engine/VaccinationEngineVariant.hpp"
#include "model/parameters/ParameterBuilder.hpp"
#include "utils/JsonUtils.hpp"
#include "exceptions/Exceptions.hpp"

namespace episim {

namespace {

double optionalScalar(const nlohmann::json& section, const std::string& key, double fallback) {
    if (!section.contains(key)) {
        return fallback;
    }
    return JsonUtils::getScalar(section, key, "epidemic_params");
}

} // namespace

const std::string& VaccinationEngineVariant::getId() const {
    return constants::VACCINATION_ENGINE_ID;
}

const std::vector<std::string>& VaccinationEngineVariant::getRequiredSections() const {
    static const std::vector<std::string> sections = {
        "simulation", "data", "epidemic_params", "population_params", "NPI", "vaccination"
    };
    return sections;
}

const std::vector<std::string>& VaccinationEngineVariant::getVaccinationLabels() const {
    static const std::vector<std::string> labels(constants::VACCINATION_LABELS.begin(),
                                                 constants::VACCINATION_LABELS.end());
    return labels;
}

std::vector<std::string> VaccinationEngineVariant::getInitialConditionDimensions() const {
    return {"G", "M", "V", "epi_states"};
}

std::vector<size_t> VaccinationEngineVariant::getInitialConditionShape(int G, int M) const {
    return {static_cast<size_t>(G), static_cast<size_t>(M),
            static_cast<size_t>(constants::NUM_VACCINATION_STATUSES),
            static_cast<size_t>(constants::NUM_COMPARTMENTS)};
}

PopulationParams VaccinationEngineVariant::buildPopulationParams(const SimulationConfig& config,
                                                                 const TabularDataLoader& loader,
                                                                 Logger& logger) const {
    return ParameterBuilder::loadPopulationParams(config, loader, logger);
}

EpidemicParams VaccinationEngineVariant::buildEpidemicParams(const SimulationConfig& config,
                                                             const PopulationParams& population,
                                                             int T, Logger& logger) const {
    const nlohmann::json& section = config.section("epidemic_params");
    const int V = constants::NUM_VACCINATION_STATUSES;

    EpidemicParams params = ParameterBuilder::buildEpidemicParams(section, population.G, population.M, T, V);

    params.Lambda = JsonUtils::getVector(section, "Λ", V, "epidemic_params");
    params.Gamma = JsonUtils::getVector(section, "Γ", V, "epidemic_params");
    params.r_v = JsonUtils::getVector(section, "rᵥ", V, "epidemic_params");
    params.k_v = JsonUtils::getVector(section, "kᵥ", V, "epidemic_params");

    params.risk_reduction_dd = optionalScalar(section, "risk_reduction_dd", 0.0);
    params.risk_reduction_h = optionalScalar(section, "risk_reduction_h", 0.0);
    params.risk_reduction_d = optionalScalar(section, "risk_reduction_d", 0.0);

    // Column 0 is the non-vaccinated status; every other status gets the reduced risks.
    for (int v = 1; v < V; ++v) {
        params.theta.col(v) *= (1.0 - params.risk_reduction_dd);
        params.gamma.col(v) *= (1.0 - params.risk_reduction_h);
        params.omega.col(v) *= (1.0 - params.risk_reduction_d);
    }

    logger.debug("VaccinationEngineVariant::buildEpidemicParams",
                 "βᴵ = " + std::to_string(params.beta_I) + ", βᴬ = " + std::to_string(params.beta_A) +
                 ", V = " + std::to_string(V) + ", T = " + std::to_string(T));
    return params;
}

std::optional<VaccinationParams> VaccinationEngineVariant::buildVaccinationParams(const SimulationConfig& config,
                                                                                  const PopulationParams& population,
                                                                                  int T) const {
    return ParameterBuilder::buildVaccinationParams(config.section("vaccination"), population, T);
}

void VaccinationEngineVariant::setInitialCompartments(EpidemicParams& epidemic,
                                                      const PopulationParams& population,
                                                      const NdArray& counts) const {
    const std::vector<size_t> expected = getInitialConditionShape(population.G, population.M);
    if (counts.shape != expected) {
        NdArray reference(expected);
        throw InitialConditionShapeException("VaccinationEngineVariant::setInitialCompartments",
            "expected " + reference.shapeString() + " (G, M, V, compartments) but got " + counts.shapeString());
    }

    for (int c = 0; c < constants::NUM_COMPARTMENTS; ++c) {
        CompartmentArray& rho = epidemic.rho[static_cast<size_t>(c)];
        for (int g = 0; g < population.G; ++g) {
            for (int m = 0; m < population.M; ++m) {
                for (int v = 0; v < constants::NUM_VACCINATION_STATUSES; ++v) {
                    const double count = counts.at({static_cast<size_t>(g), static_cast<size_t>(m),
                                                    static_cast<size_t>(v), static_cast<size_t>(c)});
                    rho(g, m, 0, v) = countToDensity(count, population.n(g, m));
                }
            }
        }
    }
}

NdArray VaccinationEngineVariant::layoutInitialCondition(const Eigen::MatrixXd& susceptible,
                                                         const Eigen::MatrixXd& asymptomatic) const {
    const size_t G = static_cast<size_t>(susceptible.rows());
    const size_t M = static_cast<size_t>(susceptible.cols());
    NdArray array(getInitialConditionShape(static_cast<int>(G), static_cast<int>(M)));
    const size_t sIdx = static_cast<size_t>(compartmentIndex(Compartment::S));
    const size_t aIdx = static_cast<size_t>(compartmentIndex(Compartment::A));
    for (size_t g = 0; g < G; ++g) {
        for (size_t m = 0; m < M; ++m) {
            array.at({g, m, 0, sIdx}) = susceptible(static_cast<Eigen::Index>(g), static_cast<Eigen::Index>(m));
            array.at({g, m, 0, aIdx}) = asymptomatic(static_cast<Eigen::Index>(g), static_cast<Eigen::Index>(m));
        }
    }
    return array;
}

} // namespace episim
