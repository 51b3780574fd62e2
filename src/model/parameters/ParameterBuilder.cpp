#include "model/parameters/ParameterBuilder.hpp"
#include "utils/JsonUtils.hpp"
#include "utils/DateUtils.hpp"
#include "exceptions/Exceptions.hpp"
#include <algorithm>
#include <cmath>

namespace episim {

using nlohmann::json;

namespace {

std::vector<int> toSteps(const Eigen::VectorXd& values, const std::string& key) {
    std::vector<int> steps;
    steps.reserve(static_cast<size_t>(values.size()));
    for (Eigen::Index i = 0; i < values.size(); ++i) {
        if (std::floor(values(i)) != values(i)) {
            THROW_NPI_ERROR("ParameterBuilder::buildNpiSchedule",
                key + "[" + std::to_string(i) + "] = " + std::to_string(values(i)) + " is not an integer step");
        }
        steps.push_back(static_cast<int>(values(i)));
    }
    return steps;
}

std::vector<double> toStd(const Eigen::VectorXd& v) {
    return std::vector<double>(v.data(), v.data() + v.size());
}

Eigen::MatrixXd perStatus(const Eigen::VectorXd& perAge, int V) {
    return perAge.replicate(1, V);
}

} // namespace

std::string ParameterBuilder::requireDataFilename(const SimulationConfig& config, const std::string& key) {
    std::optional<std::string> filename = config.dataFilename(key);
    if (!filename) {
        throw MissingParameterException("ParameterBuilder::requireDataFilename", "data." + key,
                                        "no file name declared");
    }
    return *filename;
}

PopulationParams ParameterBuilder::loadPopulationParams(const SimulationConfig& config,
                                                        const TabularDataLoader& loader,
                                                        Logger& logger) {
    const json& populationSection = config.section("population_params");
    const std::vector<std::string> labels = readAgeLabels(populationSection);

    MetapopulationTable table = loader.loadMetapopulation(
        requireDataFilename(config, "metapopulation_data_filename"), labels);
    std::vector<MobilityEdge> edges = loader.loadMobilityEdges(
        requireDataFilename(config, "mobility_matrix_filename"));

    return buildPopulationParams(populationSection, table, edges, logger);
}

std::vector<std::string> ParameterBuilder::readAgeLabels(const json& populationSection) {
    std::vector<std::string> labels = JsonUtils::getStringArray(populationSection, "G_labels", "population_params");
    if (labels.empty()) {
        THROW_INVALID_PARAM("ParameterBuilder::readAgeLabels", "population_params.G_labels must not be empty");
    }
    return labels;
}

size_t ParameterBuilder::dropSelfLoops(std::vector<MobilityEdge>& edges) {
    const size_t before = edges.size();
    edges.erase(std::remove_if(edges.begin(), edges.end(),
                               [](const MobilityEdge& e) { return e.origin == e.destination; }),
                edges.end());
    return before - edges.size();
}

PopulationParams ParameterBuilder::buildPopulationParams(const json& populationSection,
                                                         const MetapopulationTable& table,
                                                         const std::vector<MobilityEdge>& edges,
                                                         Logger& logger) {
    const std::string funcName = "ParameterBuilder::buildPopulationParams";
    const std::string section = "population_params";

    PopulationParams population;
    population.ageLabels = readAgeLabels(populationSection);
    population.patchIds = table.ids;
    population.G = static_cast<int>(population.ageLabels.size());
    population.M = static_cast<int>(table.ids.size());
    const int G = population.G;
    const int M = population.M;

    if (M == 0) {
        THROW_INVALID_PARAM(funcName, "metapopulation table has no patches");
    }
    if (table.populationByAge.rows() != G || table.populationByAge.cols() != M) {
        THROW_INVALID_PARAM(funcName, "metapopulation table does not have one column per age label");
    }

    population.n = table.populationByAge.array().round().max(0.0).matrix();
    if ((table.populationByAge.array() < 0.0).any()) {
        logger.warning(funcName, "Negative population counts in the metapopulation table were clamped to 0");
    }

    const Eigen::VectorXd totals = population.patchTotals();
    for (int m = 0; m < M; ++m) {
        if (std::fabs(totals(m) - table.total(m)) > 0.5 * G) {
            logger.warning(funcName, "Patch '" + table.ids[static_cast<size_t>(m)] + "': age columns sum to " +
                                     std::to_string(totals(m)) + " but declared total is " + std::to_string(table.total(m)));
        }
    }

    population.area = table.area;
    population.C = JsonUtils::getMatrix(populationSection, "C", G, G, section);
    population.k = JsonUtils::getVector(populationSection, "kᵍ", G, section);
    population.k_h = JsonUtils::getVector(populationSection, "kᵍ_h", G, section);
    population.k_w = JsonUtils::getVector(populationSection, "kᵍ_w", G, section);
    population.p = JsonUtils::getVector(populationSection, "pᵍ", G, section);
    population.xi = JsonUtils::getScalar(populationSection, "ξ", section);
    population.sigma = JsonUtils::getScalar(populationSection, "σ", section);

    population.edges = edges;
    for (const auto& edge : population.edges) {
        if (edge.origin < 0 || edge.origin >= M || edge.destination < 0 || edge.destination >= M) {
            throw TabularSchemaException(TabularSchemaException::ErrorType::InvalidIndex, funcName,
                "mobility edge " + std::to_string(edge.origin) + " -> " + std::to_string(edge.destination) +
                " references a patch outside [0, " + std::to_string(M) + ")");
        }
    }
    const size_t removed = dropSelfLoops(population.edges);
    if (removed > 0) {
        logger.debug(funcName, "Dropped " + std::to_string(removed) + " self-loop mobility edges");
    }

    logger.info(funcName, "Population: G = " + std::to_string(G) + ", M = " + std::to_string(M) +
                          ", total = " + std::to_string(population.totalPopulation()) +
                          ", edges = " + std::to_string(population.edges.size()));
    return population;
}

EpidemicParams ParameterBuilder::buildEpidemicParams(const json& epidemicSection, int G, int M, int T, int V) {
    const std::string funcName = "ParameterBuilder::buildEpidemicParams";
    const std::string section = "epidemic_params";

    if (G <= 0 || M <= 0 || T <= 0 || V <= 0) {
        THROW_INVALID_PARAM(funcName, "G, M, T and V must be positive");
    }

    EpidemicParams params;
    params.G = G;
    params.M = M;
    params.T = T;
    params.V = V;

    params.beta_I = JsonUtils::getScalar(epidemicSection, "βᴵ", section);
    if (epidemicSection.contains("βᴬ")) {
        params.beta_A = JsonUtils::getScalar(epidemicSection, "βᴬ", section);
    } else if (epidemicSection.contains("scale_β")) {
        params.beta_A = JsonUtils::getScalar(epidemicSection, "scale_β", section) * params.beta_I;
    } else {
        throw MissingParameterException(funcName, "βᴬ", "provide either βᴬ or scale_β in epidemic_params");
    }

    params.eta = perStatus(JsonUtils::getVector(epidemicSection, "ηᵍ", G, section), V);
    params.alpha = perStatus(JsonUtils::getVector(epidemicSection, "αᵍ", G, section), V);
    params.mu = perStatus(JsonUtils::getVector(epidemicSection, "μᵍ", G, section), V);
    params.theta = perStatus(JsonUtils::getVector(epidemicSection, "θᵍ", G, section), V);
    params.gamma = perStatus(JsonUtils::getVector(epidemicSection, "γᵍ", G, section), V);
    params.zeta = perStatus(JsonUtils::getVector(epidemicSection, "ζᵍ", G, section), V);
    params.lambda = perStatus(JsonUtils::getVector(epidemicSection, "λᵍ", G, section), V);
    params.omega = perStatus(JsonUtils::getVector(epidemicSection, "ωᵍ", G, section), V);
    params.psi = perStatus(JsonUtils::getVector(epidemicSection, "ψᵍ", G, section), V);
    params.chi = perStatus(JsonUtils::getVector(epidemicSection, "χᵍ", G, section), V);

    params.resetCompartments();
    return params;
}

NpiSchedule ParameterBuilder::buildNpiSchedule(const json& npiSection,
                                               const std::optional<std::vector<MobilityReduction>>& reductions,
                                               const boost::gregorian::date& startDate,
                                               int T, Logger& logger) {
    const std::string funcName = "ParameterBuilder::buildNpiSchedule";
    const std::string section = "NPI";

    if (npiSection.contains("are_there_npi") && npiSection.at("are_there_npi").is_boolean() &&
        !npiSection.at("are_there_npi").get<bool>()) {
        logger.info(funcName, "NPIs disabled (are_there_npi = false)");
        return NpiSchedule();
    }

    if (reductions) {
        // The series replaces κ₀s and tᶜs; ϕ and δ come from the first configured entry.
        auto firstOr = [&](const std::string& key, double fallback) {
            if (!npiSection.contains(key)) {
                return fallback;
            }
            const Eigen::VectorXd values = JsonUtils::getVector(npiSection, key, -1, section);
            return values.size() > 0 ? values(0) : fallback;
        };
        const double phi = firstOr("ϕs", 1.0);
        const double delta = firstOr("δs", 0.0);

        std::vector<int> steps;
        std::vector<double> kappa0s;
        for (const auto& row : *reductions) {
            const int step = DateUtils::daysBetween(startDate, row.date) + 1;
            if (step < 1 || step > T) {
                continue;
            }
            steps.push_back(step);
            kappa0s.push_back(row.reduction);
        }
        if (steps.empty()) {
            logger.warning(funcName, "No mobility reduction falls inside the simulated period; no NPI applied");
        } else {
            logger.info(funcName, "Using " + std::to_string(steps.size()) + " daily mobility reductions as NPI change-points");
        }
        return NpiSchedule(steps, kappa0s,
                           std::vector<double>(steps.size(), phi),
                           std::vector<double>(steps.size(), delta));
    }

    const Eigen::VectorXd tcs = JsonUtils::getVector(npiSection, "tᶜs", -1, section);
    const Eigen::VectorXd kappa0s = JsonUtils::getVector(npiSection, "κ₀s", -1, section);
    const Eigen::VectorXd phis = JsonUtils::getVector(npiSection, "ϕs", -1, section);
    const Eigen::VectorXd deltas = JsonUtils::getVector(npiSection, "δs", -1, section);

    NpiSchedule schedule(toSteps(tcs, "tᶜs"), toStd(kappa0s), toStd(phis), toStd(deltas));
    logger.debug(funcName, "NPI schedule with " + std::to_string(schedule.size()) + " change-points");
    return schedule;
}

VaccinationParams ParameterBuilder::buildVaccinationParams(const json& vaccinationSection,
                                                           const PopulationParams& population, int T) {
    const std::string funcName = "ParameterBuilder::buildVaccinationParams";
    const std::string section = "vaccination";

    const double start = JsonUtils::getScalar(vaccinationSection, "start_vacc", section);
    const double duration = JsonUtils::getScalar(vaccinationSection, "dur_vacc", section);
    if (std::floor(start) != start || std::floor(duration) != duration || duration < 0) {
        THROW_INVALID_PARAM(funcName, "start_vacc and dur_vacc must be non-negative whole days");
    }
    const Eigen::VectorXd epsilon = JsonUtils::getVector(vaccinationSection, "ϵᵍ", population.G, section);
    const double percentage = JsonUtils::getScalar(vaccinationSection, "percentage_of_vacc_per_day", section);

    if (!vaccinationSection.contains("are_there_vaccines")) {
        throw MissingParameterException(funcName, "vaccination.are_there_vaccines", "key not found in section 'vaccination'");
    }
    const json& flag = vaccinationSection.at("are_there_vaccines");
    bool enabled = false;
    if (flag.is_boolean()) {
        enabled = flag.get<bool>();
    } else if (flag.is_number()) {
        enabled = flag.get<double>() != 0.0;
    } else {
        THROW_INVALID_PARAM(funcName, "vaccination.are_there_vaccines must be a boolean");
    }

    VaccinationParams vaccination;
    const int startStep = static_cast<int>(start);
    vaccination.changeSteps = {startStep, startStep + static_cast<int>(duration), T};

    const Eigen::VectorXd perDay = epsilon * std::round(population.totalPopulation() * percentage);
    vaccination.dailyDoses = Eigen::MatrixXd::Zero(population.G, 3);
    if (enabled) {
        vaccination.dailyDoses.col(1) = perDay;
    }
    return vaccination;
}

} // namespace episim
