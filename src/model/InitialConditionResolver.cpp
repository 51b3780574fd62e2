#include "model/InitialConditionResolver.hpp"
#include "io/OutputFormatFactory.hpp"
#include "io/OutputSerializer.hpp"
#include "utils/FileUtils.hpp"
#include "utils/JsonUtils.hpp"
#include "exceptions/Exceptions.hpp"
#include <cmath>
#include <limits>
#include <numeric>

namespace episim {

InitialConditionResolver::InitialConditionResolver(const IEngineVariant& variant,
                                                   const TabularDataLoader& loader,
                                                   Logger& logger)
    : variant_(variant), loader_(loader), logger_(logger) {}

InitialConditionSelection InitialConditionResolver::select(const SimulationConfig& config,
                                                           const std::optional<std::string>& overridePath) const {
    const std::string funcName = "InitialConditionResolver::select";
    if (overridePath && !overridePath->empty()) {
        if (FileUtils::fileExists(*overridePath)) {
            return {InitialConditionSource::File, *overridePath};
        }
        logger_.warning(funcName, "Initial condition '" + *overridePath + "' not found, falling back to config");
    }

    if (std::optional<std::string> filename = config.dataFilename("initial_condition_filename")) {
        return {InitialConditionSource::File, loader_.resolve(*filename, "data.initial_condition_filename")};
    }
    if (std::optional<std::string> seeds = config.dataFilename("seeds_filename")) {
        return {InitialConditionSource::Seeds, loader_.resolve(*seeds, "data.seeds_filename")};
    }
    throw MissingParameterException(funcName, "data.initial_condition_filename",
                                    "no initial condition file and no seeds file declared");
}

InitialConditionSelection InitialConditionResolver::apply(const SimulationConfig& config,
                                                          const std::optional<std::string>& overridePath,
                                                          const PopulationParams& population,
                                                          EpidemicParams& epidemic) const {
    const std::string funcName = "InitialConditionResolver::apply";
    InitialConditionSelection selection = select(config, overridePath);

    NdArray counts;
    if (selection.source == InitialConditionSource::File) {
        logger_.info(funcName, "Reading initial conditions from: " + selection.path);
        counts = readInitialCondition(selection.path, config.initFormat());
    } else {
        logger_.info(funcName, "Synthesizing initial conditions from seeds: " + selection.path);
        std::vector<double> fractions = seedAgeFractions(config.section("population_params"), population.G);
        counts = synthesizeFromSeeds(loader_.loadSeeds(selection.path), population, fractions);
    }
    variant_.setInitialCompartments(epidemic, population, counts);
    return selection;
}

NdArray InitialConditionResolver::readInitialCondition(const std::string& path, const std::string& format) const {
    return OutputFormatFactory::create(format, logger_)->readArray(path, "data");
}

NdArray InitialConditionResolver::synthesizeFromSeeds(const std::vector<SeedEntry>& seeds,
                                                      const PopulationParams& population,
                                                      const std::vector<double>& fractions) const {
    const std::string funcName = "InitialConditionResolver::synthesizeFromSeeds";
    for (const auto& entry : seeds) {
        if (entry.patch < 0 || entry.patch >= population.M) {
            throw TabularSchemaException(TabularSchemaException::ErrorType::InvalidIndex, funcName,
                "seed patch index " + std::to_string(entry.patch) + " outside [0, " +
                std::to_string(population.M) + ")");
        }
    }

    SeedApportionment seeded = apportionSeeds(seeds, population.n, fractions, logger_);
    logger_.info(funcName, "Seeded " + std::to_string(seeded.asymptomatic.sum()) +
                 " individuals in compartment A, " + std::to_string(seeded.susceptible.sum()) + " remain in S");
    return variant_.layoutInitialCondition(seeded.susceptible, seeded.asymptomatic);
}

SeedApportionment InitialConditionResolver::apportionSeeds(const std::vector<SeedEntry>& seeds,
                                                           const Eigen::MatrixXd& population,
                                                           const std::vector<double>& fractions,
                                                           Logger& logger) {
    const std::string funcName = "InitialConditionResolver::apportionSeeds";
    const Eigen::Index G = population.rows();
    const Eigen::Index M = population.cols();
    if (static_cast<Eigen::Index>(fractions.size()) != G) {
        THROW_INVALID_PARAM(funcName, "expected " + std::to_string(G) + " seed age fractions, got " +
                            std::to_string(fractions.size()));
    }

    SeedApportionment result;
    result.asymptomatic = Eigen::MatrixXd::Zero(G, M);
    for (const auto& entry : seeds) {
        if (entry.patch < 0 || entry.patch >= M) {
            THROW_INVALID_PARAM(funcName, "seed patch index " + std::to_string(entry.patch) + " out of range");
        }
        if (entry.seed < 0.0 || !std::isfinite(entry.seed)) {
            THROW_INVALID_PARAM(funcName, "seed count at patch " + std::to_string(entry.patch) +
                                " must be finite and non-negative");
        }
        double assigned = 0.0;
        for (Eigen::Index g = 0; g + 1 < G; ++g) {
            const double share = fractions[static_cast<size_t>(g)] * entry.seed;
            result.asymptomatic(g, entry.patch) += share;
            assigned += share;
        }
        // The age-ordered sum of the shares must reproduce the seed exactly.
        double last = entry.seed - assigned;
        while (assigned + last != entry.seed) {
            const double towards = assigned + last < entry.seed ? std::numeric_limits<double>::infinity()
                                                                : -std::numeric_limits<double>::infinity();
            last = std::nextafter(last, towards);
        }
        result.asymptomatic(G - 1, entry.patch) += last;
    }

    result.susceptible = population - result.asymptomatic;
    const Eigen::Index negatives = (result.susceptible.array() < 0.0).count();
    if (negatives > 0) {
        logger.warning(funcName, std::to_string(negatives) +
                       " (age, patch) cells have more seeds than population; S clamped to 0");
        result.susceptible = result.susceptible.cwiseMax(0.0);
    }
    return result;
}

std::vector<double> InitialConditionResolver::seedAgeFractions(const nlohmann::json& populationSection, int G) {
    const std::string funcName = "InitialConditionResolver::seedAgeFractions";
    std::vector<double> fractions;
    if (populationSection.contains("seed_age_fractions")) {
        Eigen::VectorXd configured = JsonUtils::getVector(populationSection, "seed_age_fractions", -1, "population_params");
        fractions.assign(configured.data(), configured.data() + configured.size());
    } else {
        fractions.assign(constants::DEFAULT_SEED_AGE_FRACTIONS.begin(), constants::DEFAULT_SEED_AGE_FRACTIONS.end());
    }

    if (static_cast<int>(fractions.size()) != G) {
        THROW_INVALID_PARAM(funcName, "seed age fractions have " + std::to_string(fractions.size()) +
                            " entries but there are " + std::to_string(G) + " age groups");
    }
    for (double f : fractions) {
        if (f < 0.0 || !std::isfinite(f)) {
            THROW_INVALID_PARAM(funcName, "seed age fractions must be finite and non-negative");
        }
    }
    const double sum = std::accumulate(fractions.begin(), fractions.end(), 0.0);
    if (std::abs(sum - 1.0) > constants::NUMERICAL_EPSILON) {
        THROW_INVALID_PARAM(funcName, "seed age fractions sum to " + std::to_string(sum) + " instead of 1");
    }
    return fractions;
}

ArrayDataset InitialConditionResolver::buildInitialConditionDataset(const NdArray& counts,
                                                                    const PopulationParams& population) const {
    ArrayDataset dataset;
    const std::vector<std::string> dims = variant_.getInitialConditionDimensions();
    for (const auto& name : dims) {
        if (name == "G") {
            dataset.addDimension(OutputSerializer::ageDimension(population.ageLabels));
        } else if (name == "M") {
            dataset.addDimension(OutputSerializer::patchDimension(population.patchIds));
        } else if (name == "V") {
            dataset.addDimension(OutputSerializer::vaccinationDimension(variant_.getVaccinationLabels()));
        } else {
            dataset.addDimension(OutputSerializer::compartmentDimension(variant_.getInitialCompartmentCount()));
        }
    }
    dataset.addVariable(Variable{"data", dims, "Initial compartment counts", counts.values});
    return dataset;
}

void InitialConditionResolver::writeInitialCondition(const NdArray& counts, const PopulationParams& population,
                                                     const std::string& path, const std::string& format) const {
    logger_.info("InitialConditionResolver::writeInitialCondition", "Saving initial conditions in " + path);
    OutputFormatFactory::create(format, logger_)->write(path, buildInitialConditionDataset(counts, population));
}

} // namespace episim
