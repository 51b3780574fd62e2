#include "config/ConfigTemplate.hpp"
#include "utils/FileUtils.hpp"
#include "utils/JsonUtils.hpp"
#include "exceptions/Exceptions.hpp"
#include <fstream>

namespace episim {

using nlohmann::json;

const std::string ConfigTemplate::CONFIG_FILENAME = "config.json";
const std::string ConfigTemplate::METAPOPULATION_FILENAME = "metapopulation_data.csv";
const std::string ConfigTemplate::MOBILITY_FILENAME = "R_mobility_matrix.csv";

namespace {

json constant(int size, double value) {
    return json(std::vector<double>(static_cast<size_t>(size), value));
}

} // namespace

json ConfigTemplate::create(const IEngineVariant& variant, int M, int G) {
    if (M <= 0 || G <= 0) {
        THROW_INVALID_PARAM("ConfigTemplate::create", "number of patches and age groups must be positive");
    }

    json config = json::object();

    config["simulation"] = {
        {"engine", variant.getId()},
        {"start_date", "2020-01-01"},
        {"end_date", "2020-02-15"},
        {"save_full_output", true},
        {"save_observables", false},
        {"save_time_step", nullptr},
        {"output_folder", constants::DEFAULT_OUTPUT_FOLDER},
        {"output_format", constants::DEFAULT_OUTPUT_FORMAT},
        {"init_format", constants::DEFAULT_OUTPUT_FORMAT}
    };

    config["data"] = {
        {"initial_condition_filename", "initial_conditions.nc"},
        {"metapopulation_data_filename", METAPOPULATION_FILENAME},
        {"mobility_matrix_filename", MOBILITY_FILENAME}
    };

    json epidemic = {
        {"scale_β", 0.5},
        {"βᴬ", 0.05},
        {"βᴵ", 0.09},
        {"ηᵍ", constant(G, 0.275)},
        {"αᵍ", constant(G, 0.65)},
        {"μᵍ", constant(G, 0.3)},
        {"θᵍ", constant(G, 0.0)},
        {"γᵍ", constant(G, 0.03)},
        {"ζᵍ", constant(G, 0.12)},
        {"λᵍ", constant(G, 0.275)},
        {"ωᵍ", constant(G, 0.1)},
        {"ψᵍ", constant(G, 0.14)},
        {"χᵍ", constant(G, 0.047)}
    };

    std::vector<std::string> labels;
    for (int g = 1; g <= G; ++g) {
        labels.push_back("G" + std::to_string(g));
    }
    json contacts = json::array();
    for (int g = 0; g < G; ++g) {
        contacts.push_back(constant(G, 1.0 / G));
    }
    config["population_params"] = {
        {"G_labels", labels},
        {"C", contacts},
        {"kᵍ", constant(G, 10.0)},
        {"kᵍ_h", constant(G, 3.0)},
        {"kᵍ_w", constant(G, 1.0)},
        {"pᵍ", constant(G, 1.0)},
        {"ξ", 0.01},
        {"σ", 2.5}
    };

    config["NPI"] = {
        {"κ₀s", json::array({0.0})},
        {"ϕs", json::array({1.0})},
        {"δs", json::array({0.0})},
        {"tᶜs", json::array({1})},
        {"are_there_npi", true}
    };

    if (variant.hasVaccinationAxis()) {
        const int V = variant.getNumVaccinationStatuses();
        epidemic["Λ"] = constant(V, 0.02);
        epidemic["Γ"] = constant(V, 0.01);
        epidemic["rᵥ"] = constant(V, 1.0);
        epidemic["kᵥ"] = constant(V, 1.0);
        epidemic["risk_reduction_dd"] = 0.0;
        epidemic["risk_reduction_h"] = 0.0;
        epidemic["risk_reduction_d"] = 0.0;

        config["vaccination"] = {
            {"start_vacc", 2},
            {"dur_vacc", 8},
            {"ϵᵍ", constant(G, 1.0 / G)},
            {"percentage_of_vacc_per_day", 0.005},
            {"are_there_vaccines", false}
        };
    }
    config["epidemic_params"] = epidemic;

    return config;
}

std::string ConfigTemplate::writeModel(const IEngineVariant& variant, int M, int G,
                                       const std::string& modelFolder, Logger& logger) {
    const std::string funcName = "ConfigTemplate::writeModel";
    const json config = create(variant, M, G);

    if (!FileUtils::ensureDirectoryExists(modelFolder)) {
        throw FileIOException(funcName, "Unable to create model folder: " + modelFolder);
    }

    const std::string configPath = FileUtils::joinPaths(modelFolder, CONFIG_FILENAME);
    logger.info(funcName, "Writing model definition (JSON): " + configPath);
    JsonUtils::writeJsonFile(configPath, config);

    const std::string metapopPath = FileUtils::joinPaths(modelFolder, METAPOPULATION_FILENAME);
    std::ofstream metapop(metapopPath);
    if (!metapop.is_open()) {
        throw FileIOException(funcName, "Unable to open file for writing: " + metapopPath);
    }
    const std::vector<std::string> labels = config["population_params"]["G_labels"].get<std::vector<std::string>>();
    metapop << "id,area";
    for (const auto& label : labels) {
        metapop << "," << label;
    }
    metapop << ",total\n";
    for (int m = 1; m <= M; ++m) {
        metapop << "p" << m << ",1";
        for (size_t g = 0; g < labels.size(); ++g) {
            metapop << ",1";
        }
        metapop << "," << G << "\n";
    }
    metapop.close();

    const std::string mobilityPath = FileUtils::joinPaths(modelFolder, MOBILITY_FILENAME);
    std::ofstream mobility(mobilityPath);
    if (!mobility.is_open()) {
        throw FileIOException(funcName, "Unable to open file for writing: " + mobilityPath);
    }
    mobility << "source_idx,target_idx,ratio\n";
    mobility.close();

    logger.info(funcName, "Created " + metapopPath + " and " + mobilityPath);
    return configPath;
}

} // namespace episim
