#include "TestHelpers.hpp"
#include "model/ModelConstants.hpp"
#include "model/parameters/ParameterBuilder.hpp"
#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace episim {
namespace test {

namespace fs = std::filesystem;
using nlohmann::json;

void TempDirTest::SetUp() {
    const ::testing::TestInfo* info = ::testing::UnitTest::GetInstance()->current_test_info();
    std::string name = "episim_" + std::string(info->test_suite_name()) + "_" + std::string(info->name());
    std::replace(name.begin(), name.end(), '/', '_');
    tempDir = fs::temp_directory_path() / name;
    fs::remove_all(tempDir);
    fs::create_directories(tempDir);
}

void TempDirTest::TearDown() {
    std::error_code ec;
    fs::remove_all(tempDir, ec);
}

std::string TempDirTest::path(const std::string& name) const {
    return (tempDir / name).string();
}

bool TempDirTest::logged(const std::string& fragment) const {
    return logStream.str().find(fragment) != std::string::npos;
}

void writeText(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::trunc);
    out << content;
}

void writeMetapopulation(const std::string& path,
                         const std::vector<std::string>& labels,
                         const Eigen::MatrixXd& populationByAge) {
    std::ofstream out(path, std::ios::trunc);
    out << "id,area";
    for (const auto& label : labels) out << "," << label;
    out << ",total\n";
    for (Eigen::Index m = 0; m < populationByAge.cols(); ++m) {
        out << "p" << (m + 1) << ",1.0";
        for (Eigen::Index g = 0; g < populationByAge.rows(); ++g) {
            out << "," << populationByAge(g, m);
        }
        out << "," << populationByAge.col(m).sum() << "\n";
    }
}

void writeMobility(const std::string& path, const std::vector<MobilityEdge>& edges) {
    std::ofstream out(path, std::ios::trunc);
    out << "source_idx,target_idx,ratio\n";
    for (const auto& e : edges) {
        out << e.origin << "," << e.destination << "," << e.weight << "\n";
    }
}

void writeSeeds(const std::string& path, const std::vector<SeedEntry>& seeds) {
    std::ofstream out(path, std::ios::trunc);
    out << "name,idx,seed\n";
    for (const auto& s : seeds) {
        out << "p" << (s.patch + 1) << "," << s.patch << "," << s.seed << "\n";
    }
}

json makeConfig(const std::string& engineId, int G, const std::string& endDate) {
    std::vector<std::string> labels;
    for (int g = 0; g < G; ++g) labels.push_back("Y" + std::to_string(g));
    json contacts = json::array();
    for (int g = 0; g < G; ++g) contacts.push_back(std::vector<double>(static_cast<size_t>(G), 1.0 / G));

    json config = {
        {"simulation", {
            {"engine", engineId},
            {"start_date", "2020-03-01"},
            {"end_date", endDate},
            {"save_full_output", true},
            {"save_observables", true},
            {"output_format", "netcdf"},
            {"init_format", "netcdf"},
            {"output_folder", "output"}
        }},
        {"data", {
            {"metapopulation_data_filename", "metapopulation_data.csv"},
            {"mobility_matrix_filename", "R_mobility_matrix.csv"},
            {"seeds_filename", "seeds.csv"}
        }},
        {"epidemic_params", {
            {"βᴵ", 0.09}, {"βᴬ", 0.045},
            {"ηᵍ", 0.275}, {"αᵍ", 0.65}, {"μᵍ", 0.3}, {"θᵍ", 0.1},
            {"γᵍ", 0.03}, {"ζᵍ", 0.12}, {"λᵍ", 0.275}, {"ωᵍ", 0.1},
            {"ψᵍ", 0.14}, {"χᵍ", 0.047}
        }},
        {"population_params", {
            {"G_labels", labels},
            {"C", contacts},
            {"kᵍ", 10.0}, {"kᵍ_h", 3.0}, {"kᵍ_w", 1.0}, {"pᵍ", 1.0},
            {"ξ", 0.01}, {"σ", 2.5}
        }},
        {"NPI", {
            {"κ₀s", json::array({0.8})},
            {"ϕs", json::array({0.2})},
            {"δs", json::array({0.8})},
            {"tᶜs", json::array({2})},
            {"are_there_npi", true}
        }}
    };

    if (engineId == constants::VACCINATION_ENGINE_ID) {
        config["epidemic_params"]["Λ"] = json::array({0.0, 0.02, 0.02});
        config["epidemic_params"]["Γ"] = json::array({0.0, 0.01, 0.01});
        config["epidemic_params"]["rᵥ"] = json::array({1.0, 0.2, 0.5});
        config["epidemic_params"]["kᵥ"] = json::array({1.0, 0.4, 0.6});
        config["vaccination"] = {
            {"start_vacc", 2},
            {"dur_vacc", 2},
            {"ϵᵍ", std::vector<double>(static_cast<size_t>(G), 1.0 / G)},
            {"percentage_of_vacc_per_day", 0.01},
            {"are_there_vaccines", true}
        };
    }
    if (G != 3) {
        config["population_params"]["seed_age_fractions"] = std::vector<double>(static_cast<size_t>(G), 1.0 / G);
    }
    return config;
}

void writeDataFolder(const std::string& folder,
                     const std::vector<std::string>& labels,
                     const Eigen::MatrixXd& populationByAge,
                     const std::vector<SeedEntry>& seeds) {
    fs::create_directories(folder);
    writeMetapopulation((fs::path(folder) / "metapopulation_data.csv").string(), labels, populationByAge);
    std::vector<MobilityEdge> edges;
    for (int m = 0; m + 1 < populationByAge.cols(); ++m) {
        edges.push_back({m, m + 1, 0.1});
    }
    writeMobility((fs::path(folder) / "R_mobility_matrix.csv").string(), edges);
    writeSeeds((fs::path(folder) / "seeds.csv").string(), seeds);
}

PopulationParams makePopulation(const Eigen::MatrixXd& n) {
    const int G = static_cast<int>(n.rows());
    const int M = static_cast<int>(n.cols());
    PopulationParams population;
    population.G = G;
    population.M = M;
    for (int g = 0; g < G; ++g) population.ageLabels.push_back("Y" + std::to_string(g));
    for (int m = 0; m < M; ++m) population.patchIds.push_back("p" + std::to_string(m + 1));
    population.n = n;
    population.area = Eigen::VectorXd::Ones(M);
    population.C = Eigen::MatrixXd::Constant(G, G, 1.0 / G);
    population.k = Eigen::VectorXd::Constant(G, 10.0);
    population.k_h = Eigen::VectorXd::Constant(G, 3.0);
    population.k_w = Eigen::VectorXd::Constant(G, 1.0);
    population.p = Eigen::VectorXd::Ones(G);
    population.xi = 0.01;
    population.sigma = 2.5;
    return population;
}

EpidemicParams makeEpidemic(int G, int M, int T, int V) {
    const json config = makeConfig(constants::BASIC_ENGINE_ID, G);
    return ParameterBuilder::buildEpidemicParams(config.at("epidemic_params"), G, M, T, V);
}

void ThrowingSpreadingEngine::run(const PopulationParams&, EpidemicParams&, const NpiSchedule&,
                                  const VaccinationParams*) {
    throw std::runtime_error("integration diverged");
}

void DecaySpreadingEngine::run(const PopulationParams&, EpidemicParams& epidemic, const NpiSchedule&,
                               const VaccinationParams*) {
    CompartmentArray& S = epidemic.density(Compartment::S);
    CompartmentArray& D = epidemic.density(Compartment::D);
    for (int t = 1; t < epidemic.T; ++t) {
        for (auto& rho : epidemic.rho) {
            for (int g = 0; g < epidemic.G; ++g)
                for (int m = 0; m < epidemic.M; ++m)
                    for (int v = 0; v < epidemic.V; ++v)
                        rho(g, m, t, v) = rho(g, m, t - 1, v);
        }
        for (int g = 0; g < epidemic.G; ++g) {
            for (int m = 0; m < epidemic.M; ++m) {
                for (int v = 0; v < epidemic.V; ++v) {
                    const double moved = S(g, m, t, v) * rate_;
                    S(g, m, t, v) -= moved;
                    D(g, m, t, v) += moved;
                }
            }
        }
    }
}

} // namespace test
} // namespace episim
