#ifndef EPISIM_TEST_HELPERS_HPP
#define EPISIM_TEST_HELPERS_HPP

#include <filesystem>
#include <sstream>
#include <string>
#include <vector>
#include <Eigen/Dense>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "io/TabularDataLoader.hpp"
#include "model/interfaces/ISpreadingEngine.hpp"
#include "model/parameters/EpidemicParams.hpp"
#include "model/parameters/PopulationParams.hpp"
#include "utils/Logger.hpp"

namespace episim {
namespace test {

/**
 * @brief Fixture owning a scratch directory and a logger writing to a string.
 */
class TempDirTest : public ::testing::Test {
protected:
    std::filesystem::path tempDir;
    std::ostringstream logStream;
    Logger logger{LogLevel::DEBUG, logStream};

    void SetUp() override;
    void TearDown() override;

    /// Absolute path of @p name inside the scratch directory.
    std::string path(const std::string& name) const;
    /// Whether a message containing @p fragment was logged.
    bool logged(const std::string& fragment) const;
};

/// Writes @p content to @p path, replacing the file.
void writeText(const std::string& path, const std::string& content);

/// Metapopulation CSV with columns id, area, <labels...>, total (declared total = column sum).
void writeMetapopulation(const std::string& path,
                         const std::vector<std::string>& labels,
                         const Eigen::MatrixXd& populationByAge);

/// Mobility CSV with header source_idx,target_idx,ratio.
void writeMobility(const std::string& path, const std::vector<MobilityEdge>& edges);

/// Seed CSV with header idx,seed.
void writeSeeds(const std::string& path, const std::vector<SeedEntry>& seeds);

/**
 * @brief Complete configuration for G age groups.
 *
 * Data file names are metapopulation_data.csv, R_mobility_matrix.csv and
 * seeds.csv; no initial-condition file is declared. Start 2020-03-01.
 */
nlohmann::json makeConfig(const std::string& engineId, int G, const std::string& endDate = "2020-03-05");

/**
 * @brief Writes the metapopulation, mobility and seed tables a makeConfig() config refers to.
 */
void writeDataFolder(const std::string& folder,
                     const std::vector<std::string>& labels,
                     const Eigen::MatrixXd& populationByAge,
                     const std::vector<SeedEntry>& seeds);

/**
 * @brief Population with labels Y0.., ids p1.. and counts @p n (G x M); no edges.
 */
PopulationParams makePopulation(const Eigen::MatrixXd& n);

/**
 * @brief Epidemic parameters with the makeConfig() rates and zeroed densities of shape (G, M, T, V).
 */
EpidemicParams makeEpidemic(int G, int M, int T, int V);

/// Engine that always fails.
class ThrowingSpreadingEngine : public ISpreadingEngine {
public:
    std::string getName() const override { return "throwing"; }
    void run(const PopulationParams&, EpidemicParams&, const NpiSchedule&, const VaccinationParams*) override;
};

/// Engine that moves a fixed fraction of S into D at every step, conserving mass.
class DecaySpreadingEngine : public ISpreadingEngine {
public:
    explicit DecaySpreadingEngine(double rate) : rate_(rate) {}
    std::string getName() const override { return "decay"; }
    void run(const PopulationParams&, EpidemicParams& epidemic, const NpiSchedule&, const VaccinationParams*) override;

private:
    double rate_;
};

} // namespace test
} // namespace episim

#endif // EPISIM_TEST_HELPERS_HPP
