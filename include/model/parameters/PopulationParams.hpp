#ifndef POPULATION_PARAMS_HPP
#define POPULATION_PARAMS_HPP

#include <string>
#include <vector>
#include <Eigen/Dense>
#include "io/TabularDataLoader.hpp"

namespace episim {

/**
 * @brief Structure holding the demographic and mobility description of a metapopulation.
 *
 * Built once per run from the metapopulation table, the mobility edge list and
 * the `population_params` config section.
 */
struct PopulationParams {
    /** @brief Number of age strata (G). */
    int G = 0;
    /** @brief Number of patches (M). */
    int M = 0;

    /** @brief Age stratum labels (G). */
    std::vector<std::string> ageLabels;
    /** @brief Patch identifiers (M). */
    std::vector<std::string> patchIds;

    /** @brief Rounded, non-negative population counts, age x patch (G x M). */
    Eigen::MatrixXd n;
    /** @brief Patch surface (M). */
    Eigen::VectorXd area;

    /** @brief Age contact matrix (G x G). */
    Eigen::MatrixXd C;
    /** @brief Average number of contacts per age stratum (G). */
    Eigen::VectorXd k;
    /** @brief Average number of household contacts per age stratum (G). */
    Eigen::VectorXd k_h;
    /** @brief Average number of work contacts per age stratum (G). */
    Eigen::VectorXd k_w;
    /** @brief Degree of mobility per age stratum (G). */
    Eigen::VectorXd p;

    /** @brief Directed cross-patch mobility edges. Contains no self-loops. */
    std::vector<MobilityEdge> edges;

    /** @brief Density factor. */
    double xi = 0.0;
    /** @brief Average household size. */
    double sigma = 0.0;

    /** @brief Sum of all counts. */
    double totalPopulation() const;

    /** @brief Per-patch sums over age strata (M). */
    Eigen::VectorXd patchTotals() const;

    /**
     * @brief Checks dimensions and non-negativity.
     * @return true if all members agree with G and M.
     */
    bool validate() const;
};

} // namespace episim

#endif // POPULATION_PARAMS_HPP
