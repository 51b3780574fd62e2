#ifndef EPIDEMIC_PARAMS_HPP
#define EPIDEMIC_PARAMS_HPP

#include <array>
#include <cmath>
#include <Eigen/Dense>
#include <unsupported/Eigen/CXX11/Tensor>
#include "model/ModelConstants.hpp"

namespace episim {

/**
 * @brief Dense (age, patch, time, vaccination status) array.
 *
 * Row-major so that the memory layout matches the C order of the output files.
 */
using CompartmentArray = Eigen::Tensor<double, 4, Eigen::RowMajor>;

/**
 * @brief Fraction of the local population; 0 when the quotient is not finite.
 */
inline double countToDensity(double count, double population) {
    const double density = count / population;
    return std::isfinite(density) ? density : 0.0;
}

/**
 * @brief Transition rates and compartment densities of one run.
 *
 * Rates are stored per (age, vaccination status) as G x V matrices; the basic
 * engine uses V = 1. Densities are fractions of the local (age, patch)
 * population, one array per compartment, shaped (G, M, T, V).
 */
struct EpidemicParams {
    int G = 0;
    int M = 0;
    int T = 0;
    int V = 1;

    /** @brief Infectivity of symptomatic individuals. */
    double beta_I = 0.0;
    /** @brief Infectivity of asymptomatic individuals. */
    double beta_A = 0.0;

    /** @brief Exposed rate. */
    Eigen::MatrixXd eta;
    /** @brief Asymptomatic rate. */
    Eigen::MatrixXd alpha;
    /** @brief Infectious rate. */
    Eigen::MatrixXd mu;
    /** @brief Direct death probability. */
    Eigen::MatrixXd theta;
    /** @brief Hospitalization probability. */
    Eigen::MatrixXd gamma;
    /** @brief Pre-deceased rate. */
    Eigen::MatrixXd zeta;
    /** @brief Pre-hospitalized in ICU rate. */
    Eigen::MatrixXd lambda;
    /** @brief Fatality probability in ICU. */
    Eigen::MatrixXd omega;
    /** @brief Death rate in ICU. */
    Eigen::MatrixXd psi;
    /** @brief ICU discharge rate. */
    Eigen::MatrixXd chi;

    // Vaccination engine only (size V, empty otherwise).
    Eigen::VectorXd Lambda;   ///< Vaccine-induced immunity loss rate per status.
    Eigen::VectorXd Gamma;    ///< Natural immunity loss rate per status.
    Eigen::VectorXd r_v;      ///< Relative susceptibility per status.
    Eigen::VectorXd k_v;      ///< Relative transmissibility per status.
    double risk_reduction_dd = 0.0;
    double risk_reduction_h = 0.0;
    double risk_reduction_d = 0.0;

    /** @brief Density arrays indexed by Compartment. */
    std::array<CompartmentArray, constants::NUM_COMPARTMENTS> rho;

    /**
     * @brief Allocates zero-filled density arrays of shape (G, M, T, V).
     */
    void resetCompartments();

    CompartmentArray& density(Compartment c) { return rho[static_cast<size_t>(compartmentIndex(c))]; }
    const CompartmentArray& density(Compartment c) const { return rho[static_cast<size_t>(compartmentIndex(c))]; }

    /**
     * @brief Checks that every rate matrix is G x V and every density array is (G, M, T, V).
     */
    bool validate() const;
};

} // namespace episim

#endif // EPIDEMIC_PARAMS_HPP
