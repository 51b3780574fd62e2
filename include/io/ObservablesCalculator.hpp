#ifndef OBSERVABLES_CALCULATOR_HPP
#define OBSERVABLES_CALCULATOR_HPP

#include <unsupported/Eigen/CXX11/Tensor>
#include "io/CompartmentState.hpp"
#include "model/parameters/EpidemicParams.hpp"

namespace episim {

/// Daily series shaped (G, M, T).
using ObservableArray = Eigen::Tensor<double, 3, Eigen::RowMajor>;

/**
 * @brief Daily flows derived from a finished run, summed over vaccination status.
 */
struct Observables {
    ObservableArray newInfected;       ///< A x α
    ObservableArray newHospitalized;   ///< I x μ x (1 - θ) x γ
    ObservableArray newDeaths;         ///< D[t] - D[t-1], zero at the first step
};

/**
 * @class ObservablesCalculator
 * @brief Computes reporting observables from compartment counts and transition rates.
 */
class ObservablesCalculator {
public:
    /**
     * @brief Computes all three observables.
     * @throws InvalidParameterException If the rate matrices are not G x V.
     */
    static Observables compute(const CompartmentState& state, const EpidemicParams& epidemic);

    static ObservableArray newInfected(const CompartmentState& state, const EpidemicParams& epidemic);
    static ObservableArray newHospitalized(const CompartmentState& state, const EpidemicParams& epidemic);
    static ObservableArray newDeaths(const CompartmentState& state);

private:
    static void checkRates(const CompartmentState& state, const EpidemicParams& epidemic);
};

} // namespace episim

#endif // OBSERVABLES_CALCULATOR_HPP
