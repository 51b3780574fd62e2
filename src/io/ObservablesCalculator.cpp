#include "io/ObservablesCalculator.hpp"
#include "exceptions/Exceptions.hpp"

namespace episim {

Observables ObservablesCalculator::compute(const CompartmentState& state, const EpidemicParams& epidemic) {
    Observables observables;
    observables.newInfected = newInfected(state, epidemic);
    observables.newHospitalized = newHospitalized(state, epidemic);
    observables.newDeaths = newDeaths(state);
    return observables;
}

ObservableArray ObservablesCalculator::newInfected(const CompartmentState& state, const EpidemicParams& epidemic) {
    checkRates(state, epidemic);
    const int G = state.getNumAgeGroups();
    const int M = state.getNumPatches();
    const int T = state.getNumSteps();
    const int V = state.getNumVaccinationStatuses();
    const CompartmentArray& A = state.counts(Compartment::A);

    ObservableArray result(G, M, T);
    result.setZero();
    for (int g = 0; g < G; ++g) {
        for (int m = 0; m < M; ++m) {
            for (int t = 0; t < T; ++t) {
                for (int v = 0; v < V; ++v) {
                    result(g, m, t) += A(g, m, t, v) * epidemic.alpha(g, v);
                }
            }
        }
    }
    return result;
}

ObservableArray ObservablesCalculator::newHospitalized(const CompartmentState& state, const EpidemicParams& epidemic) {
    checkRates(state, epidemic);
    const int G = state.getNumAgeGroups();
    const int M = state.getNumPatches();
    const int T = state.getNumSteps();
    const int V = state.getNumVaccinationStatuses();
    const CompartmentArray& I = state.counts(Compartment::I);

    ObservableArray result(G, M, T);
    result.setZero();
    for (int g = 0; g < G; ++g) {
        for (int v = 0; v < V; ++v) {
            const double hospitalizationRate = epidemic.mu(g, v) * (1.0 - epidemic.theta(g, v)) * epidemic.gamma(g, v);
            for (int m = 0; m < M; ++m) {
                for (int t = 0; t < T; ++t) {
                    result(g, m, t) += I(g, m, t, v) * hospitalizationRate;
                }
            }
        }
    }
    return result;
}

ObservableArray ObservablesCalculator::newDeaths(const CompartmentState& state) {
    const int G = state.getNumAgeGroups();
    const int M = state.getNumPatches();
    const int T = state.getNumSteps();
    const int V = state.getNumVaccinationStatuses();
    const CompartmentArray& D = state.counts(Compartment::D);

    ObservableArray result(G, M, T);
    result.setZero();
    for (int g = 0; g < G; ++g) {
        for (int m = 0; m < M; ++m) {
            for (int t = 1; t < T; ++t) {
                for (int v = 0; v < V; ++v) {
                    result(g, m, t) += D(g, m, t, v) - D(g, m, t - 1, v);
                }
            }
        }
    }
    return result;
}

void ObservablesCalculator::checkRates(const CompartmentState& state, const EpidemicParams& epidemic) {
    const Eigen::Index G = state.getNumAgeGroups();
    const Eigen::Index V = state.getNumVaccinationStatuses();
    const auto matches = [G, V](const Eigen::MatrixXd& m) { return m.rows() == G && m.cols() == V; };
    if (!matches(epidemic.alpha) || !matches(epidemic.mu) || !matches(epidemic.theta) || !matches(epidemic.gamma)) {
        THROW_INVALID_PARAM("ObservablesCalculator::checkRates",
                            "α, μ, θ and γ must be " + std::to_string(G) + " x " + std::to_string(V));
    }
}

} // namespace episim
