#include "model/parameters/EpidemicParams.hpp"

namespace episim {

void EpidemicParams::resetCompartments() {
    for (auto& array : rho) {
        array.resize(G, M, T, V);
        array.setZero();
    }
}

bool EpidemicParams::validate() const {
    if (G <= 0 || M <= 0 || T <= 0 || V <= 0) return false;

    const Eigen::MatrixXd* rates[] = {&eta, &alpha, &mu, &theta, &gamma, &zeta, &lambda, &omega, &psi, &chi};
    for (const auto* rate : rates) {
        if (rate->rows() != G || rate->cols() != V) return false;
    }

    for (const auto& array : rho) {
        const auto& d = array.dimensions();
        if (d[0] != G || d[1] != M || d[2] != T || d[3] != V) return false;
    }
    return true;
}

} // namespace episim
