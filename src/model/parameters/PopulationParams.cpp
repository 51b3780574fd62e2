#include "model/parameters/PopulationParams.hpp"

namespace episim {

double PopulationParams::totalPopulation() const {
    return n.sum();
}

Eigen::VectorXd PopulationParams::patchTotals() const {
    return n.colwise().sum().transpose();
}

bool PopulationParams::validate() const {
    if (G <= 0 || M <= 0) return false;
    if (static_cast<int>(ageLabels.size()) != G || static_cast<int>(patchIds.size()) != M) return false;
    if (n.rows() != G || n.cols() != M || (n.array() < 0.0).any()) return false;
    if (area.size() != M) return false;
    if (C.rows() != G || C.cols() != G) return false;
    if (k.size() != G || k_h.size() != G || k_w.size() != G || p.size() != G) return false;
    for (const auto& edge : edges) {
        if (edge.origin == edge.destination) return false;
        if (edge.origin < 0 || edge.origin >= M || edge.destination < 0 || edge.destination >= M) return false;
    }
    return true;
}

} // namespace episim
