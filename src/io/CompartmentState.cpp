#include "io/CompartmentState.hpp"
#include "utils/DateUtils.hpp"
#include "exceptions/Exceptions.hpp"

namespace episim {

CompartmentState::CompartmentState(const EpidemicParams& epidemic,
                                   const PopulationParams& population,
                                   const std::vector<std::string>& vaccinationLabels,
                                   const boost::gregorian::date& startDate)
    : G_(epidemic.G), M_(epidemic.M), T_(epidemic.T), V_(epidemic.V),
      ageLabels_(population.ageLabels), patchIds_(population.patchIds),
      vaccinationLabels_(vaccinationLabels), startDate_(startDate)
{
    const std::string funcName = "CompartmentState::CompartmentState";
    if (G_ != population.G || M_ != population.M) {
        THROW_INVALID_PARAM(funcName, "epidemic dimensions (" + std::to_string(G_) + ", " + std::to_string(M_) +
                            ") disagree with population (" + std::to_string(population.G) + ", " +
                            std::to_string(population.M) + ")");
    }
    if (static_cast<int>(ageLabels_.size()) != G_ || static_cast<int>(patchIds_.size()) != M_) {
        THROW_INVALID_PARAM(funcName, "age labels or patch ids do not match G and M");
    }
    const int expectedV = vaccinationLabels_.empty() ? 1 : static_cast<int>(vaccinationLabels_.size());
    if (V_ != expectedV) {
        THROW_INVALID_PARAM(funcName, "vaccination axis has " + std::to_string(V_) + " statuses but " +
                            std::to_string(vaccinationLabels_.size()) + " labels were given");
    }

    dateLabels_ = DateUtils::dateCoordinates(startDate_, T_);

    for (size_t c = 0; c < counts_.size(); ++c) {
        const CompartmentArray& rho = epidemic.rho[c];
        if (rho.dimension(0) != G_ || rho.dimension(1) != M_ || rho.dimension(2) != T_ || rho.dimension(3) != V_) {
            THROW_INVALID_PARAM(funcName, "density array of " + constants::COMPARTMENT_LABELS[c] +
                                " is not shaped (G, M, T, V)");
        }
        CompartmentArray& out = counts_[c];
        out.resize(G_, M_, T_, V_);
        for (int g = 0; g < G_; ++g) {
            for (int m = 0; m < M_; ++m) {
                const double n = population.n(g, m);
                for (int t = 0; t < T_; ++t) {
                    for (int v = 0; v < V_; ++v) {
                        out(g, m, t, v) = rho(g, m, t, v) * n;
                    }
                }
            }
        }
    }
}

double CompartmentState::totalAt(int g, int m, int t) const {
    double total = 0.0;
    for (const auto& array : counts_) {
        for (int v = 0; v < V_; ++v) {
            total += array(g, m, t, v);
        }
    }
    return total;
}

} // namespace episim
