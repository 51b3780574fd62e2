#include "model/parameters/NpiSchedule.hpp"
#include "exceptions/Exceptions.hpp"
#include <string>

namespace episim {

NpiSchedule::NpiSchedule(const std::vector<int>& steps,
                         const std::vector<double>& kappa0s,
                         const std::vector<double>& phis,
                         const std::vector<double>& deltas) {
    if (kappa0s.size() != steps.size() || phis.size() != steps.size() || deltas.size() != steps.size()) {
        THROW_NPI_ERROR("NpiSchedule",
            "κ₀s, ϕs, δs and tᶜs must have the same length (got " + std::to_string(kappa0s.size()) + ", " +
            std::to_string(phis.size()) + ", " + std::to_string(deltas.size()) + ", " + std::to_string(steps.size()) + ")");
    }

    int previous = 0;
    for (size_t i = 0; i < steps.size(); ++i) {
        if (steps[i] < 1) {
            THROW_NPI_ERROR("NpiSchedule", "tᶜs[" + std::to_string(i) + "] = " + std::to_string(steps[i]) +
                                           " is before the first step (1)");
        }
        if (i > 0 && steps[i] <= previous) {
            THROW_NPI_ERROR("NpiSchedule", "tᶜs must be strictly increasing, found " + std::to_string(steps[i]) +
                                           " after " + std::to_string(previous));
        }
        previous = steps[i];
        changePoints_.push_back({steps[i], kappa0s[i], phis[i], deltas[i]});
    }
}

std::optional<NpiChangePoint> NpiSchedule::activeAt(int step) const {
    std::optional<NpiChangePoint> active;
    for (const auto& cp : changePoints_) {
        if (cp.step > step) {
            break;
        }
        active = cp;
    }
    return active;
}

std::vector<int> NpiSchedule::getSteps() const {
    std::vector<int> out;
    for (const auto& cp : changePoints_) out.push_back(cp.step);
    return out;
}

std::vector<double> NpiSchedule::getKappa0s() const {
    std::vector<double> out;
    for (const auto& cp : changePoints_) out.push_back(cp.kappa0);
    return out;
}

std::vector<double> NpiSchedule::getPhis() const {
    std::vector<double> out;
    for (const auto& cp : changePoints_) out.push_back(cp.phi);
    return out;
}

std::vector<double> NpiSchedule::getDeltas() const {
    std::vector<double> out;
    for (const auto& cp : changePoints_) out.push_back(cp.delta);
    return out;
}

} // namespace episim
