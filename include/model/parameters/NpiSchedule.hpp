#ifndef NPI_SCHEDULE_HPP
#define NPI_SCHEDULE_HPP

#include <optional>
#include <vector>

namespace episim {

/**
 * @brief One intervention change-point.
 *
 * Applies from @c step (1-based simulation step) until the next change-point.
 */
struct NpiChangePoint {
    int step;          ///< First step the values apply to.
    double kappa0;     ///< Confinement level.
    double phi;        ///< Household permeability.
    double delta;      ///< Social distancing factor.
};

/**
 * @brief Piecewise-constant schedule of non-pharmaceutical interventions.
 */
class NpiSchedule {
public:
    /** @brief Empty schedule: no intervention at any step. */
    NpiSchedule() = default;

    /**
     * @brief Builds a schedule from index-aligned vectors.
     *
     * @param steps Effective steps, strictly increasing
     * @param kappa0s Confinement levels
     * @param phis Household permeabilities
     * @param deltas Social distancing factors
     * @throws NPIScheduleException If the lengths differ or the steps are not strictly increasing
     */
    NpiSchedule(const std::vector<int>& steps,
                const std::vector<double>& kappa0s,
                const std::vector<double>& phis,
                const std::vector<double>& deltas);

    /**
     * @brief Change-point in force at @p step, if any.
     */
    std::optional<NpiChangePoint> activeAt(int step) const;

    const std::vector<NpiChangePoint>& getChangePoints() const { return changePoints_; }
    bool empty() const { return changePoints_.empty(); }
    size_t size() const { return changePoints_.size(); }

    std::vector<int> getSteps() const;
    std::vector<double> getKappa0s() const;
    std::vector<double> getPhis() const;
    std::vector<double> getDeltas() const;

private:
    std::vector<NpiChangePoint> changePoints_;
};

} // namespace episim

#endif // NPI_SCHEDULE_HPP
