#ifndef COMPARTMENT_STATE_HPP
#define COMPARTMENT_STATE_HPP

#include <array>
#include <string>
#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "model/parameters/EpidemicParams.hpp"
#include "model/parameters/PopulationParams.hpp"

namespace episim {

/**
 * @class CompartmentState
 * @brief Read-only view of a finished run in absolute counts.
 *
 * Counts are density x local population, shaped (G, M, T, V). When the
 * variant has no vaccination axis V is 1 and getVaccinationLabels() is empty;
 * outputs then drop the V dimension.
 */
class CompartmentState {
public:
    /**
     * @brief Converts the densities of a run into counts and collects coordinate labels.
     *
     * @param epidemic Run parameters holding the density arrays.
     * @param population Population the densities refer to.
     * @param vaccinationLabels Labels of the V axis, empty for variants without one.
     * @param startDate Date of step 1.
     * @throws InvalidParameterException If the labels disagree with the array extents.
     */
    CompartmentState(const EpidemicParams& epidemic,
                     const PopulationParams& population,
                     const std::vector<std::string>& vaccinationLabels,
                     const boost::gregorian::date& startDate);

    int getNumAgeGroups() const { return G_; }
    int getNumPatches() const { return M_; }
    int getNumSteps() const { return T_; }
    int getNumVaccinationStatuses() const { return V_; }
    bool hasVaccinationAxis() const { return !vaccinationLabels_.empty(); }

    const std::vector<std::string>& getAgeLabels() const { return ageLabels_; }
    const std::vector<std::string>& getPatchIds() const { return patchIds_; }
    const std::vector<std::string>& getDateLabels() const { return dateLabels_; }
    const std::vector<std::string>& getVaccinationLabels() const { return vaccinationLabels_; }
    const boost::gregorian::date& getStartDate() const { return startDate_; }

    /** @brief Counts of one compartment, (G, M, T, V). */
    const CompartmentArray& counts(Compartment c) const {
        return counts_[static_cast<size_t>(compartmentIndex(c))];
    }

    /** @brief Sum over compartments and vaccination statuses at (g, m, t). */
    double totalAt(int g, int m, int t) const;

private:
    int G_;
    int M_;
    int T_;
    int V_;
    std::vector<std::string> ageLabels_;
    std::vector<std::string> patchIds_;
    std::vector<std::string> dateLabels_;
    std::vector<std::string> vaccinationLabels_;
    boost::gregorian::date startDate_;
    std::array<CompartmentArray, constants::NUM_COMPARTMENTS> counts_;
};

} // namespace episim

#endif // COMPARTMENT_STATE_HPP
