#ifndef VACCINATION_PARAMS_HPP
#define VACCINATION_PARAMS_HPP

#include <vector>
#include <Eigen/Dense>

namespace episim {

/**
 * @brief Vaccination campaign handed to the vaccination engine.
 */
struct VaccinationParams {
    /** @brief Interval boundaries: campaign start, campaign end, horizon T. */
    std::vector<int> changeSteps;
    /**
     * @brief Daily doses per age group (rows) for each interval (columns, G x 3).
     *
     * Only the middle column (the campaign itself) can be non-zero.
     */
    Eigen::MatrixXd dailyDoses;
};

} // namespace episim

#endif // VACCINATION_PARAMS_HPP
