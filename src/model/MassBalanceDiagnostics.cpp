#include "model/MassBalanceDiagnostics.hpp"
#include "exceptions/Exceptions.hpp"
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/count.hpp>
#include <boost/accumulators/statistics/max.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <cmath>
#include <sstream>

namespace ba = boost::accumulators;

namespace episim {

using DeviationAccumulatorType = ba::accumulator_set<double,
    ba::stats<
        ba::tag::mean,
        ba::tag::max,
        ba::tag::count
    >
>;

MassBalanceReport MassBalanceDiagnostics::evaluate(const CompartmentState& state,
                                                   const PopulationParams& population,
                                                   int compartmentCount) {
    if (compartmentCount < 1 || compartmentCount > constants::NUM_COMPARTMENTS) {
        THROW_INVALID_PARAM("MassBalanceDiagnostics::evaluate",
                            "compartment count must lie in [1, " + std::to_string(constants::NUM_COMPARTMENTS) + "]");
    }

    DeviationAccumulatorType acc;
    for (int g = 0; g < state.getNumAgeGroups(); ++g) {
        for (int m = 0; m < state.getNumPatches(); ++m) {
            const double n = population.n(g, m);
            if (n <= 0.0) continue;
            for (int t = 0; t < state.getNumSteps(); ++t) {
                double total = 0.0;
                for (int c = 0; c < compartmentCount; ++c) {
                    const CompartmentArray& counts = state.counts(static_cast<Compartment>(c));
                    for (int v = 0; v < state.getNumVaccinationStatuses(); ++v) {
                        total += counts(g, m, t, v);
                    }
                }
                acc(std::abs(total - n) / n);
            }
        }
    }

    MassBalanceReport report;
    report.cellCount = ba::count(acc);
    if (report.cellCount > 0) {
        report.meanRelativeDeviation = ba::mean(acc);
        report.maxRelativeDeviation = ba::max(acc);
    }
    return report;
}

void MassBalanceDiagnostics::log(const MassBalanceReport& report, Logger& logger, double tolerance) {
    std::ostringstream oss;
    oss << "Mass balance over " << report.cellCount << " cells: mean relative deviation "
        << report.meanRelativeDeviation << ", max " << report.maxRelativeDeviation;
    if (report.maxRelativeDeviation > tolerance) {
        logger.warning("MassBalanceDiagnostics", oss.str());
    } else {
        logger.info("MassBalanceDiagnostics", oss.str());
    }
}

} // namespace episim
