#ifndef MODEL_CONSTANTS_HPP
#define MODEL_CONSTANTS_HPP

#include <array>
#include <string>

namespace episim {

/**
 * @brief Disease compartments, in output order.
 *
 * CH (confined) is filled by the spreading engine and never integrated from an
 * initial condition by the basic engine.
 */
enum class Compartment {
    S, E, A, I, PH, PD, HR, HD, R, D, CH
};

namespace constants {

    constexpr int NUM_COMPARTMENTS = 11;

    const std::array<std::string, NUM_COMPARTMENTS> COMPARTMENT_LABELS = {
        "S", "E", "A", "I", "PH", "PD", "HR", "HD", "R", "D", "CH"
    };

    const std::array<std::string, NUM_COMPARTMENTS> COMPARTMENT_DESCRIPTIONS = {
        "Suceptibles", "Exposed", "Asymptomatic", "Infected", "Pre-hospitalized",
        "Pre-deceased", "Hospitalized-good", "Hospitalized-bad", "Recovered", "Dead", "Confined"
    };

    const std::string BASIC_ENGINE_ID = "MMCACovid19";
    const std::string VACCINATION_ENGINE_ID = "MMCACovid19Vac";

    constexpr int NUM_VACCINATION_STATUSES = 3;
    const std::array<std::string, NUM_VACCINATION_STATUSES> VACCINATION_LABELS = { "NV", "V", "PV" };

    /// Default apportionment of seeded asymptomatic cases over three age groups.
    const std::array<double, 3> DEFAULT_SEED_AGE_FRACTIONS = { 0.12, 0.16, 0.72 };

    constexpr double NUMERICAL_EPSILON = 1e-9;
    constexpr double MIN_POPULATION_FOR_DIVISION = 1e-9;

    const std::string DEFAULT_OUTPUT_FORMAT = "netcdf";
    const std::string DEFAULT_OUTPUT_FOLDER = "output";

} // namespace constants

inline int compartmentIndex(Compartment c) { return static_cast<int>(c); }

} // namespace episim

#endif // MODEL_CONSTANTS_HPP
