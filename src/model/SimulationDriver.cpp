#include "model/SimulationDriver.hpp"
#include "exceptions/Exceptions.hpp"
#include <chrono>

namespace episim {

SimulationDriver::SimulationDriver(const SpreadingEngineRegistry& registry, Logger& logger)
    : registry_(registry), logger_(logger) {}

void SimulationDriver::checkInputs(const IEngineVariant& variant,
                                   const PopulationParams& population,
                                   const EpidemicParams& epidemic,
                                   const NpiSchedule& npi,
                                   const std::optional<VaccinationParams>& vaccination) {
    const std::string funcName = "SimulationDriver::checkInputs";
    if (!population.validate()) {
        THROW_INVALID_PARAM(funcName, "population parameters are inconsistent with G = " +
                            std::to_string(population.G) + " and M = " + std::to_string(population.M));
    }
    if (epidemic.G != population.G || epidemic.M != population.M) {
        THROW_INVALID_PARAM(funcName, "epidemic parameters are sized for G = " + std::to_string(epidemic.G) +
                            ", M = " + std::to_string(epidemic.M) + " but the population has G = " +
                            std::to_string(population.G) + ", M = " + std::to_string(population.M));
    }
    if (epidemic.T < 1) {
        THROW_INVALID_PARAM(funcName, "the horizon must contain at least one step");
    }
    if (epidemic.V != variant.getNumVaccinationStatuses()) {
        THROW_INVALID_PARAM(funcName, "engine " + variant.getId() + " expects " +
                            std::to_string(variant.getNumVaccinationStatuses()) +
                            " vaccination statuses, got " + std::to_string(epidemic.V));
    }
    if (!epidemic.validate()) {
        THROW_INVALID_PARAM(funcName, "rates or density arrays are not shaped (G, M, T, V)");
    }

    if (variant.hasVaccinationAxis() && !vaccination) {
        THROW_INVALID_PARAM(funcName, "engine " + variant.getId() + " requires vaccination parameters");
    }
    if (!variant.hasVaccinationAxis() && vaccination) {
        THROW_INVALID_PARAM(funcName, "engine " + variant.getId() + " does not accept vaccination parameters");
    }
    if (vaccination && vaccination->dailyDoses.rows() != population.G) {
        THROW_INVALID_PARAM(funcName, "vaccination doses must have one row per age group");
    }

    for (const auto& point : npi.getChangePoints()) {
        if (point.step < 1 || point.step > epidemic.T) {
            THROW_INVALID_PARAM(funcName, "NPI change-point at step " + std::to_string(point.step) +
                                " lies outside [1, " + std::to_string(epidemic.T) + "]");
        }
    }
}

void SimulationDriver::run(const IEngineVariant& variant,
                           const PopulationParams& population,
                           EpidemicParams& epidemic,
                           const NpiSchedule& npi,
                           const std::optional<VaccinationParams>& vaccination) const {
    const std::string funcName = "SimulationDriver::run";
    checkInputs(variant, population, epidemic, npi, vaccination);

    std::unique_ptr<ISpreadingEngine> engine = registry_.create(variant.getId());
    logger_.info(funcName, "Running " + engine->getName() + " for " + variant.getId() + ": G = " +
                 std::to_string(epidemic.G) + ", M = " + std::to_string(epidemic.M) + ", T = " +
                 std::to_string(epidemic.T) + ", V = " + std::to_string(epidemic.V));

    auto start = std::chrono::steady_clock::now();
    try {
        engine->run(population, epidemic, npi, vaccination ? &*vaccination : nullptr);
    } catch (const SpreadingEngineException&) {
        throw;
    } catch (const std::exception& e) {
        THROW_ENGINE_ERROR(funcName, engine->getName() + " failed: " + std::string(e.what()));
    } catch (...) {
        THROW_ENGINE_ERROR(funcName, engine->getName() + " failed with an unknown error");
    }
    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    logger_.info(funcName, "Engine finished in " + std::to_string(elapsed) + " s");
}

} // namespace episim
