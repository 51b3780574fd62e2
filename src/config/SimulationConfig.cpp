#include "config/SimulationConfig.hpp"
#include "utils/JsonUtils.hpp"
#include "utils/DateUtils.hpp"
#include "model/ModelConstants.hpp"
#include "exceptions/Exceptions.hpp"

namespace episim {

using nlohmann::json;

SimulationConfig::SimulationConfig(json document)
    : document_(std::move(document)) {
    if (!document_.is_object()) {
        throw ConfigSchemaException("SimulationConfig", "", "configuration root must be a JSON object");
    }
}

SimulationConfig SimulationConfig::fromFile(const std::string& path) {
    return SimulationConfig(JsonUtils::readJsonFile(path));
}

void SimulationConfig::save(const std::string& path) const {
    JsonUtils::writeJsonFile(path, document_);
}

bool SimulationConfig::hasSection(const std::string& name) const {
    return document_.contains(name) && document_.at(name).is_object();
}

const json& SimulationConfig::section(const std::string& name) const {
    if (!hasSection(name)) {
        throw ConfigSchemaException("SimulationConfig::section", name, "missing section '" + name + "'");
    }
    return document_.at(name);
}

json& SimulationConfig::section(const std::string& name) {
    if (!hasSection(name)) {
        throw ConfigSchemaException("SimulationConfig::section", name, "missing section '" + name + "'");
    }
    return document_.at(name);
}

void SimulationConfig::applyOverrides(const RunOverrides& overrides) {
    json& sim = section("simulation");
    if (overrides.startDate) {
        DateUtils::parseDate(*overrides.startDate);
        sim["start_date"] = *overrides.startDate;
    }
    if (overrides.endDate) {
        DateUtils::parseDate(*overrides.endDate);
        sim["end_date"] = *overrides.endDate;
    }
    if (overrides.exportTimeStep) {
        sim["save_time_step"] = *overrides.exportTimeStep;
    }
    if (overrides.exportFull) {
        sim["save_full_output"] = *overrides.exportFull;
    }
}

std::string SimulationConfig::simulationString(const std::string& key, const std::string& fallback) const {
    const json& sim = section("simulation");
    if (!sim.contains(key) || sim.at(key).is_null()) {
        return fallback;
    }
    if (!sim.at(key).is_string()) {
        THROW_INVALID_PARAM("SimulationConfig", "simulation." + key + " must be a string");
    }
    return sim.at(key).get<std::string>();
}

bool SimulationConfig::simulationFlag(const std::string& key, bool fallback) const {
    const json& sim = section("simulation");
    if (!sim.contains(key) || sim.at(key).is_null()) {
        return fallback;
    }
    if (!sim.at(key).is_boolean()) {
        THROW_INVALID_PARAM("SimulationConfig", "simulation." + key + " must be true or false");
    }
    return sim.at(key).get<bool>();
}

std::string SimulationConfig::engineId() const {
    const json& sim = section("simulation");
    if (!sim.contains("engine") || !sim.at("engine").is_string()) {
        throw ConfigSchemaException("SimulationConfig::engineId", "simulation.engine",
                                    "simulation.engine must name an engine");
    }
    return sim.at("engine").get<std::string>();
}

boost::gregorian::date SimulationConfig::startDate() const {
    const std::string value = simulationString("start_date", "");
    if (value.empty()) {
        throw MissingParameterException("SimulationConfig::startDate", "simulation.start_date", "no start date configured");
    }
    return DateUtils::parseDate(value);
}

boost::gregorian::date SimulationConfig::endDate() const {
    const std::string value = simulationString("end_date", "");
    if (value.empty()) {
        throw MissingParameterException("SimulationConfig::endDate", "simulation.end_date", "no end date configured");
    }
    return DateUtils::parseDate(value);
}

int SimulationConfig::horizonLength() const {
    return DateUtils::horizonLength(startDate(), endDate());
}

bool SimulationConfig::saveFullOutput() const {
    return simulationFlag("save_full_output", false);
}

bool SimulationConfig::saveObservables() const {
    return simulationFlag("save_observables", false);
}

std::optional<int> SimulationConfig::saveTimeStep() const {
    const json& sim = section("simulation");
    if (!sim.contains("save_time_step") || sim.at("save_time_step").is_null()) {
        return std::nullopt;
    }
    const json& value = sim.at("save_time_step");
    if (!value.is_number_integer()) {
        THROW_INVALID_PARAM("SimulationConfig::saveTimeStep", "simulation.save_time_step must be an integer");
    }
    return value.get<int>();
}

std::string SimulationConfig::outputFormat() const {
    return simulationString("output_format", constants::DEFAULT_OUTPUT_FORMAT);
}

std::string SimulationConfig::initFormat() const {
    return simulationString("init_format", constants::DEFAULT_OUTPUT_FORMAT);
}

std::string SimulationConfig::outputFolder() const {
    return simulationString("output_folder", constants::DEFAULT_OUTPUT_FOLDER);
}

std::optional<std::string> SimulationConfig::dataFilename(const std::string& key) const {
    if (!hasSection("data")) {
        return std::nullopt;
    }
    const json& data = document_.at("data");
    if (!data.contains(key) || !data.at(key).is_string()) {
        return std::nullopt;
    }
    std::string value = data.at(key).get<std::string>();
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

} // namespace episim
