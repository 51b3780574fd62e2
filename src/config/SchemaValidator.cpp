#include "config/SchemaValidator.hpp"
#include "engine/EngineRegistry.hpp"
#include "exceptions/Exceptions.hpp"

namespace episim {

void SchemaValidator::validate(const SimulationConfig& config, const IEngineVariant& variant) {
    for (const auto& section : variant.getRequiredSections()) {
        if (!config.hasSection(section)) {
            throw ConfigSchemaException("SchemaValidator::validate", section,
                "engine " + variant.getId() + " requires section '" + section + "'");
        }
    }
}

const IEngineVariant& SchemaValidator::validateConfig(const SimulationConfig& config) {
    if (!config.hasSection("simulation")) {
        throw ConfigSchemaException("SchemaValidator::validateConfig", "simulation",
                                    "missing section 'simulation'");
    }
    const IEngineVariant& variant = EngineRegistry::resolve(config.engineId());
    validate(config, variant);
    return variant;
}

} // namespace episim
