#ifndef SCHEMA_VALIDATOR_HPP
#define SCHEMA_VALIDATOR_HPP

#include "config/SimulationConfig.hpp"
#include "engine/IEngineVariant.hpp"

namespace episim {

/**
 * @class SchemaValidator
 * @brief Structural check of a configuration against an engine variant.
 *
 * Only the presence of required top-level sections is checked. Numeric
 * ranges are left to the builders and nothing here touches the filesystem.
 */
class SchemaValidator {
public:
    /**
     * @brief Checks that every section the variant requires is present.
     * @throws ConfigSchemaException Naming the first missing section.
     */
    static void validate(const SimulationConfig& config, const IEngineVariant& variant);

    /**
     * @brief Resolves `simulation.engine` and validates the config against that variant.
     * @return const IEngineVariant& The resolved variant.
     * @throws ConfigSchemaException If `simulation` or `simulation.engine` is absent, or a section is missing.
     * @throws UnknownEngineException If the engine id is not known.
     */
    static const IEngineVariant& validateConfig(const SimulationConfig& config);
};

} // namespace episim

#endif // SCHEMA_VALIDATOR_HPP
