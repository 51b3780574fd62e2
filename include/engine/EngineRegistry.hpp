#ifndef ENGINE_REGISTRY_HPP
#define ENGINE_REGISTRY_HPP

#include <string>
#include <vector>
#include "engine/IEngineVariant.hpp"

namespace episim {

/**
 * @class EngineRegistry
 * @brief Maps engine identifiers to the closed set of engine variants.
 */
class EngineRegistry {
public:
    /**
     * @brief Finds the variant registered under @p engineId.
     * @param engineId Value of `simulation.engine`.
     * @return const IEngineVariant& Variant with static lifetime.
     * @throws UnknownEngineException If no variant has that identifier.
     */
    static const IEngineVariant& resolve(const std::string& engineId);

    /**
     * @brief Identifiers of every known variant.
     */
    static std::vector<std::string> knownIds();
};

} // namespace episim

#endif // ENGINE_REGISTRY_HPP
