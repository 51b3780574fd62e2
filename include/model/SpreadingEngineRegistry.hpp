#ifndef SPREADING_ENGINE_REGISTRY_HPP
#define SPREADING_ENGINE_REGISTRY_HPP

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "model/interfaces/ISpreadingEngine.hpp"

namespace episim {

/**
 * @class SpreadingEngineRegistry
 * @brief Maps engine variant ids to factories of spreading engines.
 *
 * Owned by the caller of a run, so different runs may bind different
 * integrators to the same variant.
 */
class SpreadingEngineRegistry {
public:
    using Factory = std::function<std::unique_ptr<ISpreadingEngine>()>;

    /**
     * @brief Registers (or replaces) the factory for a variant id.
     * @throws InvalidParameterException If @p factory is empty.
     */
    void registerEngine(const std::string& engineId, Factory factory);

    bool contains(const std::string& engineId) const;

    /**
     * @brief Creates the engine registered for @p engineId.
     * @throws SpreadingEngineException If nothing is registered or the factory returns null.
     */
    std::unique_ptr<ISpreadingEngine> create(const std::string& engineId) const;

    std::vector<std::string> registeredIds() const;

private:
    std::map<std::string, Factory> factories_;
};

} // namespace episim

#endif // SPREADING_ENGINE_REGISTRY_HPP
