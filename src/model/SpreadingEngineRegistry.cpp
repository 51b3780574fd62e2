#include "model/SpreadingEngineRegistry.hpp"
#include "exceptions/Exceptions.hpp"

namespace episim {

void SpreadingEngineRegistry::registerEngine(const std::string& engineId, Factory factory) {
    if (!factory) {
        THROW_INVALID_PARAM("SpreadingEngineRegistry::registerEngine", "factory for '" + engineId + "' is empty");
    }
    factories_[engineId] = std::move(factory);
}

bool SpreadingEngineRegistry::contains(const std::string& engineId) const {
    return factories_.count(engineId) > 0;
}

std::unique_ptr<ISpreadingEngine> SpreadingEngineRegistry::create(const std::string& engineId) const {
    const std::string funcName = "SpreadingEngineRegistry::create";
    auto it = factories_.find(engineId);
    if (it == factories_.end()) {
        THROW_ENGINE_ERROR(funcName, "no spreading engine registered for '" + engineId + "'");
    }
    std::unique_ptr<ISpreadingEngine> engine = it->second();
    if (!engine) {
        THROW_ENGINE_ERROR(funcName, "factory for '" + engineId + "' returned no engine");
    }
    return engine;
}

std::vector<std::string> SpreadingEngineRegistry::registeredIds() const {
    std::vector<std::string> ids;
    for (const auto& entry : factories_) {
        ids.push_back(entry.first);
    }
    return ids;
}

} // namespace episim
