#include "engine/EngineRegistry.hpp"
#include "engine/BasicEngineVariant.hpp"
#include "engine/VaccinationEngineVariant.hpp"
#include "exceptions/Exceptions.hpp"

namespace episim {

namespace {

const std::vector<const IEngineVariant*>& variants() {
    static const BasicEngineVariant basic;
    static const VaccinationEngineVariant vaccination;
    static const std::vector<const IEngineVariant*> all = {&basic, &vaccination};
    return all;
}

} // namespace

const IEngineVariant& EngineRegistry::resolve(const std::string& engineId) {
    for (const IEngineVariant* variant : variants()) {
        if (variant->getId() == engineId) {
            return *variant;
        }
    }
    std::string known;
    for (const auto& id : knownIds()) {
        known += (known.empty() ? "" : ", ") + id;
    }
    throw UnknownEngineException("EngineRegistry::resolve", engineId,
                                 "'" + engineId + "' is not one of: " + known);
}

std::vector<std::string> EngineRegistry::knownIds() {
    std::vector<std::string> ids;
    for (const IEngineVariant* variant : variants()) {
        ids.push_back(variant->getId());
    }
    return ids;
}

} // namespace episim
