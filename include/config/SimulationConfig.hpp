#ifndef SIMULATION_CONFIG_HPP
#define SIMULATION_CONFIG_HPP

#include <string>
#include <optional>
#include <nlohmann/json.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>

namespace episim {

/**
 * @brief Values a caller may impose on a loaded configuration before a run.
 *
 * Unset members leave the configuration untouched.
 */
struct RunOverrides {
    std::optional<std::string> startDate;
    std::optional<std::string> endDate;
    std::optional<int> exportTimeStep;        ///< 1-based snapshot step.
    std::optional<bool> exportFull;
    std::optional<std::string> initialConditionPath;
};

/**
 * @brief Declarative run configuration.
 *
 * Thin owner of the JSON document with typed accessors for the
 * `simulation` and `data` sections. Parameter sections are handed to the
 * builders as raw JSON.
 */
class SimulationConfig {
public:
    SimulationConfig() = default;
    explicit SimulationConfig(nlohmann::json document);

    /**
     * @brief Loads a configuration file.
     * @throws MissingInputFileException If the file does not exist
     * @throws ConfigSchemaException If the file is not valid JSON or not an object
     */
    static SimulationConfig fromFile(const std::string& path);

    /// @brief Writes the document back to disk.
    void save(const std::string& path) const;

    const nlohmann::json& document() const { return document_; }
    nlohmann::json& document() { return document_; }

    bool hasSection(const std::string& name) const;

    /**
     * @brief Access a top-level section.
     * @throws ConfigSchemaException If the section is absent or not an object
     */
    const nlohmann::json& section(const std::string& name) const;
    nlohmann::json& section(const std::string& name);

    /**
     * @brief Applies command-line overrides.
     *
     * The initial-condition path is not stored in the document; callers pass it
     * to the resolver directly.
     */
    void applyOverrides(const RunOverrides& overrides);

    std::string engineId() const;
    boost::gregorian::date startDate() const;
    boost::gregorian::date endDate() const;

    /// @brief Number of simulated days, start and end included.
    int horizonLength() const;

    bool saveFullOutput() const;
    bool saveObservables() const;

    /// @brief 1-based snapshot step, if one is requested.
    std::optional<int> saveTimeStep() const;

    std::string outputFormat() const;
    std::string initFormat() const;
    std::string outputFolder() const;

    /**
     * @brief Filename declared under `data`, if present and non-empty.
     */
    std::optional<std::string> dataFilename(const std::string& key) const;

private:
    std::string simulationString(const std::string& key, const std::string& fallback) const;
    bool simulationFlag(const std::string& key, bool fallback) const;

    nlohmann::json document_ = nlohmann::json::object();
};

} // namespace episim

#endif // SIMULATION_CONFIG_HPP
