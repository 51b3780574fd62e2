#ifndef CONFIG_TEMPLATE_HPP
#define CONFIG_TEMPLATE_HPP

#include <string>
#include <nlohmann/json.hpp>
#include "engine/IEngineVariant.hpp"
#include "utils/Logger.hpp"

namespace episim {

/**
 * @class ConfigTemplate
 * @brief Scaffolds a new model: configuration plus placeholder data tables.
 */
class ConfigTemplate {
public:
    static const std::string CONFIG_FILENAME;           ///< "config.json"
    static const std::string METAPOPULATION_FILENAME;   ///< "metapopulation_data.csv"
    static const std::string MOBILITY_FILENAME;         ///< "R_mobility_matrix.csv"

    /**
     * @brief Builds a configuration with default parameters for @p M patches and @p G age groups.
     *
     * Age groups are labelled G1..GG. The vaccination section is added when
     * the variant requires it.
     *
     * @throws InvalidParameterException If M or G is not positive.
     */
    static nlohmann::json create(const IEngineVariant& variant, int M, int G);

    /**
     * @brief Writes config.json, a uniform metapopulation table and an empty mobility table.
     *
     * Patches are named p1..pM with area 1, one inhabitant per age group and total G.
     *
     * @param modelFolder Folder to create and fill.
     * @return Path of the written config file.
     * @throws FileIOException If the folder or a file cannot be written.
     */
    static std::string writeModel(const IEngineVariant& variant, int M, int G,
                                  const std::string& modelFolder, Logger& logger);
};

} // namespace episim

#endif // CONFIG_TEMPLATE_HPP
