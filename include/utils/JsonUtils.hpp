#ifndef JSON_UTILS_HPP
#define JSON_UTILS_HPP

#include <string>
#include <vector>
#include <Eigen/Dense>
#include <nlohmann/json.hpp>

namespace episim {
namespace JsonUtils {

    /**
     * @brief Reads and parses a JSON document.
     * @throws MissingInputFileException If the file does not exist
     * @throws ConfigSchemaException If the content is not valid JSON
     */
    nlohmann::json readJsonFile(const std::string& path);

    /**
     * @brief Writes a JSON document with 4-space indentation.
     * @throws FileIOException If the file cannot be written
     */
    void writeJsonFile(const std::string& path, const nlohmann::json& document);

    /**
     * @brief Reads a required number.
     * @param section [in] Object holding the key
     * @param key [in] Key to read
     * @param sectionName [in] Used in error messages
     * @throws MissingParameterException If the key is absent
     * @throws InvalidParameterException If the value is not numeric
     */
    double getScalar(const nlohmann::json& section, const std::string& key, const std::string& sectionName);

    /**
     * @brief Reads a per-group vector of length @p expectedSize.
     *
     * A single number is broadcast to every entry. A negative expected size
     * accepts any length.
     * @throws MissingParameterException If the key is absent
     * @throws InvalidParameterException On length or type mismatch
     */
    Eigen::VectorXd getVector(const nlohmann::json& section, const std::string& key,
                              int expectedSize, const std::string& sectionName);

    /**
     * @brief Reads a rows x cols matrix given as an array of rows.
     * @throws MissingParameterException If the key is absent
     * @throws InvalidParameterException On shape or type mismatch
     */
    Eigen::MatrixXd getMatrix(const nlohmann::json& section, const std::string& key,
                              int rows, int cols, const std::string& sectionName);

    /// @brief Reads an array of strings.
    std::vector<std::string> getStringArray(const nlohmann::json& section, const std::string& key,
                                            const std::string& sectionName);

    /// @brief Converts a vector to a JSON array.
    nlohmann::json toJson(const Eigen::VectorXd& v);

    /// @brief Converts a matrix to a JSON array of rows.
    nlohmann::json toJson(const Eigen::MatrixXd& m);

} // namespace JsonUtils
} // namespace episim

#endif // JSON_UTILS_HPP
