#include "utils/JsonUtils.hpp"
#include "utils/FileUtils.hpp"
#include "exceptions/Exceptions.hpp"
#include <fstream>

namespace episim {
namespace JsonUtils {

using nlohmann::json;

namespace {

const json& requireKey(const json& section, const std::string& key, const std::string& sectionName,
                       const std::string& funcName) {
    if (!section.is_object() || !section.contains(key)) {
        throw MissingParameterException(funcName, sectionName + "." + key,
            "key not found in section '" + sectionName + "'");
    }
    return section.at(key);
}

double toNumber(const json& value, const std::string& where, const std::string& funcName) {
    if (!value.is_number()) {
        THROW_INVALID_PARAM(funcName, where + " must be numeric, got " + std::string(value.type_name()));
    }
    return value.get<double>();
}

} // namespace

json readJsonFile(const std::string& path) {
    const std::string funcName = "JsonUtils::readJsonFile";
    if (!FileUtils::fileExists(path)) {
        throw MissingInputFileException(funcName, path, "configuration file not found");
    }
    std::ifstream in(path);
    if (!in.is_open()) {
        throw FileIOException(funcName, "Unable to open " + path);
    }
    try {
        json j;
        in >> j;
        return j;
    } catch (const json::parse_error& e) {
        throw ConfigSchemaException(funcName, "", "Could not parse " + path + ": " + e.what());
    }
}

void writeJsonFile(const std::string& path, const json& document) {
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        throw FileIOException("JsonUtils::writeJsonFile", "Unable to write " + path);
    }
    out << document.dump(4) << std::endl;
}

double getScalar(const json& section, const std::string& key, const std::string& sectionName) {
    const std::string funcName = "JsonUtils::getScalar";
    return toNumber(requireKey(section, key, sectionName, funcName), sectionName + "." + key, funcName);
}

Eigen::VectorXd getVector(const json& section, const std::string& key,
                          int expectedSize, const std::string& sectionName) {
    const std::string funcName = "JsonUtils::getVector";
    const std::string where = sectionName + "." + key;
    const json& value = requireKey(section, key, sectionName, funcName);

    if (value.is_number()) {
        if (expectedSize < 0) {
            return Eigen::VectorXd::Constant(1, value.get<double>());
        }
        return Eigen::VectorXd::Constant(expectedSize, value.get<double>());
    }
    if (!value.is_array()) {
        THROW_INVALID_PARAM(funcName, where + " must be a number or an array of numbers");
    }
    if (expectedSize >= 0 && static_cast<int>(value.size()) != expectedSize) {
        THROW_INVALID_PARAM(funcName, where + " has " + std::to_string(value.size()) +
                            " entries, expected " + std::to_string(expectedSize));
    }
    Eigen::VectorXd v(static_cast<Eigen::Index>(value.size()));
    for (size_t i = 0; i < value.size(); ++i) {
        v(static_cast<Eigen::Index>(i)) = toNumber(value[i], where + "[" + std::to_string(i) + "]", funcName);
    }
    return v;
}

Eigen::MatrixXd getMatrix(const json& section, const std::string& key,
                          int rows, int cols, const std::string& sectionName) {
    const std::string funcName = "JsonUtils::getMatrix";
    const std::string where = sectionName + "." + key;
    const json& value = requireKey(section, key, sectionName, funcName);

    if (!value.is_array() || static_cast<int>(value.size()) != rows) {
        THROW_INVALID_PARAM(funcName, where + " must be an array of " + std::to_string(rows) + " rows");
    }
    Eigen::MatrixXd m(rows, cols);
    for (int i = 0; i < rows; ++i) {
        const json& row = value[static_cast<size_t>(i)];
        if (!row.is_array() || static_cast<int>(row.size()) != cols) {
            THROW_INVALID_PARAM(funcName, where + " row " + std::to_string(i) +
                                " must have " + std::to_string(cols) + " entries");
        }
        for (int j = 0; j < cols; ++j) {
            m(i, j) = toNumber(row[static_cast<size_t>(j)],
                               where + "[" + std::to_string(i) + "][" + std::to_string(j) + "]", funcName);
        }
    }
    return m;
}

std::vector<std::string> getStringArray(const json& section, const std::string& key,
                                        const std::string& sectionName) {
    const std::string funcName = "JsonUtils::getStringArray";
    const json& value = requireKey(section, key, sectionName, funcName);
    if (!value.is_array()) {
        THROW_INVALID_PARAM(funcName, sectionName + "." + key + " must be an array of strings");
    }
    std::vector<std::string> out;
    out.reserve(value.size());
    for (const auto& item : value) {
        if (!item.is_string()) {
            THROW_INVALID_PARAM(funcName, sectionName + "." + key + " must contain only strings");
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

json toJson(const Eigen::VectorXd& v) {
    json arr = json::array();
    for (Eigen::Index i = 0; i < v.size(); ++i) {
        arr.push_back(v(i));
    }
    return arr;
}

json toJson(const Eigen::MatrixXd& m) {
    json arr = json::array();
    for (Eigen::Index i = 0; i < m.rows(); ++i) {
        json row = json::array();
        for (Eigen::Index j = 0; j < m.cols(); ++j) {
            row.push_back(m(i, j));
        }
        arr.push_back(row);
    }
    return arr;
}

} // namespace JsonUtils
} // namespace episim
