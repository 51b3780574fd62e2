#include "io/TabularDataLoader.hpp"
#include "utils/FileUtils.hpp"
#include "utils/DateUtils.hpp"
#include "exceptions/Exceptions.hpp"
#include <cmath>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace episim {

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::vector<std::string> splitCsvLine(const std::string& line) {
    std::vector<std::string> fields;
    std::string cell;
    bool inQuotes = false;
    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (c == '"') {
            if (inQuotes && i + 1 < line.size() && line[i + 1] == '"') {
                cell += '"';
                ++i;
            } else {
                inQuotes = !inQuotes;
            }
        } else if (c == ',' && !inQuotes) {
            fields.push_back(trim(cell));
            cell.clear();
        } else {
            cell += c;
        }
    }
    fields.push_back(trim(cell));
    return fields;
}

bool isSkippable(const std::string& line) {
    const std::string t = trim(line);
    return t.empty() || t.rfind("//", 0) == 0;
}

std::string cellContext(const CsvTable& table, size_t row, int col) {
    std::string colName = (col >= 0 && static_cast<size_t>(col) < table.header.size())
                              ? table.header[static_cast<size_t>(col)] : std::to_string(col + 1);
    return "line " + std::to_string(table.lineNumbers[row]) + ", column '" + colName + "' in " + table.source;
}

} // namespace

int CsvTable::columnIndex(const std::string& name) const {
    for (size_t i = 0; i < header.size(); ++i) {
        if (header[i] == name) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

int CsvTable::requireColumn(const std::string& name, const std::string& funcName) const {
    int idx = columnIndex(name);
    if (idx < 0) {
        throw TabularSchemaException(TabularSchemaException::ErrorType::MissingColumn, funcName,
            "'" + name + "' in " + source);
    }
    return idx;
}

double CsvTable::numberAt(size_t row, int col, const std::string& funcName) const {
    const std::string& cell = rows[row][static_cast<size_t>(col)];
    if (cell.empty()) {
        throw TabularSchemaException(TabularSchemaException::ErrorType::InvalidNumberFormat, funcName,
            "empty cell at " + cellContext(*this, row, col));
    }
    try {
        size_t consumed = 0;
        double value = std::stod(cell, &consumed);
        if (consumed != cell.size()) {
            throw TabularSchemaException(TabularSchemaException::ErrorType::InvalidNumberFormat, funcName,
                "'" + cell + "' at " + cellContext(*this, row, col));
        }
        return value;
    } catch (const std::invalid_argument&) {
        throw TabularSchemaException(TabularSchemaException::ErrorType::InvalidNumberFormat, funcName,
            "'" + cell + "' at " + cellContext(*this, row, col));
    } catch (const std::out_of_range&) {
        throw TabularSchemaException(TabularSchemaException::ErrorType::InvalidNumberFormat, funcName,
            "Number out of range '" + cell + "' at " + cellContext(*this, row, col));
    }
}

int CsvTable::indexAt(size_t row, int col, const std::string& funcName) const {
    double value = numberAt(row, col, funcName);
    if (std::floor(value) != value || std::fabs(value) > 1e9) {
        throw TabularSchemaException(TabularSchemaException::ErrorType::InvalidIndex, funcName,
            "'" + rows[row][static_cast<size_t>(col)] + "' is not an integer at " + cellContext(*this, row, col));
    }
    return static_cast<int>(value);
}

CsvTable readCsvTable(const std::string& path) {
    const std::string funcName = "episim::readCsvTable";
    if (!FileUtils::fileExists(path)) {
        throw MissingInputFileException(funcName, path, "table not found");
    }
    std::ifstream file(path);
    if (!file.is_open()) {
        throw TabularSchemaException(TabularSchemaException::ErrorType::FileOpenError, funcName, path);
    }

    CsvTable table;
    table.source = path;

    std::string line;
    int lineNumber = 0;
    while (std::getline(file, line)) {
        ++lineNumber;
        if (isSkippable(line)) {
            continue;
        }
        if (table.header.empty()) {
            table.header = splitCsvLine(line);
            continue;
        }
        std::vector<std::string> fields = splitCsvLine(line);
        if (fields.size() < table.header.size()) {
            throw TabularSchemaException(TabularSchemaException::ErrorType::NotEnoughColumns, funcName,
                "line " + std::to_string(lineNumber) + " has " + std::to_string(fields.size()) +
                " fields, header has " + std::to_string(table.header.size()) + " in " + path);
        }
        table.rows.push_back(std::move(fields));
        table.lineNumbers.push_back(lineNumber);
    }

    if (table.header.empty()) {
        throw TabularSchemaException(TabularSchemaException::ErrorType::MissingColumn, funcName,
            "no header row in " + path);
    }
    return table;
}

TabularDataLoader::TabularDataLoader(std::string dataFolder)
    : dataFolder_(std::move(dataFolder)) {}

std::string TabularDataLoader::resolve(const std::string& filename, const std::string& configKey) const {
    std::string path = std::filesystem::path(filename).is_absolute()
                           ? filename
                           : FileUtils::joinPaths(dataFolder_, filename);
    if (!FileUtils::fileExists(path)) {
        throw MissingInputFileException("TabularDataLoader::resolve", path, "declared by '" + configKey + "'");
    }
    return path;
}

MetapopulationTable TabularDataLoader::loadMetapopulation(const std::string& filename,
                                                          const std::vector<std::string>& ageLabels) const {
    const std::string funcName = "TabularDataLoader::loadMetapopulation";
    CsvTable table = readCsvTable(resolve(filename, "data.metapopulation_data_filename"));

    const int idCol = table.requireColumn("id", funcName);
    const int areaCol = table.requireColumn("area", funcName);
    const int totalCol = table.requireColumn("total", funcName);
    std::vector<int> ageCols;
    for (const auto& label : ageLabels) {
        ageCols.push_back(table.requireColumn(label, funcName));
    }

    const Eigen::Index G = static_cast<Eigen::Index>(ageLabels.size());
    const Eigen::Index M = static_cast<Eigen::Index>(table.rows.size());

    MetapopulationTable result;
    result.ids.reserve(static_cast<size_t>(M));
    result.area.resize(M);
    result.total.resize(M);
    result.populationByAge.resize(G, M);

    for (Eigen::Index m = 0; m < M; ++m) {
        const size_t row = static_cast<size_t>(m);
        result.ids.push_back(table.rows[row][static_cast<size_t>(idCol)]);
        result.area(m) = table.numberAt(row, areaCol, funcName);
        result.total(m) = table.numberAt(row, totalCol, funcName);
        for (Eigen::Index g = 0; g < G; ++g) {
            result.populationByAge(g, m) = table.numberAt(row, ageCols[static_cast<size_t>(g)], funcName);
        }
    }
    return result;
}

std::vector<MobilityEdge> TabularDataLoader::loadMobilityEdges(const std::string& filename) const {
    const std::string funcName = "TabularDataLoader::loadMobilityEdges";
    CsvTable table = readCsvTable(resolve(filename, "data.mobility_matrix_filename"));
    if (table.header.size() < 3) {
        throw TabularSchemaException(TabularSchemaException::ErrorType::NotEnoughColumns, funcName,
            "expected origin, destination and weight columns in " + table.source);
    }

    std::vector<MobilityEdge> edges;
    edges.reserve(table.rows.size());
    for (size_t row = 0; row < table.rows.size(); ++row) {
        edges.push_back({table.indexAt(row, 0, funcName),
                         table.indexAt(row, 1, funcName),
                         table.numberAt(row, 2, funcName)});
    }
    return edges;
}

std::vector<MobilityReduction> TabularDataLoader::loadMobilityReduction(const std::string& filename) const {
    const std::string funcName = "TabularDataLoader::loadMobilityReduction";
    CsvTable table = readCsvTable(resolve(filename, "data.kappa0_filename"));
    const int dateCol = table.requireColumn("date", funcName);
    int reductionCol = table.columnIndex("reduction");
    if (reductionCol < 0) {
        if (table.header.size() < 2) {
            throw TabularSchemaException(TabularSchemaException::ErrorType::NotEnoughColumns, funcName,
                "expected date and reduction columns in " + table.source);
        }
        reductionCol = dateCol == 1 ? 0 : 1;
    }

    std::vector<MobilityReduction> series;
    series.reserve(table.rows.size());
    for (size_t row = 0; row < table.rows.size(); ++row) {
        const std::string& text = table.rows[row][static_cast<size_t>(dateCol)];
        boost::gregorian::date day;
        try {
            day = DateUtils::parseDate(text);
        } catch (const InvalidParameterException& e) {
            throw TabularSchemaException(TabularSchemaException::ErrorType::InvalidNumberFormat, funcName,
                std::string(e.what()) + " at line " + std::to_string(table.lineNumbers[row]) + " in " + table.source);
        }
        series.push_back({day, table.numberAt(row, reductionCol, funcName)});
    }
    return series;
}

std::vector<SeedEntry> TabularDataLoader::loadSeeds(const std::string& filename) const {
    const std::string funcName = "TabularDataLoader::loadSeeds";
    CsvTable table = readCsvTable(resolve(filename, "seeds"));
    const int idxCol = table.requireColumn("idx", funcName);
    const int seedCol = table.requireColumn("seed", funcName);

    std::vector<SeedEntry> seeds;
    seeds.reserve(table.rows.size());
    for (size_t row = 0; row < table.rows.size(); ++row) {
        seeds.push_back({table.indexAt(row, idxCol, funcName), table.numberAt(row, seedCol, funcName)});
    }
    return seeds;
}

} // namespace episim
