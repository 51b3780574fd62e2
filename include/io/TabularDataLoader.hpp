#ifndef TABULAR_DATA_LOADER_HPP
#define TABULAR_DATA_LOADER_HPP

#include <string>
#include <vector>
#include <Eigen/Dense>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "exceptions/TabularSchemaException.hpp"

namespace episim {

/**
 * @brief Raw delimited-text table: a header row plus string cells.
 */
struct CsvTable {
    std::string source;                         ///< Path the table was read from.
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;
    std::vector<int> lineNumbers;               ///< 1-based file line of each row.

    /**
     * @brief Position of a named column.
     * @return Index, or -1 if absent.
     */
    int columnIndex(const std::string& name) const;

    /**
     * @brief Like columnIndex() but throws TabularSchemaException::MissingColumn.
     */
    int requireColumn(const std::string& name, const std::string& funcName) const;

    /**
     * @brief Parses cell (row, col) as a floating point value.
     * @throws TabularSchemaException On empty or non-numeric content
     */
    double numberAt(size_t row, int col, const std::string& funcName) const;

    /**
     * @brief Parses cell (row, col) as an integral index.
     * @throws TabularSchemaException If the value is not an integer
     */
    int indexAt(size_t row, int col, const std::string& funcName) const;
};

/// Population of one patch, broken down by age group.
struct MetapopulationTable {
    std::vector<std::string> ids;       ///< Patch identifiers (M)
    Eigen::VectorXd area;               ///< Patch surface (M)
    Eigen::MatrixXd populationByAge;    ///< Raw counts, age x patch (G x M)
    Eigen::VectorXd total;              ///< Declared patch totals (M)
};

/// Directed flow between two patches (0-based indices).
struct MobilityEdge {
    int origin;
    int destination;
    double weight;
};

/// One row of the daily mobility-reduction series.
struct MobilityReduction {
    boost::gregorian::date date;
    double reduction;
};

/// Seeded asymptomatic individuals at a patch (0-based index).
struct SeedEntry {
    int patch;
    double seed;
};

/**
 * @brief Reads a CSV file with a header row.
 *
 * Blank lines and lines starting with "//" are skipped. Fields may be
 * double-quoted. Every data row must have as many fields as the header.
 *
 * @throws MissingInputFileException If the file does not exist
 * @throws TabularSchemaException If the file is empty or a row is short
 */
CsvTable readCsvTable(const std::string& path);

/**
 * @brief Loads the input tables a run needs from a data folder.
 */
class TabularDataLoader {
public:
    explicit TabularDataLoader(std::string dataFolder);

    const std::string& getDataFolder() const { return dataFolder_; }

    /**
     * @brief Resolves a file name declared in the config against the data folder.
     * @param filename [in] File name (absolute paths are kept)
     * @param configKey [in] Key the name came from, for diagnostics
     * @throws MissingInputFileException If the resolved file does not exist
     */
    std::string resolve(const std::string& filename, const std::string& configKey) const;

    /**
     * @brief Loads the metapopulation table.
     *
     * Requires columns id, area, total and one column per age label.
     */
    MetapopulationTable loadMetapopulation(const std::string& filename,
                                           const std::vector<std::string>& ageLabels) const;

    /**
     * @brief Loads the mobility edge list (origin, destination, weight in the first three columns).
     */
    std::vector<MobilityEdge> loadMobilityEdges(const std::string& filename) const;

    /**
     * @brief Loads the (date, reduction) series used to override NPI confinement levels.
     */
    std::vector<MobilityReduction> loadMobilityReduction(const std::string& filename) const;

    /**
     * @brief Loads a seed table with columns idx and seed.
     */
    std::vector<SeedEntry> loadSeeds(const std::string& filename) const;

private:
    std::string dataFolder_;
};

} // namespace episim

#endif // TABULAR_DATA_LOADER_HPP
