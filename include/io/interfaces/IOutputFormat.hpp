#ifndef I_OUTPUT_FORMAT_HPP
#define I_OUTPUT_FORMAT_HPP

#include <string>
#include <vector>
#include "io/ArrayDataset.hpp"

namespace episim {

/**
 * @brief Interface for on-disk array formats.
 *
 * Implementations are interchangeable: the serializer builds an ArrayDataset
 * and the format decides how dimensions, coordinates and attributes are laid
 * out in the file.
 */
class IOutputFormat {
public:
    virtual ~IOutputFormat() = default;

    /**
     * @brief Name used in `simulation.output_format` / `simulation.init_format`.
     */
    virtual std::string getName() const = 0;

    /**
     * @brief File extension including the dot (e.g. ".nc").
     */
    virtual std::string getFileExtension() const = 0;

    /**
     * @brief Writes a dataset, replacing any existing file at @p path.
     * @throws FileIOException If the file cannot be written.
     */
    virtual void write(const std::string& path, const ArrayDataset& dataset) const = 0;

    /**
     * @brief Reads one variable as a dense array of doubles.
     * @throws MissingInputFileException If the file does not exist.
     * @throws FileIOException If the variable is absent or unreadable.
     */
    virtual NdArray readArray(const std::string& path, const std::string& variable) const = 0;

    /**
     * @brief Names of the data variables in a file (coordinates excluded).
     */
    virtual std::vector<std::string> listVariables(const std::string& path) const = 0;

    /**
     * @brief Coordinate labels of a dimension.
     */
    virtual std::vector<std::string> readCoordinates(const std::string& path, const std::string& dimension) const = 0;
};

} // namespace episim

#endif // I_OUTPUT_FORMAT_HPP
