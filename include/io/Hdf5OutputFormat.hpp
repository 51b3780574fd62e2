#ifndef HDF5_OUTPUT_FORMAT_HPP
#define HDF5_OUTPUT_FORMAT_HPP

#include "io/interfaces/IOutputFormat.hpp"

namespace episim {

/**
 * @brief Plain hierarchical HDF5 layout.
 *
 * Variables are datasets at the root carrying a `dims` attribute (comma
 * separated dimension names) and a `description`. Coordinates are string
 * datasets under `/coords`.
 */
class Hdf5OutputFormat : public IOutputFormat {
public:
    std::string getName() const override { return "hdf5"; }
    std::string getFileExtension() const override { return ".h5"; }

    void write(const std::string& path, const ArrayDataset& dataset) const override;
    NdArray readArray(const std::string& path, const std::string& variable) const override;
    std::vector<std::string> listVariables(const std::string& path) const override;
    std::vector<std::string> readCoordinates(const std::string& path, const std::string& dimension) const override;

    /**
     * @brief Dimension names stored on a variable.
     */
    std::vector<std::string> readDimensionNames(const std::string& path, const std::string& variable) const;
};

} // namespace episim

#endif // HDF5_OUTPUT_FORMAT_HPP
