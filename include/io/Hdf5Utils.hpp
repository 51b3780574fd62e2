#ifndef HDF5_UTILS_HPP
#define HDF5_UTILS_HPP

#include <string>
#include <vector>
#include <H5Cpp.h>
#include "io/ArrayDataset.hpp"

namespace episim {
namespace Hdf5Utils {

    /// @brief Attaches a scalar fixed-length string attribute.
    void writeStringAttribute(H5::H5Object& object, const std::string& name, const std::string& value);

    /// @brief Reads a string attribute, or returns an empty string when absent.
    std::string readStringAttribute(const H5::H5Object& object, const std::string& name);

    /// @brief Creates a 1-D dataset of variable-length strings.
    H5::DataSet writeStringDataset(H5::Group& parent, const std::string& name,
                                   const std::vector<std::string>& values);

    /// @brief Reads a 1-D string dataset (fixed or variable length).
    std::vector<std::string> readStringDataset(const H5::DataSet& dataset);

    /// @brief Creates an n-D dataset of doubles with the given shape.
    H5::DataSet writeDoubleDataset(H5::Group& parent, const std::string& name,
                                   const std::vector<size_t>& shape, const std::vector<double>& values);

    /// @brief Reads an n-D dataset of doubles.
    NdArray readDoubleDataset(const H5::DataSet& dataset);

    /// @brief True if @p name is a link inside @p parent.
    bool linkExists(const H5::Group& parent, const std::string& name);

    /// @brief Names of the datasets directly below @p parent, in creation order when tracked.
    std::vector<std::string> listDatasets(const H5::Group& parent);

    /**
     * @brief Opens a file for reading.
     * @throws MissingInputFileException If the file does not exist.
     * @throws FileIOException If HDF5 cannot open it.
     */
    H5::H5File openForReading(const std::string& path, const std::string& funcName);

} // namespace Hdf5Utils
} // namespace episim

#endif // HDF5_UTILS_HPP
