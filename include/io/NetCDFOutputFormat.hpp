#ifndef NETCDF_OUTPUT_FORMAT_HPP
#define NETCDF_OUTPUT_FORMAT_HPP

#include "io/interfaces/IOutputFormat.hpp"

namespace episim {

/**
 * @brief Self-describing netCDF-4 layout, written through HDF5.
 *
 * Every dimension becomes a string coordinate variable registered as an HDF5
 * dimension scale, and every data variable has its axes attached to those
 * scales. Link and attribute creation order are tracked. That is the
 * layout netCDF-4 readers expect, so the files open as ordinary netCDF
 * datasets with named dimensions and `description`/`Unit` attributes.
 *
 * No netCDF library is linked. Compatibility rests on the netCDF-4 storage
 * conventions: one dimension scale per dimension named after it, a
 * `_Netcdf4Dimid` attribute numbering the dimensions in creation order,
 * scales attached axis by axis, and coordinates stored as UTF-8
 * variable-length strings (NC_STRING). Files are not checked against a
 * netCDF reader here.
 */
class NetCDFOutputFormat : public IOutputFormat {
public:
    std::string getName() const override { return "netcdf"; }
    std::string getFileExtension() const override { return ".nc"; }

    void write(const std::string& path, const ArrayDataset& dataset) const override;
    NdArray readArray(const std::string& path, const std::string& variable) const override;
    std::vector<std::string> listVariables(const std::string& path) const override;
    std::vector<std::string> readCoordinates(const std::string& path, const std::string& dimension) const override;
};

} // namespace episim

#endif // NETCDF_OUTPUT_FORMAT_HPP
