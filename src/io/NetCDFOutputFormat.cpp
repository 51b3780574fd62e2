#include "io/NetCDFOutputFormat.hpp"
#include "io/Hdf5Utils.hpp"
#include "utils/FileUtils.hpp"
#include "exceptions/Exceptions.hpp"
#include <H5Cpp.h>
#include <hdf5_hl.h>
#include <map>

namespace episim {

namespace {

void writeDimensionId(H5::DataSet& scale, int dimensionId) {
    H5::DataSpace scalar(H5S_SCALAR);
    H5::Attribute attribute = scale.createAttribute("_Netcdf4Dimid", H5::PredType::NATIVE_INT, scalar);
    attribute.write(H5::PredType::NATIVE_INT, &dimensionId);
}

} // namespace

void NetCDFOutputFormat::write(const std::string& path, const ArrayDataset& dataset) const {
    const std::string funcName = "NetCDFOutputFormat::write";
    FileUtils::removeFileIfExists(path);

    try {
        H5::Exception::dontPrint();

        H5::FileCreatPropList fcpl;
        H5Pset_link_creation_order(fcpl.getId(), H5P_CRT_ORDER_TRACKED | H5P_CRT_ORDER_INDEXED);
        H5Pset_attr_creation_order(fcpl.getId(), H5P_CRT_ORDER_TRACKED | H5P_CRT_ORDER_INDEXED);
        H5::FileAccPropList fapl;
        H5Pset_libver_bounds(fapl.getId(), H5F_LIBVER_EARLIEST, H5F_LIBVER_LATEST);

        H5::H5File file(path, H5F_ACC_TRUNC, fcpl, fapl);

        std::map<std::string, H5::DataSet> scales;
        int dimensionId = 0;
        for (const auto& dim : dataset.getDimensions()) {
            H5::DataSet scale = Hdf5Utils::writeStringDataset(file, dim.name, dim.coordinates);
            if (H5DSset_scale(scale.getId(), dim.name.c_str()) < 0) {
                throw FileIOException(funcName, "Unable to register dimension '" + dim.name + "' in " + path);
            }
            writeDimensionId(scale, dimensionId++);
            Hdf5Utils::writeStringAttribute(scale, "description", dim.description);
            Hdf5Utils::writeStringAttribute(scale, "Unit", dim.unit);
            scales.emplace(dim.name, scale);
        }

        for (const auto& var : dataset.getVariables()) {
            H5::DataSet data = Hdf5Utils::writeDoubleDataset(file, var.name, dataset.shapeOf(var), var.values);
            for (size_t axis = 0; axis < var.dimensions.size(); ++axis) {
                const H5::DataSet& scale = scales.at(var.dimensions[axis]);
                if (H5DSattach_scale(data.getId(), scale.getId(), static_cast<unsigned int>(axis)) < 0) {
                    throw FileIOException(funcName, "Unable to attach dimension '" + var.dimensions[axis] +
                                                    "' to variable '" + var.name + "' in " + path);
                }
            }
            Hdf5Utils::writeStringAttribute(data, "description", var.description);
        }
    } catch (const H5::Exception& e) {
        throw FileIOException(funcName, "Writing " + path + " failed: " + e.getDetailMsg());
    }
}

NdArray NetCDFOutputFormat::readArray(const std::string& path, const std::string& variable) const {
    const std::string funcName = "NetCDFOutputFormat::readArray";
    H5::H5File file = Hdf5Utils::openForReading(path, funcName);
    if (!Hdf5Utils::linkExists(file, variable)) {
        throw FileIOException(funcName, "Variable '" + variable + "' not found in " + path);
    }
    try {
        return Hdf5Utils::readDoubleDataset(file.openDataSet(variable));
    } catch (const H5::Exception& e) {
        throw FileIOException(funcName, "Reading '" + variable + "' from " + path + " failed: " + e.getDetailMsg());
    }
}

std::vector<std::string> NetCDFOutputFormat::listVariables(const std::string& path) const {
    const std::string funcName = "NetCDFOutputFormat::listVariables";
    H5::H5File file = Hdf5Utils::openForReading(path, funcName);
    std::vector<std::string> variables;
    try {
        for (const auto& name : Hdf5Utils::listDatasets(file)) {
            H5::DataSet ds = file.openDataSet(name);
            if (H5DSis_scale(ds.getId()) <= 0) {
                variables.push_back(name);
            }
        }
    } catch (const H5::Exception& e) {
        throw FileIOException(funcName, "Listing " + path + " failed: " + e.getDetailMsg());
    }
    return variables;
}

std::vector<std::string> NetCDFOutputFormat::readCoordinates(const std::string& path, const std::string& dimension) const {
    const std::string funcName = "NetCDFOutputFormat::readCoordinates";
    H5::H5File file = Hdf5Utils::openForReading(path, funcName);
    if (!Hdf5Utils::linkExists(file, dimension)) {
        throw FileIOException(funcName, "Dimension '" + dimension + "' not found in " + path);
    }
    try {
        return Hdf5Utils::readStringDataset(file.openDataSet(dimension));
    } catch (const H5::Exception& e) {
        throw FileIOException(funcName, "Reading coordinates '" + dimension + "' failed: " + e.getDetailMsg());
    }
}

} // namespace episim
