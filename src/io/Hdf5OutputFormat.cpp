#include "io/Hdf5OutputFormat.hpp"
#include "io/Hdf5Utils.hpp"
#include "utils/FileUtils.hpp"
#include "exceptions/Exceptions.hpp"
#include <H5Cpp.h>
#include <sstream>

namespace episim {

namespace {

const char* const COORDS_GROUP = "coords";

} // namespace

void Hdf5OutputFormat::write(const std::string& path, const ArrayDataset& dataset) const {
    const std::string funcName = "Hdf5OutputFormat::write";
    FileUtils::removeFileIfExists(path);

    try {
        H5::Exception::dontPrint();
        H5::H5File file(path, H5F_ACC_TRUNC);

        H5::Group coords = file.createGroup(COORDS_GROUP);
        for (const auto& dim : dataset.getDimensions()) {
            H5::DataSet ds = Hdf5Utils::writeStringDataset(coords, dim.name, dim.coordinates);
            Hdf5Utils::writeStringAttribute(ds, "description", dim.description);
            Hdf5Utils::writeStringAttribute(ds, "Unit", dim.unit);
        }

        for (const auto& var : dataset.getVariables()) {
            H5::DataSet ds = Hdf5Utils::writeDoubleDataset(file, var.name, dataset.shapeOf(var), var.values);
            std::string dims;
            for (const auto& d : var.dimensions) {
                dims += (dims.empty() ? "" : ",") + d;
            }
            Hdf5Utils::writeStringAttribute(ds, "dims", dims);
            Hdf5Utils::writeStringAttribute(ds, "description", var.description);
        }
    } catch (const H5::Exception& e) {
        throw FileIOException(funcName, "Writing " + path + " failed: " + e.getDetailMsg());
    }
}

NdArray Hdf5OutputFormat::readArray(const std::string& path, const std::string& variable) const {
    const std::string funcName = "Hdf5OutputFormat::readArray";
    H5::H5File file = Hdf5Utils::openForReading(path, funcName);
    if (!Hdf5Utils::linkExists(file, variable)) {
        throw FileIOException(funcName, "Dataset '" + variable + "' not found in " + path);
    }
    try {
        return Hdf5Utils::readDoubleDataset(file.openDataSet(variable));
    } catch (const H5::Exception& e) {
        throw FileIOException(funcName, "Reading '" + variable + "' from " + path + " failed: " + e.getDetailMsg());
    }
}

std::vector<std::string> Hdf5OutputFormat::listVariables(const std::string& path) const {
    const std::string funcName = "Hdf5OutputFormat::listVariables";
    H5::H5File file = Hdf5Utils::openForReading(path, funcName);
    try {
        return Hdf5Utils::listDatasets(file);
    } catch (const H5::Exception& e) {
        throw FileIOException(funcName, "Listing " + path + " failed: " + e.getDetailMsg());
    }
}

std::vector<std::string> Hdf5OutputFormat::readCoordinates(const std::string& path, const std::string& dimension) const {
    const std::string funcName = "Hdf5OutputFormat::readCoordinates";
    H5::H5File file = Hdf5Utils::openForReading(path, funcName);
    const std::string name = std::string(COORDS_GROUP) + "/" + dimension;
    if (!Hdf5Utils::linkExists(file, COORDS_GROUP) || !Hdf5Utils::linkExists(file, name)) {
        throw FileIOException(funcName, "Coordinates '" + dimension + "' not found in " + path);
    }
    try {
        return Hdf5Utils::readStringDataset(file.openDataSet(name));
    } catch (const H5::Exception& e) {
        throw FileIOException(funcName, "Reading coordinates '" + dimension + "' failed: " + e.getDetailMsg());
    }
}

std::vector<std::string> Hdf5OutputFormat::readDimensionNames(const std::string& path, const std::string& variable) const {
    const std::string funcName = "Hdf5OutputFormat::readDimensionNames";
    H5::H5File file = Hdf5Utils::openForReading(path, funcName);
    if (!Hdf5Utils::linkExists(file, variable)) {
        throw FileIOException(funcName, "Dataset '" + variable + "' not found in " + path);
    }
    std::string joined;
    try {
        joined = Hdf5Utils::readStringAttribute(file.openDataSet(variable), "dims");
    } catch (const H5::Exception& e) {
        throw FileIOException(funcName, "Reading dims of '" + variable + "' failed: " + e.getDetailMsg());
    }
    std::vector<std::string> names;
    std::stringstream ss(joined);
    std::string item;
    while (std::getline(ss, item, ',')) {
        names.push_back(item);
    }
    return names;
}

} // namespace episim
