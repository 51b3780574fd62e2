#include "io/Hdf5Utils.hpp"
#include "utils/FileUtils.hpp"
#include "exceptions/Exceptions.hpp"

namespace episim {
namespace Hdf5Utils {

void writeStringAttribute(H5::H5Object& object, const std::string& name, const std::string& value) {
    H5::StrType type(H5::PredType::C_S1, value.empty() ? 1 : value.size());
    type.setCset(H5T_CSET_UTF8);
    H5::DataSpace scalar(H5S_SCALAR);
    H5::Attribute attribute = object.createAttribute(name, type, scalar);
    attribute.write(type, value);
}

std::string readStringAttribute(const H5::H5Object& object, const std::string& name) {
    if (!object.attrExists(name)) {
        return "";
    }
    H5::Attribute attribute = object.openAttribute(name);
    H5::StrType type = attribute.getStrType();
    std::string value;
    attribute.read(type, value);
    return value.c_str();
}

H5::DataSet writeStringDataset(H5::Group& parent, const std::string& name,
                               const std::vector<std::string>& values) {
    H5::StrType type(H5::PredType::C_S1, H5T_VARIABLE);
    type.setCset(H5T_CSET_UTF8);
    hsize_t dims[1] = {static_cast<hsize_t>(values.size())};
    H5::DataSpace space(1, dims);
    H5::DataSet dataset = parent.createDataSet(name, type, space);

    std::vector<const char*> pointers;
    pointers.reserve(values.size());
    for (const auto& v : values) {
        pointers.push_back(v.c_str());
    }
    if (!pointers.empty()) {
        dataset.write(pointers.data(), type);
    }
    return dataset;
}

std::vector<std::string> readStringDataset(const H5::DataSet& dataset) {
    H5::DataSpace space = dataset.getSpace();
    if (space.getSimpleExtentNdims() != 1) {
        throw FileIOException("Hdf5Utils::readStringDataset", "coordinate dataset is not one-dimensional");
    }
    hsize_t count = 0;
    space.getSimpleExtentDims(&count);

    std::vector<std::string> values;
    values.reserve(static_cast<size_t>(count));
    if (count == 0) {
        return values;
    }

    H5::StrType stored = dataset.getStrType();
    if (stored.isVariableStr()) {
        H5::StrType memType(H5::PredType::C_S1, H5T_VARIABLE);
        memType.setCset(stored.getCset());
        std::vector<char*> buffer(static_cast<size_t>(count), nullptr);
        dataset.read(buffer.data(), memType);
        for (char* s : buffer) {
            values.emplace_back(s ? s : "");
        }
        H5Dvlen_reclaim(memType.getId(), space.getId(), H5P_DEFAULT, buffer.data());
    } else {
        const size_t width = stored.getSize();
        std::vector<char> buffer(static_cast<size_t>(count) * width, '\0');
        dataset.read(buffer.data(), stored);
        for (size_t i = 0; i < static_cast<size_t>(count); ++i) {
            std::string s(buffer.data() + i * width, width);
            values.push_back(s.c_str());
        }
    }
    return values;
}

H5::DataSet writeDoubleDataset(H5::Group& parent, const std::string& name,
                               const std::vector<size_t>& shape, const std::vector<double>& values) {
    std::vector<hsize_t> dims(shape.begin(), shape.end());
    H5::DataSpace space(static_cast<int>(dims.size()), dims.data());
    H5::DataSet dataset = parent.createDataSet(name, H5::PredType::NATIVE_DOUBLE, space);
    if (!values.empty()) {
        dataset.write(values.data(), H5::PredType::NATIVE_DOUBLE);
    }
    return dataset;
}

NdArray readDoubleDataset(const H5::DataSet& dataset) {
    H5::DataSpace space = dataset.getSpace();
    const int rank = space.getSimpleExtentNdims();
    std::vector<hsize_t> dims(static_cast<size_t>(rank));
    if (rank > 0) {
        space.getSimpleExtentDims(dims.data());
    }
    NdArray array(std::vector<size_t>(dims.begin(), dims.end()));
    if (!array.values.empty()) {
        dataset.read(array.values.data(), H5::PredType::NATIVE_DOUBLE);
    }
    return array;
}

bool linkExists(const H5::Group& parent, const std::string& name) {
    return H5Lexists(parent.getId(), name.c_str(), H5P_DEFAULT) > 0;
}

std::vector<std::string> listDatasets(const H5::Group& parent) {
    std::vector<std::string> names;
    const hsize_t count = parent.getNumObjs();
    for (hsize_t i = 0; i < count; ++i) {
        std::string name = parent.getObjnameByIdx(i);
        if (parent.childObjType(name) == H5O_TYPE_DATASET) {
            names.push_back(name);
        }
    }
    return names;
}

H5::H5File openForReading(const std::string& path, const std::string& funcName) {
    if (!FileUtils::fileExists(path)) {
        throw MissingInputFileException(funcName, path, "array file not found");
    }
    try {
        H5::Exception::dontPrint();
        return H5::H5File(path, H5F_ACC_RDONLY);
    } catch (const H5::Exception& e) {
        throw FileIOException(funcName, "Unable to open " + path + ": " + e.getDetailMsg());
    }
}

} // namespace Hdf5Utils
} // namespace episim
