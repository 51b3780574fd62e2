#include "io/ArrayDataset.hpp"
#include "exceptions/Exceptions.hpp"
#include <sstream>

namespace episim {

NdArray::NdArray(std::vector<size_t> dims)
    : shape(std::move(dims)) {
    values.assign(size(), 0.0);
}

size_t NdArray::size() const {
    size_t total = 1;
    for (size_t d : shape) {
        total *= d;
    }
    return shape.empty() ? 0 : total;
}

size_t NdArray::offset(const std::vector<size_t>& index) const {
    if (index.size() != shape.size()) {
        THROW_INVALID_PARAM("NdArray::offset", "index of rank " + std::to_string(index.size()) +
                                               " for array of shape " + shapeString());
    }
    size_t off = 0;
    for (size_t i = 0; i < shape.size(); ++i) {
        if (index[i] >= shape[i]) {
            THROW_INVALID_PARAM("NdArray::offset", "index " + std::to_string(index[i]) + " out of range on axis " +
                                                   std::to_string(i) + " of shape " + shapeString());
        }
        off = off * shape[i] + index[i];
    }
    return off;
}

std::string NdArray::shapeString() const {
    std::ostringstream oss;
    oss << "(";
    for (size_t i = 0; i < shape.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << shape[i];
    }
    oss << ")";
    return oss.str();
}

void ArrayDataset::addDimension(Dimension dimension) {
    if (hasDimension(dimension.name)) {
        THROW_INVALID_PARAM("ArrayDataset::addDimension", "duplicate dimension '" + dimension.name + "'");
    }
    dimensions_.push_back(std::move(dimension));
}

void ArrayDataset::addVariable(Variable variable) {
    if (hasVariable(variable.name) || hasDimension(variable.name)) {
        THROW_INVALID_PARAM("ArrayDataset::addVariable", "name '" + variable.name + "' already used");
    }
    size_t expected = 1;
    for (const auto& dimName : variable.dimensions) {
        expected *= getDimension(dimName).size();
    }
    if (variable.values.size() != expected) {
        THROW_INVALID_PARAM("ArrayDataset::addVariable", "variable '" + variable.name + "' has " +
                            std::to_string(variable.values.size()) + " values, dimensions require " +
                            std::to_string(expected));
    }
    variables_.push_back(std::move(variable));
}

const Dimension& ArrayDataset::getDimension(const std::string& name) const {
    for (const auto& d : dimensions_) {
        if (d.name == name) return d;
    }
    THROW_INVALID_PARAM("ArrayDataset::getDimension", "unknown dimension '" + name + "'");
}

const Variable& ArrayDataset::getVariable(const std::string& name) const {
    for (const auto& v : variables_) {
        if (v.name == name) return v;
    }
    THROW_INVALID_PARAM("ArrayDataset::getVariable", "unknown variable '" + name + "'");
}

bool ArrayDataset::hasDimension(const std::string& name) const {
    for (const auto& d : dimensions_) {
        if (d.name == name) return true;
    }
    return false;
}

bool ArrayDataset::hasVariable(const std::string& name) const {
    for (const auto& v : variables_) {
        if (v.name == name) return true;
    }
    return false;
}

std::vector<size_t> ArrayDataset::shapeOf(const Variable& variable) const {
    std::vector<size_t> shape;
    for (const auto& dimName : variable.dimensions) {
        shape.push_back(getDimension(dimName).size());
    }
    return shape;
}

} // namespace episim
