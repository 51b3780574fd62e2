#ifndef ARRAY_DATASET_HPP
#define ARRAY_DATASET_HPP

#include <string>
#include <vector>

namespace episim {

/**
 * @brief Dense row-major n-dimensional array of doubles.
 */
struct NdArray {
    std::vector<size_t> shape;
    std::vector<double> values;

    NdArray() = default;
    explicit NdArray(std::vector<size_t> dims);

    /** @brief Product of the extents. */
    size_t size() const;

    /**
     * @brief Row-major offset of a multi-index.
     * @throws InvalidParameterException If the rank or an index is out of range
     */
    size_t offset(const std::vector<size_t>& index) const;

    double& at(const std::vector<size_t>& index) { return values[offset(index)]; }
    double at(const std::vector<size_t>& index) const { return values[offset(index)]; }

    /** @brief Shape rendered as "(a, b, c)". */
    std::string shapeString() const;
};

/**
 * @brief Named axis with string coordinates.
 */
struct Dimension {
    std::string name;
    std::vector<std::string> coordinates;
    std::string description;
    std::string unit = "unitless";

    size_t size() const { return coordinates.size(); }
};

/**
 * @brief Named array laid out over dataset dimensions.
 */
struct Variable {
    std::string name;
    std::vector<std::string> dimensions;
    std::string description;
    std::vector<double> values;     ///< Row-major over @c dimensions.
};

/**
 * @brief Self-describing collection of dimensions and variables.
 *
 * Output formats receive a dataset and decide how to lay it out on disk.
 */
class ArrayDataset {
public:
    /**
     * @brief Adds an axis.
     * @throws InvalidParameterException If a dimension with the same name exists
     */
    void addDimension(Dimension dimension);

    /**
     * @brief Adds a variable after checking it against the declared dimensions.
     * @throws InvalidParameterException On unknown dimensions or a value count mismatch
     */
    void addVariable(Variable variable);

    const std::vector<Dimension>& getDimensions() const { return dimensions_; }
    const std::vector<Variable>& getVariables() const { return variables_; }

    /** @throws InvalidParameterException If the dimension is unknown */
    const Dimension& getDimension(const std::string& name) const;
    /** @throws InvalidParameterException If the variable is unknown */
    const Variable& getVariable(const std::string& name) const;

    bool hasDimension(const std::string& name) const;
    bool hasVariable(const std::string& name) const;

    /** @brief Extents of a variable, in its dimension order. */
    std::vector<size_t> shapeOf(const Variable& variable) const;

private:
    std::vector<Dimension> dimensions_;
    std::vector<Variable> variables_;
};

} // namespace episim

#endif // ARRAY_DATASET_HPP
