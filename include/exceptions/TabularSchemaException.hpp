#ifndef TABULAR_SCHEMA_EXCEPTION_HPP
#define TABULAR_SCHEMA_EXCEPTION_HPP

#include "exceptions/Exceptions.hpp"
#include <string>

namespace episim {

/**
 * @brief Exception class for delimited-text table errors
 *
 * Raised when a CSV input does not match the column layout or value types
 * the loader expects for it.
 */
class TabularSchemaException : public DataFormatException {
public:
    /**
     * @brief Kinds of table errors that can occur
     */
    enum class ErrorType {
        FileOpenError,       ///< The file exists but could not be read
        MissingColumn,       ///< A required header is absent
        NotEnoughColumns,    ///< Row has fewer fields than the header requires
        InvalidNumberFormat, ///< A cell could not be parsed as a number
        InvalidIndex         ///< An index is not integral or lies outside its range
    };

    /**
     * @brief Constructs a new table schema exception
     *
     * @param type The specific type of error that occurred
     * @param functionName Name of the throwing function
     * @param details Additional information (file, row, column)
     */
    TabularSchemaException(ErrorType type, const std::string& functionName, const std::string& details);

    /**
     * @brief Get the type of error that occurred
     */
    ErrorType getErrorType() const noexcept;

private:
    ErrorType errorType;

    static std::string createMessage(ErrorType type, const std::string& details);
};

} // namespace episim

#endif // TABULAR_SCHEMA_EXCEPTION_HPP
