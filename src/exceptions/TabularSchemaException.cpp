#include "exceptions/TabularSchemaException.hpp"
#include <string>

namespace episim {

    TabularSchemaException::TabularSchemaException(ErrorType type, const std::string& functionName, const std::string& details)
    : DataFormatException(functionName, createMessage(type, details)),
      errorType(type) {}

    TabularSchemaException::ErrorType TabularSchemaException::getErrorType() const noexcept {
        return errorType;
    }

    std::string TabularSchemaException::createMessage(ErrorType type, const std::string& details) {
        std::string baseMsg;
        switch (type) {
            case ErrorType::FileOpenError:
                baseMsg = "Could not open table";
                break;
            case ErrorType::MissingColumn:
                baseMsg = "Missing column";
                break;
            case ErrorType::NotEnoughColumns:
                baseMsg = "Not enough columns";
                break;
            case ErrorType::InvalidNumberFormat:
                baseMsg = "Invalid number format";
                break;
            case ErrorType::InvalidIndex:
                baseMsg = "Invalid index";
                break;
            default:
                 baseMsg = "Unknown table error";
                 break;
        }
        return baseMsg + (details.empty() ? "" : ": " + details);
    }
}
