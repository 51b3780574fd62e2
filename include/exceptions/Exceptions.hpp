#ifndef EXCEPTIONS_HPP
#define EXCEPTIONS_HPP

#include <stdexcept>
#include <string>
#include <sstream>

namespace episim {

    inline std::string buildErrorMessage(const char* file, int line, const std::string& functionName, const std::string& category, const std::string& message) {
        std::ostringstream oss;
        oss << "[" << file << ":" << line << " (" << functionName << ")] " << category << ": " << message;
        return oss.str();
    }

/**
 * @brief Base exception for the simulation pipeline.
 */
class ModelException : public std::runtime_error {
public:
    /**
     * @brief Construct a ModelException.
     * @param functionName Name of the function where the error occurred.
     * @param message Descriptive error message.
     */
    ModelException(const std::string& functionName, const std::string& message)
        : std::runtime_error("[" + functionName + "] " + message),
          functionName_(functionName), file_(""), line_(0) {}
    ModelException(const char* file, int line, const std::string& functionName, const std::string& category, const std::string& message)
        : std::runtime_error(buildErrorMessage(file, line, functionName, category, message)),
          functionName_(functionName), file_(file), line_(line) {}

    /**
     * @brief Get the originating function's name.
     * @return const std::string& Function name.
     */
    const std::string& getFunctionName() const noexcept {
        return functionName_;
    }
    const char* getFile() const noexcept { return file_; }
    int getLine() const noexcept { return line_; }

private:
    std::string functionName_;
    const char* file_;
    int line_;
};

/**
 * @brief Exception for invalid method parameters or inconsistent dimensions.
 */
class InvalidParameterException : public ModelException {
public:
    InvalidParameterException(const char* file, int line, const std::string& functionName, const std::string& message)
        : ModelException(file, line, functionName, "Invalid Parameter", message) {}
};

/**
 * @brief Exception for file input/output errors.
 */
class FileIOException : public ModelException {
public:
    /**
     * @brief Construct a FileIOException.
     * @param functionName Name of the function where the error occurred.
     * @param message Details about the file I/O error.
     */
    FileIOException(const std::string& functionName, const std::string& message)
        : ModelException(functionName, "File IO Error: " + message) {}
};

/**
 * @brief Exception for data parsing or format errors.
 */
class DataFormatException : public ModelException {
public:
    DataFormatException(const std::string& functionName, const std::string& message)
        : ModelException(functionName, "Data Format Error: " + message) {}
};

/**
 * @brief A configuration section or structural key is missing, or the config is not valid JSON.
 */
class ConfigSchemaException : public ModelException {
public:
    /**
     * @param functionName Name of the function where the error occurred.
     * @param missingSection The section (or dotted key) that could not be found. Empty for parse errors.
     * @param message Details for the user.
     */
    ConfigSchemaException(const std::string& functionName, const std::string& missingSection, const std::string& message)
        : ModelException(functionName, "Config Schema Error: " + message),
          missingSection_(missingSection) {}

    const std::string& getMissingSection() const noexcept { return missingSection_; }

private:
    std::string missingSection_;
};

/**
 * @brief The engine identifier does not name a known engine variant.
 */
class UnknownEngineException : public ModelException {
public:
    UnknownEngineException(const std::string& functionName, const std::string& engineId, const std::string& message)
        : ModelException(functionName, "Unknown Engine: " + message),
          engineId_(engineId) {}

    const std::string& getEngineId() const noexcept { return engineId_; }

private:
    std::string engineId_;
};

/**
 * @brief A file declared by the configuration does not exist.
 */
class MissingInputFileException : public FileIOException {
public:
    MissingInputFileException(const std::string& functionName, const std::string& path, const std::string& message)
        : FileIOException(functionName, "Missing input file '" + path + "': " + message),
          path_(path) {}

    const std::string& getPath() const noexcept { return path_; }

private:
    std::string path_;
};

/**
 * @brief A required parameter is neither given nor derivable.
 */
class MissingParameterException : public ModelException {
public:
    MissingParameterException(const std::string& functionName, const std::string& parameterName, const std::string& message)
        : ModelException(functionName, "Missing Parameter '" + parameterName + "': " + message),
          parameterName_(parameterName) {}

    const std::string& getParameterName() const noexcept { return parameterName_; }

private:
    std::string parameterName_;
};

/**
 * @brief NPI vectors are misaligned or their change-points are not ordered.
 */
class NPIScheduleException : public ModelException {
public:
    NPIScheduleException(const std::string& functionName, const std::string& message)
        : ModelException(functionName, "NPI Schedule Error: " + message) {}
};

/**
 * @brief An initial-condition array does not have the shape the engine variant expects.
 */
class InitialConditionShapeException : public ModelException {
public:
    InitialConditionShapeException(const std::string& functionName, const std::string& message)
        : ModelException(functionName, "Initial Condition Shape Error: " + message) {}
};

/**
 * @brief A requested snapshot step lies outside the simulated horizon.
 */
class ExportIndexOutOfRangeException : public ModelException {
public:
    ExportIndexOutOfRangeException(const char* file, int line, const std::string& functionName, const std::string& message)
        : ModelException(file, line, functionName, "Export Index Out Of Range", message) {}
};

/**
 * @brief Failure raised by (or while locating) the spreading engine.
 */
class SpreadingEngineException : public ModelException {
public:
    SpreadingEngineException(const std::string& functionName, const std::string& message)
        : ModelException(functionName, "Spreading Engine Error: " + message) {}
};

} // namespace episim

#define THROW_INVALID_PARAM(func, msg) throw episim::InvalidParameterException(__FILE__, __LINE__, func, msg)
#define THROW_EXPORT_OUT_OF_RANGE(func, msg) throw episim::ExportIndexOutOfRangeException(__FILE__, __LINE__, func, msg)
#define THROW_NPI_ERROR(func, msg) throw episim::NPIScheduleException(func, msg)
#define THROW_ENGINE_ERROR(func, msg) throw episim::SpreadingEngineException(func, msg)

#endif // EXCEPTIONS_HPP
