#ifndef EXCEPTIONS_HPP
#define EXCEPTIONS_HPP

#include <stdexcept>
#include <string>
#include <sstream>
#include <limits>

namespace compartmental {

    inline std::string buildErrorMessage(const char* file, int line, const std::string& functionName, const std::string& category, const std::string& message) {
        std::ostringstream oss;
        oss << "[" << file << ":" << line << " (" << functionName << ")] " << category << ": " << message;
        return oss.str();
    }

/**
 * @brief Base exception for compartmental modelling errors.
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
          functionName_(functionName), file_(nullptr), line_(0) {}

    /**
     * @brief Construct a ModelException that records its source location.
     * @param file Source file where the error was raised.
     * @param line Source line where the error was raised.
     * @param functionName Name of the function where the error occurred.
     * @param category Short error category prepended to the message.
     * @param message Descriptive error message.
     */
    ModelException(const char* file, int line, const std::string& functionName,
                   const std::string& category, const std::string& message)
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
 * @brief Invalid model topology, parameters, initial state or time grid.
 *
 * Always raised before any integration work starts.
 */
class ConfigurationException : public ModelException {
public:
    ConfigurationException(const std::string& functionName, const std::string& message)
        : ModelException(functionName, "Configuration Error: " + message) {}
    ConfigurationException(const char* file, int line, const std::string& functionName, const std::string& message)
        : ModelException(file, line, functionName, "Configuration Error", message) {}
};

/**
 * @brief The ODE solver failed to produce a complete, valid trajectory.
 *
 * Carries the furthest output time point that was successfully produced,
 * or NaN when not even the initial point was recorded.
 */
class IntegrationException : public ModelException {
public:
    IntegrationException(const std::string& functionName, const std::string& message,
                         double lastTimeReached = std::numeric_limits<double>::quiet_NaN())
        : ModelException(functionName, "Integration Error: " + message),
          lastTimeReached_(lastTimeReached) {}
    IntegrationException(const char* file, int line, const std::string& functionName,
                         const std::string& message, double lastTimeReached)
        : ModelException(file, line, functionName, "Integration Error", message),
          lastTimeReached_(lastTimeReached) {}

    /**
     * @brief Furthest output time point successfully reached before the failure.
     */
    double getLastTimeReached() const noexcept { return lastTimeReached_; }

private:
    double lastTimeReached_;
};

/**
 * @brief Exception for file input/output errors.
 */
class FileIOException : public ModelException {
public:
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
 * @brief Exception for invalid simulation results.
 */
class InvalidResultException : public ModelException {
public:
    InvalidResultException(const std::string& functionName, const std::string& message)
        : ModelException(functionName, "Invalid Result: " + message) {}
};

/**
 * @brief Exception for out-of-range access.
 */
class OutOfRangeException : public ModelException {
public:
    OutOfRangeException(const char* file, int line, const std::string& functionName, const std::string& message)
        : ModelException(file, line, functionName, "Out Of Range", message) {}
};

} // namespace compartmental

#define THROW_CONFIGURATION_ERROR(func, msg) throw compartmental::ConfigurationException(__FILE__, __LINE__, func, msg)
#define THROW_INTEGRATION_ERROR(func, msg, t) throw compartmental::IntegrationException(__FILE__, __LINE__, func, msg, t)
#define THROW_OUT_OF_RANGE(func, msg) throw compartmental::OutOfRangeException(__FILE__, __LINE__, func, msg)

#endif // EXCEPTIONS_HPP
