#include "utils/Logger.hpp"
#include "exceptions/Exceptions.hpp"

namespace compartmental {

LogLevel parseLogLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "fatal") return LogLevel::FATAL;

    THROW_CONFIGURATION_ERROR("parseLogLevel", "Unknown log level '" + name +
                              "'. Expected one of: debug, info, warning, error, fatal.");
}

} // namespace compartmental
