#ifndef SURVEX_EXCEPTIONS_H
#define SURVEX_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace Survex {

class SurvexException : public std::runtime_error {
public:
    explicit SurvexException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public SurvexException {
public:
    explicit IOException(const std::string& message) : SurvexException("IO Error: " + message) {}
};

class TableException : public SurvexException {
public:
    explicit TableException(const std::string& message) : SurvexException("Table Error: " + message) {}
};

// Unknown strategy/method names, non-positive multipliers, unknown columns.
// Always propagated to the caller; never replaced by a default.
class ConfigurationException : public SurvexException {
public:
    explicit ConfigurationException(const std::string& message) : SurvexException("Configuration Error: " + message) {}
};

} // namespace Survex

#endif // SURVEX_EXCEPTIONS_H
