#ifndef VEIL_EXCEPTIONS_H
#define VEIL_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace Veil {

class VeilException : public std::runtime_error {
public:
    explicit VeilException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public VeilException {
public:
    explicit IOException(const std::string& message) : VeilException("IO Error: " + message) {}
};

// Source unreadable or malformed. Raised before detection runs on a document.
class AcquisitionException : public VeilException {
public:
    static constexpr const char* kPrefix = "Acquisition Error: ";

    explicit AcquisitionException(const std::string& message) : VeilException(kPrefix + message) {}
};

class ParseException : public VeilException {
public:
    explicit ParseException(const std::string& message) : VeilException("Parse Error: " + message) {}
};

class ConfigurationException : public VeilException {
public:
    explicit ConfigurationException(const std::string& message) : VeilException("Configuration Error: " + message) {}
};

} // namespace Veil

#endif // VEIL_EXCEPTIONS_H
