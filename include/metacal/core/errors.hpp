#pragma once

#include <stdexcept>
#include <string>

namespace metacal {

class MetacalError : public std::runtime_error {
public:
    explicit MetacalError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public MetacalError {
public:
    explicit ConfigError(const std::string& message)
        : MetacalError("Config error: " + message) {}
};

class ValidationError : public MetacalError {
public:
    explicit ValidationError(const std::string& message)
        : MetacalError("Validation error: " + message) {}
};

class NumericalError : public MetacalError {
public:
    explicit NumericalError(const std::string& message)
        : MetacalError("Numerical error: " + message) {}
};

class SingularMatrixError : public NumericalError {
public:
    explicit SingularMatrixError(const std::string& message)
        : NumericalError("singular matrix: " + message) {}
};

class IOError : public MetacalError {
public:
    explicit IOError(const std::string& message)
        : MetacalError("I/O error: " + message) {}
};

class FitsError : public IOError {
public:
    explicit FitsError(const std::string& message)
        : IOError("FITS error: " + message) {}
};

} // namespace metacal
