#pragma once

#include <stdexcept>
#include <string>

namespace planform {

class PlanformError : public std::runtime_error {
public:
    explicit PlanformError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public PlanformError {
public:
    explicit ConfigError(const std::string& message)
        : PlanformError("Config error: " + message) {}
};

class ValidationError : public PlanformError {
public:
    explicit ValidationError(const std::string& message)
        : PlanformError("Validation error: " + message) {}
};

// More than one configuration record was supplied to resolution.
class TooManyArgumentsError : public PlanformError {
public:
    explicit TooManyArgumentsError(const std::string& message)
        : PlanformError("Too many input arguments: " + message) {}
};

// The configuration argument is not a structured record.
class InvalidInputError : public PlanformError {
public:
    explicit InvalidInputError(const std::string& message)
        : PlanformError("Input not a data structure: " + message) {}
};

class UnsupportedTopologyError : public PlanformError {
public:
    explicit UnsupportedTopologyError(int component_count)
        : PlanformError("Planform component_count not allowed: " +
                        std::to_string(component_count) + " (expected 4 or 6)"),
          component_count_(component_count) {}

    int component_count() const noexcept { return component_count_; }

private:
    int component_count_;
};

class IOError : public PlanformError {
public:
    explicit IOError(const std::string& message)
        : PlanformError("I/O error: " + message) {}
};

class FitsError : public IOError {
public:
    explicit FitsError(const std::string& message)
        : IOError("FITS error: " + message) {}
};

class ImageWriteError : public IOError {
public:
    explicit ImageWriteError(const std::string& message)
        : IOError("Image write error: " + message) {}
};

} // namespace planform
