#ifndef GEOMETRA_EXCEPTIONS_H
#define GEOMETRA_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace Geometra {

class GeometraException : public std::runtime_error {
public:
    explicit GeometraException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public GeometraException {
public:
    explicit IOException(const std::string& message) : GeometraException("IO Error: " + message) {}
};

class ConfigurationException : public GeometraException {
public:
    explicit ConfigurationException(const std::string& message) : GeometraException("Configuration Error: " + message) {}
};

class DatasetException : public GeometraException {
public:
    explicit DatasetException(const std::string& message) : GeometraException("Dataset Error: " + message) {}
};

class InvalidClusterSpecException : public GeometraException {
public:
    explicit InvalidClusterSpecException(const std::string& message) : GeometraException("Invalid Cluster Spec: " + message) {}
};

class UnknownTargetIdException : public GeometraException {
public:
    UnknownTargetIdException(int targetId, const std::string& operation)
        : GeometraException("Unknown Target Id: no label for target " + std::to_string(targetId) + " in " + operation),
          targetId_(targetId) {}

    int targetId() const { return targetId_; }

private:
    int targetId_;
};

class EmptyCategoryException : public GeometraException {
public:
    EmptyCategoryException(int targetId, const std::string& operation)
        : GeometraException("Empty Category: target " + std::to_string(targetId) + " has no observations in " + operation),
          targetId_(targetId) {}

    int targetId() const { return targetId_; }

private:
    int targetId_;
};

class DimensionMismatchException : public GeometraException {
public:
    explicit DimensionMismatchException(const std::string& message) : GeometraException("Dimension Mismatch: " + message) {}
};

class RegressionException : public GeometraException {
public:
    explicit RegressionException(const std::string& message) : GeometraException("Regression Error: " + message) {}
};

} // namespace Geometra

#endif // GEOMETRA_EXCEPTIONS_H
