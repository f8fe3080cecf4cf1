#pragma once

#include <stdexcept>
#include <string>

class CorrelationError : public std::runtime_error {
public:
    explicit CorrelationError(const std::string& message)
        : std::runtime_error(message) {}
};

// Thresholds out of range, zero group size and the like. Fatal at startup.
class InvalidConfigError : public CorrelationError {
public:
    explicit InvalidConfigError(const std::string& message)
        : CorrelationError("Invalid configuration: " + message) {}
};

class IncidentNotFoundError : public CorrelationError {
public:
    explicit IncidentNotFoundError(const std::string& incident_id)
        : CorrelationError("Incident not found: " + incident_id), incident_id_(incident_id) {}

    const std::string& incident_id() const { return incident_id_; }

private:
    std::string incident_id_;
};

class GroupNotFoundError : public CorrelationError {
public:
    explicit GroupNotFoundError(const std::string& group_id)
        : CorrelationError("Correlation group not found: " + group_id), group_id_(group_id) {}

    const std::string& group_id() const { return group_id_; }

private:
    std::string group_id_;
};
