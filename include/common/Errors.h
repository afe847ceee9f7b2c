#pragma once

#include <stdexcept>
#include <string>

namespace patternedge {

// Invalid configuration detected at startup
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// Durable write of safety-critical state failed
class PersistenceError : public std::runtime_error {
public:
    explicit PersistenceError(const std::string& what) : std::runtime_error(what) {}
};

// On-disk document changed since it was loaded
class VersionConflictError : public std::runtime_error {
public:
    explicit VersionConflictError(const std::string& what) : std::runtime_error(what) {}
};

// Outcome record missing segmentation fields
class FeedbackValidationError : public std::runtime_error {
public:
    explicit FeedbackValidationError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace patternedge
