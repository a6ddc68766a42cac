#pragma once

#include <stdexcept>
#include <string>

namespace fvgscan {

// Too few bars for a detector's window. Reported in logs, never thrown past the strategy.
class DataInsufficient : public std::runtime_error {
public:
    explicit DataInsufficient(const std::string& what) : std::runtime_error(what) {}
};

// Provider could not return a series at all
class DataUnavailable : public std::runtime_error {
public:
    explicit DataUnavailable(const std::string& what) : std::runtime_error(what) {}
};

// Non-positive stop distance, missing volatility or non-finite size
class InvalidRiskPlan : public std::runtime_error {
public:
    explicit InvalidRiskPlan(const std::string& what) : std::runtime_error(what) {}
};

// Compare-and-set on a trade lost the race
class StateConflict : public std::runtime_error {
public:
    explicit StateConflict(const std::string& what) : std::runtime_error(what) {}
};

// Construction-time check failed; the object is not built
class InvariantViolation : public std::runtime_error {
public:
    explicit InvariantViolation(const std::string& what) : std::runtime_error(what) {}
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace fvgscan
