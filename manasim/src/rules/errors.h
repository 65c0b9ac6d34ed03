#pragma once

#include <stdexcept>
#include <string>

// Recoverable rules violations. A failed cast or activation leaves the game untouched.
class RulesError : public std::runtime_error {
public:
    explicit RulesError(const std::string& message) : std::runtime_error(message) {}
};

class InsufficientManaError : public RulesError {
public:
    explicit InsufficientManaError(const std::string& message) : RulesError(message) {}
};

class IllegalTimingError : public RulesError {
public:
    explicit IllegalTimingError(const std::string& message) : RulesError(message) {}
};

class InvalidTargetError : public RulesError {
public:
    explicit InvalidTargetError(const std::string& message) : RulesError(message) {}
};
