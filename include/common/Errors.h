#pragma once

#include <stdexcept>
#include <string>

namespace capsim {

class BacktestError : public std::runtime_error {
public:
    explicit BacktestError(const std::string& message)
        : std::runtime_error(message) {}

    explicit BacktestError(const char* message)
        : std::runtime_error(message) {}
};

// 설정값 오류 (음수 수수료, min_fraction > max_fraction 등)
class ConfigError : public BacktestError {
public: using BacktestError::BacktestError; };

// Unsorted/duplicate timestamps, NaN prices. Raised before the run starts.
class MalformedInputError : public BacktestError {
public: using BacktestError::BacktestError; };

// Engine bookkeeping bug. Never recovered from.
class InvariantViolationError : public BacktestError {
public: using BacktestError::BacktestError; };

class DoubleEntryError : public InvariantViolationError {
public: using InvariantViolationError::InvariantViolationError; };

class NoPositionError : public InvariantViolationError {
public: using InvariantViolationError::InvariantViolationError; };

} // namespace capsim
