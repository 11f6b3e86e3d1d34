#pragma once

#include <stdexcept>
#include <string>

namespace whodat {

// Malformed or inconsistent catalog. Fatal at startup.
class DatasetError : public std::runtime_error {
public:
  explicit DatasetError(const std::string& message) : std::runtime_error(message) {}
};

// Answer weight, label or attribute key rejected before any state change.
class InvalidAnswer : public std::invalid_argument {
public:
  explicit InvalidAnswer(const std::string& message) : std::invalid_argument(message) {}
};

// A persisted state record that cannot be trusted for a resume.
class StateCorruptError : public std::runtime_error {
public:
  explicit StateCorruptError(const std::string& message) : std::runtime_error(message) {}
};

// Move not allowed in the current game phase.
class InvalidMove : public std::logic_error {
public:
  explicit InvalidMove(const std::string& message) : std::logic_error(message) {}
};

} // namespace whodat
