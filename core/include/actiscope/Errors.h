#pragma once

#include <stdexcept>
#include <string>

namespace actiscope {

// Input that breaks the batch invariants (non-finite values, decreasing
// timestamps, bad sampling rate) or an unparseable label/config value.
class ValidationError : public std::invalid_argument {
  public:
    explicit ValidationError(const std::string& what) : std::invalid_argument(what) {}
};

// Internal failure of a single pipeline invocation.
class ComputationError : public std::runtime_error {
  public:
    explicit ComputationError(const std::string& what) : std::runtime_error(what) {}
};

class StorageError : public std::runtime_error {
  public:
    explicit StorageError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace actiscope
