#pragma once

#include <stdexcept>
#include <string>

namespace sftcurator {

class CuratorError : public std::runtime_error {
 public:
  explicit CuratorError(const std::string& what) : std::runtime_error(what) {}
};

// A referenced version id does not exist in the store.
class NotFoundError : public CuratorError {
 public:
  explicit NotFoundError(const std::string& what) : CuratorError(what) {}
};

// The store refuses a transition, e.g. deleting the current version.
class InvalidOperationError : public CuratorError {
 public:
  explicit InvalidOperationError(const std::string& what) : CuratorError(what) {}
};

// A manifest, record line or index file could not be parsed.
class MalformedInputError : public CuratorError {
 public:
  explicit MalformedInputError(const std::string& what) : CuratorError(what) {}
};

}  // namespace sftcurator
