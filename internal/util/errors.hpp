#pragma once

#include <stdexcept>
#include <string>

namespace convtree::util {

/*
  Central error types.

  Thrown by the tree engine; storage faults stay std::runtime_error.
*/

class NotFound : public std::runtime_error {
 public:
  NotFound(std::string entity, std::string id)
      : std::runtime_error(entity + " not found: " + id), entity_(std::move(entity)), id_(std::move(id)) {
  }

  const std::string& entity() const {
    return entity_;
  }

  const std::string& id() const {
    return id_;
  }

 private:
  std::string entity_;
  std::string id_;
};

class InvalidOperation : public std::runtime_error {
 public:
  InvalidOperation(std::string operation, std::string reason)
      : std::runtime_error(operation + ": " + reason), operation_(std::move(operation)), reason_(std::move(reason)) {
  }

  const std::string& operation() const {
    return operation_;
  }

  const std::string& reason() const {
    return reason_;
  }

 private:
  std::string operation_;
  std::string reason_;
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Conflict : public std::runtime_error {
 public:
  explicit Conflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace convtree::util
