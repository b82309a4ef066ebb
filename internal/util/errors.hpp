#pragma once

#include <stdexcept>
#include <string>

namespace skycache::util {

/*
  Central error types.

  Thrown for caller mistakes (unknown ids, bad config). Runtime faults in
  the store or the network are reported through results instead.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StorageUnavailable : public std::runtime_error {
 public:
  explicit StorageUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace skycache::util
