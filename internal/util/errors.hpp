#pragma once

#include <stdexcept>
#include <string>

namespace docsync::util {

/*
  Central error types.
*/

// A content source entry that cannot be turned into a runnable source.
class InvalidConfig : public std::runtime_error {
 public:
  explicit InvalidConfig(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace docsync::util
