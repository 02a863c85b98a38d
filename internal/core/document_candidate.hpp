#pragma once

#include <filesystem>
#include <string>

namespace docsync::core {

/*
  A file selected by filtering, not yet read.
*/
struct DocumentCandidate {
  std::filesystem::path path;
  std::string           source_name;
  double                priority = 1.0;
  std::string           source_label;
};

} // namespace docsync::core
