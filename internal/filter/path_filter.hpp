#pragma once

#include <filesystem>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace docsync::observability {
class Logger;
}

namespace docsync::filter {

/*
  Include-then-exclude file selection over a checked-out tree.

  Patterns use '/' separators. Within a segment '*', '?' and '[...]' follow
  fnmatch(3); a segment that is exactly "**" matches zero or more segments.

  Include patterns are anchored at the root. Exclude patterns match any
  trailing run of segments ("*.log" drops logs at every depth) unless they
  start with '/', which anchors them at the root. Exclude always wins.
*/
class PathFilter {
 public:
  static constexpr std::string_view kVcsDirectory = ".git";

  PathFilter(std::vector<std::string> include_patterns, std::vector<std::string> exclude_patterns);

  // Absolute paths of the selected regular files. A missing root yields an
  // empty set and a warning.
  std::set<std::filesystem::path> Select(const std::filesystem::path& root, const observability::Logger& logger) const;

  bool IsIncluded(std::string_view relative_path) const;
  bool IsExcluded(std::string_view relative_path) const;

  static std::string ToSlashPath(const std::filesystem::path& path);

 private:
  struct Pattern {
    std::vector<std::string> segments;
    bool                     anchored = false;
  };

  static Pattern                  Compile(std::string_view pattern);
  static std::vector<std::string> SplitSegments(std::string_view path);
  static bool MatchFrom(const std::vector<std::string>& pattern, size_t pi, const std::vector<std::string>& path, size_t si);

  std::vector<Pattern> includes_;
  std::vector<Pattern> excludes_;
};

// Whole-path glob match with the include semantics above.
bool MatchGlob(std::string_view pattern, std::string_view relative_path);

} // namespace docsync::filter
