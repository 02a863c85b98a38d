#include "path_filter.hpp"

#include <fnmatch.h>

#include <system_error>

#include "internal/observability/logging.hpp"

namespace docsync::filter {

namespace fs = std::filesystem;

using docsync::observability::IntField;
using docsync::observability::StringField;

PathFilter::PathFilter(std::vector<std::string> include_patterns, std::vector<std::string> exclude_patterns) {
  includes_.reserve(include_patterns.size());
  for (const auto& pattern : include_patterns) {
    auto compiled     = Compile(pattern);
    compiled.anchored = true;
    includes_.push_back(std::move(compiled));
  }

  excludes_.reserve(exclude_patterns.size());
  for (const auto& pattern : exclude_patterns) {
    excludes_.push_back(Compile(pattern));
  }
}

std::vector<std::string> PathFilter::SplitSegments(std::string_view path) {
  std::vector<std::string> segments;
  size_t                   start = 0;
  while (start <= path.size()) {
    auto end = path.find('/', start);
    if (end == std::string_view::npos) {
      end = path.size();
    }
    auto segment = path.substr(start, end - start);
    if (!segment.empty() && segment != ".") {
      segments.emplace_back(segment);
    }
    start = end + 1;
  }
  return segments;
}

PathFilter::Pattern PathFilter::Compile(std::string_view pattern) {
  Pattern compiled;
  compiled.anchored = !pattern.empty() && pattern.front() == '/';
  compiled.segments = SplitSegments(pattern);

  // "a/**/**/b" is the same as "a/**/b" and avoids redundant backtracking.
  std::vector<std::string> collapsed;
  for (auto& segment : compiled.segments) {
    if (segment == "**" && !collapsed.empty() && collapsed.back() == "**") {
      continue;
    }
    collapsed.push_back(std::move(segment));
  }
  compiled.segments = std::move(collapsed);
  return compiled;
}

bool PathFilter::MatchFrom(const std::vector<std::string>& pattern, size_t pi, const std::vector<std::string>& path, size_t si) {
  if (pi == pattern.size()) {
    return si == path.size();
  }

  if (pattern[pi] == "**") {
    for (size_t next = si; next <= path.size(); ++next) {
      if (MatchFrom(pattern, pi + 1, path, next)) {
        return true;
      }
    }
    return false;
  }

  if (si == path.size()) {
    return false;
  }

  if (::fnmatch(pattern[pi].c_str(), path[si].c_str(), 0) != 0) {
    return false;
  }

  return MatchFrom(pattern, pi + 1, path, si + 1);
}

bool PathFilter::IsIncluded(std::string_view relative_path) const {
  const auto segments = SplitSegments(relative_path);
  for (const auto& include : includes_) {
    if (!include.segments.empty() && MatchFrom(include.segments, 0, segments, 0)) {
      return true;
    }
  }
  return false;
}

bool PathFilter::IsExcluded(std::string_view relative_path) const {
  const auto segments = SplitSegments(relative_path);
  for (const auto& exclude : excludes_) {
    if (exclude.segments.empty()) {
      continue;
    }
    if (exclude.anchored) {
      if (MatchFrom(exclude.segments, 0, segments, 0)) {
        return true;
      }
      continue;
    }
    for (size_t start = 0; start < segments.size(); ++start) {
      if (MatchFrom(exclude.segments, 0, segments, start)) {
        return true;
      }
    }
  }
  return false;
}

std::string PathFilter::ToSlashPath(const fs::path& path) {
  return path.generic_string();
}

std::set<fs::path> PathFilter::Select(const fs::path& root, const observability::Logger& logger) const {
  std::set<fs::path> selected;

  std::error_code ec;
  if (!fs::exists(root, ec)) {
    DOCSYNC_LOG_WARN(logger, "Content path does not exist", {StringField("path", root.string())});
    return selected;
  }

  const auto base = fs::absolute(root, ec).lexically_normal();
  if (ec) {
    DOCSYNC_LOG_WARN(logger, "Cannot resolve content path", {StringField("path", root.string()), StringField("error", ec.message())});
    return selected;
  }

  if (includes_.empty()) {
    return selected;
  }

  fs::recursive_directory_iterator it(base, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    DOCSYNC_LOG_WARN(logger, "Cannot walk content path", {StringField("path", base.string()), StringField("error", ec.message())});
    return selected;
  }

  const fs::recursive_directory_iterator end;
  while (it != end) {
    const auto& entry = *it;
    std::error_code entry_ec;

    if (entry.is_directory(entry_ec)) {
      if (entry.path().filename() == fs::path(kVcsDirectory)) {
        it.disable_recursion_pending();
      }
    } else if (entry.is_regular_file(entry_ec)) {
      const auto relative = entry.path().lexically_relative(base);
      if (!relative.empty() && relative.begin()->string() != "..") {
        const auto rel = ToSlashPath(relative);
        if (IsIncluded(rel) && !IsExcluded(rel)) {
          selected.insert(entry.path());
        }
      }
    }

    it.increment(ec);
    if (ec) {
      DOCSYNC_LOG_WARN(logger, "Directory walk stopped early", {StringField("path", base.string()), StringField("error", ec.message()),
                                                                IntField("selected", static_cast<int64_t>(selected.size()))});
      break;
    }
  }

  return selected;
}

bool MatchGlob(std::string_view pattern, std::string_view relative_path) {
  return PathFilter({std::string(pattern)}, {}).IsIncluded(relative_path);
}

} // namespace docsync::filter
