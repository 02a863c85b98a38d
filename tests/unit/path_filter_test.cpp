#include "internal/filter/path_filter.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <string>

#include "internal/observability/logging.hpp"

namespace {

namespace fs = std::filesystem;

using docsync::filter::MatchGlob;
using docsync::filter::PathFilter;
using docsync::observability::MakeNullLogger;

fs::path MakeTree(const std::string& test_name) {
  const auto root = fs::temp_directory_path() / "docsync_path_filter_tests" / test_name;
  fs::remove_all(root);
  fs::create_directories(root);
  return root;
}

void Touch(const fs::path& path, const std::string& content = "x") {
  fs::create_directories(path.parent_path());
  std::ofstream out(path);
  out << content;
}

std::set<std::string> Relative(const std::set<fs::path>& selected, const fs::path& root) {
  std::set<std::string> out;
  const auto            base = fs::absolute(root).lexically_normal();
  for (const auto& path : selected) {
    out.insert(path.lexically_relative(base).generic_string());
  }
  return out;
}

void TestGlobSegments() {
  assert(MatchGlob("*.txt", "a.txt"));
  assert(!MatchGlob("*.txt", "notes/c.txt"));
  assert(MatchGlob("**/*.txt", "a.txt"));
  assert(MatchGlob("**/*.txt", "notes/c.txt"));
  assert(MatchGlob("**/*.txt", "a/b/c/d.txt"));
  assert(MatchGlob("docs/**", "docs/a/b.md"));
  assert(MatchGlob("docs/**/*.md", "docs/x.md"));
  assert(!MatchGlob("docs/**/*.md", "other/x.md"));
  assert(MatchGlob("file?.md", "file1.md"));
  assert(!MatchGlob("file?.md", "file10.md"));
  assert(MatchGlob("[ab].md", "a.md"));
  assert(!MatchGlob("[!ab].md", "a.md"));
  assert(MatchGlob("./docs/*.md", "docs/a.md"));
}

void TestExcludeIsRightAnchoredUnlessRooted() {
  PathFilter filter({"**/*"}, {"*.log", "/build/*", "tmp/*.txt"});

  assert(filter.IsExcluded("a.log"));
  assert(filter.IsExcluded("deep/nested/b.log"));

  assert(filter.IsExcluded("build/out.bin"));
  assert(!filter.IsExcluded("src/build/out.bin"));

  assert(filter.IsExcluded("tmp/x.txt"));
  assert(filter.IsExcluded("a/tmp/x.txt"));
  assert(!filter.IsExcluded("tmp/sub/x.txt"));
  assert(!filter.IsExcluded("readme.md"));
}

void TestDraftScenario() {
  const auto root = MakeTree("draft_scenario");
  Touch(root / "a.txt");
  Touch(root / "draft_b.txt");
  Touch(root / "notes" / "c.txt");
  Touch(root / "notes" / "draft_d.txt");
  Touch(root / "image.png");

  PathFilter filter({"**/*.txt"}, {"**/draft_*.txt"});
  const auto selected = Relative(filter.Select(root, *MakeNullLogger()), root);

  assert((selected == std::set<std::string>{"a.txt", "notes/c.txt"}));
}

void TestExcludeWinsOverEveryInclude() {
  const auto root = MakeTree("exclude_wins");
  Touch(root / "docs" / "guide.md");
  Touch(root / "docs" / "internal.md");

  PathFilter filter({"docs/*.md", "**/*.md", "docs/internal.md"}, {"internal.md"});
  const auto selected = Relative(filter.Select(root, *MakeNullLogger()), root);

  assert((selected == std::set<std::string>{"docs/guide.md"}));
}

void TestOverlappingIncludesCollapse() {
  const auto root = MakeTree("overlap");
  Touch(root / "a.md");
  Touch(root / "sub" / "b.md");

  PathFilter filter({"**/*.md", "*.md", "sub/*.md", "**/*"}, {});
  assert(filter.Select(root, *MakeNullLogger()).size() == 2);
}

void TestDirectoriesAndVcsMetadataAreNeverSelected() {
  const auto root = MakeTree("dirs_and_git");
  Touch(root / "folder.md" / "inner.txt");
  Touch(root / ".git" / "config");
  Touch(root / ".git" / "objects" / "ab" / "cdef");
  Touch(root / "keep.md");

  PathFilter filter({"**/*", "*.md"}, {});
  const auto selected = Relative(filter.Select(root, *MakeNullLogger()), root);

  assert((selected == std::set<std::string>{"folder.md/inner.txt", "keep.md"}));
}

void TestSelectedPathsAreAbsolute() {
  const auto root = MakeTree("absolute");
  Touch(root / "a.txt");

  PathFilter filter({"*.txt"}, {});
  const auto selected = filter.Select(root, *MakeNullLogger());
  assert(selected.size() == 1);
  for (const auto& path : selected) {
    assert(path.is_absolute());
  }
}

void TestNoIncludesSelectsNothing() {
  const auto root = MakeTree("no_includes");
  Touch(root / "a.txt");

  PathFilter filter({}, {});
  assert(filter.Select(root, *MakeNullLogger()).empty());
}

void TestParentEscapesAreDropped() {
  const auto root = MakeTree("escape");
  Touch(root / "inside.txt");
  Touch(root.parent_path() / "escape_outside.txt");

  PathFilter filter({"../*.txt"}, {});
  assert(filter.Select(root, *MakeNullLogger()).empty());
}

void TestMissingRootIsEmpty() {
  const auto root = fs::temp_directory_path() / "docsync_path_filter_tests" / "does_not_exist";
  fs::remove_all(root);

  PathFilter filter({"**/*"}, {});
  assert(filter.Select(root, *MakeNullLogger()).empty());
}

} // namespace

int main() {
  TestGlobSegments();
  TestExcludeIsRightAnchoredUnlessRooted();
  TestDraftScenario();
  TestExcludeWinsOverEveryInclude();
  TestOverlappingIncludesCollapse();
  TestDirectoriesAndVcsMetadataAreNeverSelected();
  TestSelectedPathsAreAbsolute();
  TestNoIncludesSelectsNothing();
  TestParentEscapesAreDropped();
  TestMissingRootIsEmpty();

  std::cout << "docsync_unit_path_filter: pass\n";
  return 0;
}
