#include "internal/util/json.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "docsync/v1/document.pb.h"
#include "docsync/v1/stats.pb.h"

namespace {

using docsync::util::ToJson;

bool Contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

void TestZeroPriorityDocumentKeepsEveryKey() {
  docsync::v1::Document document;
  document.set_path("repo/README.md");
  document.set_text("hello\n");
  auto* metadata = document.mutable_metadata();
  metadata->set_file("README.md");
  metadata->set_full_path("/tmp/repo/README.md");
  metadata->set_source("repo");
  metadata->set_source_label("repo/README.md");
  metadata->set_priority(0.0);
  metadata->set_last_modified(0.0);

  const auto json = ToJson(document);
  assert(Contains(json, "\"priority\":0"));
  assert(Contains(json, "\"last_modified\":0"));
  assert(Contains(json, "\"source_label\":\"repo/README.md\""));
  assert(Contains(json, "\"full_path\":\"/tmp/repo/README.md\""));
  assert(json.find('\n') == std::string::npos);
}

void TestEmptyStringsArePrinted() {
  docsync::v1::Document document;
  document.mutable_metadata();

  const auto json = ToJson(document);
  assert(Contains(json, "\"path\":\"\""));
  assert(Contains(json, "\"text\":\"\""));
  assert(Contains(json, "\"file\":\"\""));
}

void TestStatsWithoutFilesKeepCounts() {
  docsync::v1::ContentStats stats;
  stats.set_source_count(1);
  auto* source = stats.add_sources();
  source->set_name("empty");
  source->set_url("file:///nowhere/empty");
  source->set_branch("main");
  source->set_priority(0.0);

  const auto json = ToJson(stats);
  assert(Contains(json, "\"file_count\":0"));
  assert(Contains(json, "\"total_file_count\":0"));
  assert(Contains(json, "\"priority\":0"));
  // Never synced.
  assert(!Contains(json, "last_sync_time"));
}

void TestEmptyStatsListNoSources() {
  const auto json = ToJson(docsync::v1::ContentStats{});
  assert(Contains(json, "\"source_count\":0"));
  assert(Contains(json, "\"sources\":[]"));
  assert(Contains(json, "\"total_file_count\":0"));
}

void TestCountsAreNumbers() {
  docsync::v1::ContentStats stats;
  stats.set_source_count(2);
  stats.add_sources()->set_file_count(1);
  stats.add_sources()->set_file_count(2);
  stats.set_total_file_count(3);

  const auto json = ToJson(stats);
  assert(Contains(json, "\"source_count\":2"));
  assert(Contains(json, "\"file_count\":1"));
  assert(Contains(json, "\"file_count\":2"));
  assert(Contains(json, "\"total_file_count\":3"));
  assert(!Contains(json, "\"total_file_count\":\"3\""));
}

} // namespace

int main() {
  TestZeroPriorityDocumentKeepsEveryKey();
  TestEmptyStringsArePrinted();
  TestStatsWithoutFilesKeepCounts();
  TestEmptyStatsListNoSources();
  TestCountsAreNumbers();

  std::cout << "docsync_unit_json_output: pass\n";
  return 0;
}
