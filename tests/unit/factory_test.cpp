#include "internal/factory.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"

namespace {

namespace fs = std::filesystem;

using docsync::config::ConfigLoader;
using docsync::factory::Build;
using docsync::factory::BuildContentManager;
using docsync::factory::ManagerOptionsFromConfig;
using docsync::repo::FetchOptions;
using docsync::repo::FetchResult;
using docsync::repo::FetchStatus;
using docsync::repo::RepositoryClient;
using docsync::runtime::config::SyncConfig;

class UnusedClient : public RepositoryClient {
 public:
  FetchResult Clone(const std::string&, const std::string&, const fs::path&, const FetchOptions&) override {
    return FetchResult::Err(FetchStatus::Failed, "not expected");
  }

  FetchResult FastForward(const fs::path&, const std::string&, const FetchOptions&) override {
    return FetchResult::Err(FetchStatus::Failed, "not expected");
  }
};

std::string CacheDir(const std::string& name) {
  const auto root = fs::temp_directory_path() / "docsync_factory_tests" / name;
  fs::remove_all(root);
  return root.string();
}

void TestManagerOptionsDefaults() {
  const auto options = ManagerOptionsFromConfig(SyncConfig{});
  assert(options.worker_threads == 4);
  assert(options.fetch_timeout == std::chrono::seconds(300));
}

void TestManagerOptionsFromConfig() {
  SyncConfig sync;
  sync.set_worker_threads(8);
  sync.mutable_fetch_timeout()->set_seconds(12);
  sync.mutable_fetch_timeout()->set_nanos(500000000);

  const auto options = ManagerOptionsFromConfig(sync);
  assert(options.worker_threads == 8);
  assert(options.fetch_timeout == std::chrono::milliseconds(12500));

  SyncConfig zero;
  zero.mutable_fetch_timeout()->set_seconds(0);
  assert(ManagerOptionsFromConfig(zero).fetch_timeout == std::chrono::seconds(300));
}

void TestInvalidEntriesAreSkipped() {
  const auto cache  = CacheDir("skipped");
  const auto loaded = ConfigLoader::LoadFromString(R"(content_sources:
  - name: first
    url: https://example.com/first.git
    local_path: )" + cache + R"(/first
  - name: first
    url: https://example.com/duplicate.git
    local_path: )" + cache + R"(/duplicate
  - name: no_url
    local_path: )" + cache + R"(/no_url
  - url: https://example.com/anonymous.git
    local_path: )" + cache + R"(/anonymous
  - name: no_path
    url: https://example.com/no_path.git
  - name: weekly
    url: https://example.com/weekly.git
    local_path: )" + cache + R"(/weekly
    update_frequency: weekly
  - name: second
    url: https://example.com/second.git
    local_path: )" + cache + R"(/second
    update_frequency: never
)");

  assert(loaded.rejected_sources.empty());
  assert(loaded.config.content_sources_size() == 7);

  auto manager = BuildContentManager(loaded.config, std::make_shared<UnusedClient>(), docsync::observability::MakeNullLogger());

  const auto& sources = manager->Sources();
  assert(sources.size() == 2);
  assert(sources[0]->Name() == "first");
  assert(sources[0]->Url() == "https://example.com/first.git");
  assert(sources[1]->Name() == "second");
  assert(sources[1]->UpdateFrequency() == docsync::policy::Cadence::Never);
}

void TestEmptyConfigBuildsEmptyManager() {
  auto manager = BuildContentManager(docsync::runtime::config::RuntimeConfig{}, std::make_shared<UnusedClient>(),
                                     docsync::observability::MakeNullLogger());
  assert(manager->Sources().empty());
  assert(!manager->Refresh(false));
}

void TestBuildWiresManagerAndLoader() {
  const auto cache  = CacheDir("build");
  const auto loaded = ConfigLoader::LoadFromString(R"(sync:
  worker_threads: 1
content_sources:
  - name: docs
    url: https://example.com/docs.git
    local_path: )" + cache + R"(/docs
)");

  auto app = Build(loaded.config, docsync::observability::MakeNullLogger());
  assert(app.manager != nullptr);
  assert(app.loader != nullptr);
  assert(app.manager->Sources().size() == 1);
  assert(app.manager->CollectDocuments().empty());
}

} // namespace

int main() {
  TestManagerOptionsDefaults();
  TestManagerOptionsFromConfig();
  TestInvalidEntriesAreSkipped();
  TestEmptyConfigBuildsEmptyManager();
  TestBuildWiresManagerAndLoader();

  std::cout << "docsync_unit_factory: pass\n";
  return 0;
}
