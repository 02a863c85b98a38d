#include "factory.hpp"

#include <unordered_set>

#include "internal/observability/logging.hpp"
#include "internal/repo/git_cli_client.hpp"
#include "internal/source/content_source.hpp"
#include "internal/util/errors.hpp"

namespace docsync::factory {

using docsync::observability::IntField;
using docsync::observability::StringField;

core::ManagerOptions ManagerOptionsFromConfig(const docsync::runtime::config::SyncConfig& sync) {
  core::ManagerOptions options;

  if (sync.worker_threads() > 0) {
    options.worker_threads = sync.worker_threads();
  }

  if (sync.has_fetch_timeout()) {
    const auto timeout = std::chrono::seconds(sync.fetch_timeout().seconds()) + std::chrono::nanoseconds(sync.fetch_timeout().nanos());
    if (timeout.count() > 0) {
      options.fetch_timeout = std::chrono::duration_cast<std::chrono::milliseconds>(timeout);
    }
  }

  return options;
}

std::unique_ptr<core::ContentManager> BuildContentManager(const docsync::runtime::config::RuntimeConfig& config,
                                                          std::shared_ptr<repo::RepositoryClient>    client,
                                                          std::shared_ptr<observability::Logger>     logger) {
  std::vector<std::unique_ptr<source::ContentSource>> sources;
  std::unordered_set<std::string>                     names;

  if (config.content_sources().empty()) {
    DOCSYNC_LOG_WARN(*logger, "No content sources defined in config");
  }

  for (const auto& entry : config.content_sources()) {
    if (!entry.name().empty() && names.count(entry.name())) {
      DOCSYNC_LOG_ERROR(*logger, "Failed to load source", {StringField("source", entry.name()), StringField("error", "duplicate name")});
      continue;
    }

    try {
      auto source = std::make_unique<source::ContentSource>(entry, client, logger);
      names.insert(source->Name());
      DOCSYNC_LOG_INFO(*logger, "Loaded content source", {StringField("source", source->Name()),
                                                           StringField("frequency", policy::CadenceName(source->UpdateFrequency()))});
      sources.push_back(std::move(source));
    } catch (const util::InvalidConfig& e) {
      DOCSYNC_LOG_ERROR(*logger, "Failed to load source", {StringField("source", entry.name()), StringField("error", e.what())});
    }
  }

  DOCSYNC_LOG_INFO(*logger, "Content manager initialized", {IntField("sources", static_cast<int64_t>(sources.size()))});

  return std::make_unique<core::ContentManager>(std::move(sources), ManagerOptionsFromConfig(config.sync()), logger);
}

/*
    Build full application dependency graph
*/
Application Build(const docsync::runtime::config::RuntimeConfig& config, std::shared_ptr<observability::Logger> logger) {
  Application app;

  auto client = std::make_shared<repo::GitCliClient>(config.sync().git_binary());

  app.manager = BuildContentManager(config, std::move(client), logger);
  app.loader  = std::make_unique<loader::DocumentLoader>(logger);

  return app;
}

} // namespace docsync::factory
