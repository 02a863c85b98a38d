#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/core/content_manager.hpp"
#include "internal/loader/document_loader.hpp"
#include "internal/repo/repository_client.hpp"

namespace docsync::observability {
class Logger;
}

namespace docsync::factory {

/*
  Application

  Everything the pipeline needs, owned for the lifetime of one run.
*/
struct Application {
  std::unique_ptr<core::ContentManager>   manager;
  std::unique_ptr<loader::DocumentLoader> loader;
};

core::ManagerOptions ManagerOptionsFromConfig(const docsync::runtime::config::SyncConfig& sync);

/*
  Builds one ContentSource per valid entry. Entries with missing fields,
  an unknown cadence or a duplicate name are logged and skipped.
*/
std::unique_ptr<core::ContentManager> BuildContentManager(const docsync::runtime::config::RuntimeConfig& config,
                                                          std::shared_ptr<repo::RepositoryClient>    client,
                                                          std::shared_ptr<observability::Logger>     logger);

/*
  Build

  Composition root: wires the git client, manager and loader from config.
*/
Application Build(const docsync::runtime::config::RuntimeConfig& config, std::shared_ptr<observability::Logger> logger);

} // namespace docsync::factory
