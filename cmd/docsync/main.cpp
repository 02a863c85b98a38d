#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pipeline/document_pipeline.hpp"
#include "internal/util/json.hpp"

using docsync::observability::IntField;
using docsync::observability::StringField;
using docsync::util::ToJson;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void Usage() {
  std::cerr << "Usage:\n"
            << "  docsync --config <content_sources.yaml> [--force] [--stats] [--output <documents.jsonl>]\n"
            << "\n"
            << "  --force    fetch every source regardless of its update_frequency\n"
            << "  --stats    print the source statistics as JSON after the run\n"
            << "  --output   write documents (one JSON object per line) to a file instead of stdout\n";
}

int main(int argc, char** argv) {
  std::string config_path;
  std::string output_path;
  bool        force       = false;
  bool        print_stats = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--output" && i + 1 < argc) {
      output_path = argv[++i];
    } else if (arg == "--force") {
      force = true;
    } else if (arg == "--stats") {
      print_stats = true;
    } else {
      Usage();
      return 1;
    }
  }

  if (config_path.empty()) {
    Usage();
    return 1;
  }

  std::shared_ptr<docsync::observability::Logger> logger;

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto loaded = docsync::config::ConfigLoader::LoadFromYaml(config_path);

    logger = docsync::observability::MakeLogger(loaded.config);
    for (const auto& rejected : loaded.rejected_sources) {
      DOCSYNC_LOG_ERROR(*logger, "Skipping malformed content source", {StringField("entry", rejected)});
    }

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = docsync::factory::Build(loaded.config, logger);

    std::ofstream file_out;
    if (!output_path.empty()) {
      file_out.open(output_path, std::ios::trunc);
      if (!file_out) {
        throw std::runtime_error("Cannot open output file " + output_path);
      }
    }
    std::ostream& out = output_path.empty() ? std::cout : file_out;

    // Register signal handlers before the refresh starts.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    std::atomic<bool> done{false};
    std::thread       watcher([&] {
      while (!done) {
        if (!g_running) app.manager->Cancel();
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
      }
    });

    // Stops the watcher on every exit path out of the run.
    struct WatcherStop {
      std::atomic<bool>& done;
      std::thread&       watcher;
      ~WatcherStop() {
        done = true;
        if (watcher.joinable()) watcher.join();
      }
    } watcher_stop{done, watcher};

    const auto summary = docsync::pipeline::Run(
        *app.manager, *app.loader, force, [&](docsync::v1::Document&& document) { out << ToJson(document) << '\n'; }, *logger);

    out.flush();

    if (print_stats) {
      std::cout << ToJson(app.manager->Stats()) << std::endl;
    }

    DOCSYNC_LOG_INFO(*logger, "Pipeline finished", {IntField("candidates", static_cast<int64_t>(summary.candidates)),
                                                    IntField("documents", static_cast<int64_t>(summary.documents))});
    logger->Flush();

    return summary.refresh_succeeded ? 0 : 1;
  } catch (const std::exception& e) {
    if (logger) {
      DOCSYNC_LOG_ERROR(*logger, "Fatal error", {StringField("error", e.what())});
      logger->Flush();
    } else {
      std::cerr << "docsync: " << e.what() << std::endl;
    }
    return 2;
  }
}
