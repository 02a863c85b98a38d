#include "document_pipeline.hpp"

#include "internal/core/content_manager.hpp"
#include "internal/loader/document_loader.hpp"
#include "internal/observability/logging.hpp"

namespace docsync::pipeline {

using docsync::observability::BoolField;
using docsync::observability::IntField;

PipelineSummary Run(core::ContentManager& manager, const loader::DocumentLoader& loader, bool force,
                    const std::function<void(docsync::v1::Document&&)>& sink, const observability::Logger& logger) {
  PipelineSummary summary;

  DOCSYNC_LOG_INFO(logger, "Checking for content updates", {BoolField("force", force)});
  summary.refresh_succeeded = manager.Refresh(force);

  const auto candidates = manager.CollectDocuments();
  summary.candidates    = candidates.size();
  DOCSYNC_LOG_INFO(logger, "Loading files for indexing", {IntField("files", static_cast<int64_t>(candidates.size()))});

  summary.documents = loader.Stream(candidates, sink);
  return summary;
}

} // namespace docsync::pipeline
