#pragma once

#include <cstddef>
#include <functional>

#include "docsync/v1.hpp"

namespace docsync::core {
class ContentManager;
}
namespace docsync::loader {
class DocumentLoader;
}
namespace docsync::observability {
class Logger;
}

namespace docsync::pipeline {

struct PipelineSummary {
  bool   refresh_succeeded = false;
  size_t candidates        = 0;
  size_t documents         = 0;
};

/*
  One pipeline run:

      refresh (stale sources, or all when forced)
        → join
        → collect candidates from whatever is on disk
        → load and emit documents in candidate order

  A failed refresh still emits the last good content of every source.
*/
PipelineSummary Run(core::ContentManager& manager, const loader::DocumentLoader& loader, bool force,
                    const std::function<void(docsync::v1::Document&&)>& sink, const observability::Logger& logger);

} // namespace docsync::pipeline
