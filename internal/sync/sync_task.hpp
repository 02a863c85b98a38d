#pragma once

#include <future>

namespace docsync::source {
class ContentSource;
}

namespace docsync::sync {

/*
  A scheduled fetch of one content source.

  The worker that runs it fulfils `done` with the fetch outcome, so results
  travel back to the owner without a shared list.
*/
struct SyncTask {
  docsync::source::ContentSource* source = nullptr;

  std::promise<bool> done;
};

} // namespace docsync::sync
