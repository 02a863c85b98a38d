#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "docsync/v1.hpp"
#include "internal/core/document_candidate.hpp"

namespace docsync::observability {
class Logger;
}

namespace docsync::loader {

/*
  Turns candidates into Documents.

  Decoding is lenient: malformed UTF-8 is dropped rather than failing the
  file. Blank results are never emitted. Per-file errors are logged and the
  file is skipped.
*/
class DocumentLoader {
 public:
  explicit DocumentLoader(std::shared_ptr<observability::Logger> logger);

  std::optional<docsync::v1::Document> Load(const core::DocumentCandidate& candidate) const;

  // Loads in candidate order and hands each document to `sink`. Returns the
  // number emitted.
  size_t Stream(const std::vector<core::DocumentCandidate>& candidates, const std::function<void(docsync::v1::Document&&)>& sink) const;

  std::vector<docsync::v1::Document> LoadAll(const std::vector<core::DocumentCandidate>& candidates) const;

 private:
  std::shared_ptr<observability::Logger> logger_;
};

} // namespace docsync::loader
