#include "document_loader.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

#include "internal/loader/notebook_extractor.hpp"
#include "internal/loader/text_decoding.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace docsync::loader {

namespace fs = std::filesystem;

using docsync::observability::IntField;
using docsync::observability::StringField;

namespace {

double ModifiedUnixSeconds(fs::file_time_type mtime) {
  const auto sys = std::chrono::file_clock::to_sys(mtime);
  return util::ToUnixSeconds(std::chrono::time_point_cast<util::Clock::duration>(sys));
}

} // namespace

DocumentLoader::DocumentLoader(std::shared_ptr<observability::Logger> logger) : logger_(std::move(logger)) {
}

std::optional<docsync::v1::Document> DocumentLoader::Load(const core::DocumentCandidate& candidate) const {
  const auto& path = candidate.path;

  try {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
      DOCSYNC_LOG_ERROR(*logger_, "Failed to load file", {StringField("path", path.string()), StringField("error", "cannot open")});
      return std::nullopt;
    }

    const std::string raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
      DOCSYNC_LOG_ERROR(*logger_, "Failed to load file", {StringField("path", path.string()), StringField("error", "read error")});
      return std::nullopt;
    }

    const auto decoded = SanitizeUtf8(raw);
    auto       text    = IsNotebook(path) ? ExtractNotebookText(path, decoded, *logger_) : decoded;

    if (IsBlank(text)) {
      DOCSYNC_LOG_WARN(*logger_, "Skipping empty file", {StringField("path", path.string())});
      return std::nullopt;
    }

    std::error_code ec;
    const auto      mtime = fs::last_write_time(path, ec);
    if (ec) {
      DOCSYNC_LOG_ERROR(*logger_, "Failed to load file", {StringField("path", path.string()), StringField("error", ec.message())});
      return std::nullopt;
    }

    docsync::v1::Document document;
    document.set_path(path.string());
    document.set_text(std::move(text));

    auto* metadata = document.mutable_metadata();
    metadata->set_file(path.filename().string());
    metadata->set_full_path(path.string());
    metadata->set_source(candidate.source_name);
    metadata->set_source_label(candidate.source_label);
    metadata->set_priority(candidate.priority);
    metadata->set_last_modified(ModifiedUnixSeconds(mtime));

    return document;
  } catch (const std::exception& e) {
    DOCSYNC_LOG_ERROR(*logger_, "Failed to load file", {StringField("path", path.string()), StringField("error", e.what())});
    return std::nullopt;
  }
}

size_t DocumentLoader::Stream(const std::vector<core::DocumentCandidate>& candidates,
                              const std::function<void(docsync::v1::Document&&)>& sink) const {
  size_t emitted = 0;
  for (const auto& candidate : candidates) {
    auto document = Load(candidate);
    if (!document) {
      continue;
    }
    sink(std::move(*document));
    ++emitted;
  }

  DOCSYNC_LOG_INFO(*logger_, "Successfully loaded documents",
                   {IntField("documents", static_cast<int64_t>(emitted)), IntField("candidates", static_cast<int64_t>(candidates.size()))});
  return emitted;
}

std::vector<docsync::v1::Document> DocumentLoader::LoadAll(const std::vector<core::DocumentCandidate>& candidates) const {
  std::vector<docsync::v1::Document> documents;
  documents.reserve(candidates.size());
  Stream(candidates, [&](docsync::v1::Document&& document) { documents.push_back(std::move(document)); });
  return documents;
}

} // namespace docsync::loader
