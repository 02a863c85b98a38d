#include "notebook_extractor.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

#include "internal/observability/logging.hpp"

namespace docsync::loader {

using google::protobuf::Struct;
using google::protobuf::Value;

namespace {

constexpr const char* kDefaultLanguage = "python";

const Value* Field(const Struct& object, const std::string& key) {
  const auto it = object.fields().find(key);
  return it == object.fields().end() ? nullptr : &it->second;
}

const Struct* ObjectField(const Struct& object, const std::string& key) {
  const auto* value = Field(object, key);
  return value && value->has_struct_value() ? &value->struct_value() : nullptr;
}

std::string StringMember(const Struct& object, const std::string& key) {
  const auto* value = Field(object, key);
  return value && value->kind_case() == Value::kStringValue ? value->string_value() : std::string();
}

// nbformat allows "source" as one string or a list of line strings.
std::string CellSource(const Struct& cell) {
  const auto* source = Field(cell, "source");
  if (!source) {
    return {};
  }
  if (source->kind_case() == Value::kStringValue) {
    return source->string_value();
  }
  std::string joined;
  if (source->has_list_value()) {
    for (const auto& line : source->list_value().values()) {
      if (line.kind_case() == Value::kStringValue) {
        joined += line.string_value();
      }
    }
  }
  return joined;
}

std::string NotebookLanguage(const Struct& notebook) {
  const auto* metadata = ObjectField(notebook, "metadata");
  if (!metadata) {
    return kDefaultLanguage;
  }
  if (const auto* info = ObjectField(*metadata, "language_info")) {
    auto name = StringMember(*info, "name");
    if (!name.empty()) return name;
  }
  if (const auto* kernel = ObjectField(*metadata, "kernelspec")) {
    auto language = StringMember(*kernel, "language");
    if (!language.empty()) return language;
  }
  return kDefaultLanguage;
}

std::string Join(const std::vector<std::string>& parts, const std::string& separator) {
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i) out += separator;
    out += parts[i];
  }
  return out;
}

} // namespace

bool IsNotebook(const std::filesystem::path& path) {
  auto extension = path.extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char c) { return std::tolower(c); });
  return extension == ".ipynb";
}

std::string ExtractNotebookText(const std::filesystem::path& path, std::string_view json, const observability::Logger& logger) {
  Struct notebook;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(std::string(json), &notebook, options);
  if (!status.ok()) {
    DOCSYNC_LOG_ERROR(logger, "Failed to extract notebook text",
                      {observability::StringField("path", path.string()), observability::StringField("error", std::string(status.message()))});
    return {};
  }

  const auto* cells = Field(notebook, "cells");
  if (cells && !cells->has_list_value()) {
    DOCSYNC_LOG_ERROR(logger, "Failed to extract notebook text",
                      {observability::StringField("path", path.string()), observability::StringField("error", "'cells' is not a list")});
    return {};
  }

  const auto language = NotebookLanguage(notebook);

  std::vector<std::string> parts;
  parts.push_back("# Jupyter Notebook: " + path.filename().string() + "\n");

  if (cells) {
    int index = 0;
    for (const auto& cell_value : cells->list_value().values()) {
      ++index;
      if (!cell_value.has_struct_value()) {
        continue;
      }
      const auto& cell      = cell_value.struct_value();
      const auto  cell_type = StringMember(cell, "cell_type");
      const auto  content   = CellSource(cell);

      if (cell_type == "markdown") {
        parts.push_back("## Cell " + std::to_string(index) + " (Markdown)\n" + content + "\n");
      } else if (cell_type == "code") {
        parts.push_back("## Cell " + std::to_string(index) + " (Code)\n```" + language + "\n" + content + "\n```\n");
      }
    }
  }

  return Join(parts, "\n\n");
}

} // namespace docsync::loader
