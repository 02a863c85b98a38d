#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace docsync::observability {
class Logger;
}

namespace docsync::loader {

bool IsNotebook(const std::filesystem::path& path);

/*
  Renders a Jupyter notebook as markdown-ish text:

      # Jupyter Notebook: <file name>

      ## Cell 1 (Markdown)
      <text>

      ## Cell 2 (Code)
      ```<language>
      <code>
      ```

  Cells are numbered from 1 over all cells; cell types other than markdown
  and code are skipped. Any parse failure is logged and yields "".
*/
std::string ExtractNotebookText(const std::filesystem::path& path, std::string_view json, const observability::Logger& logger);

} // namespace docsync::loader
