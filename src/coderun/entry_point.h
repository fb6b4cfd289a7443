#ifndef CODERUN_ENTRY_POINT_H_
#define CODERUN_ENTRY_POINT_H_

#include <optional>
#include <filesystem>

#include <coderun/execution.h>

struct EntryPoint {
  Language lang;
  std::filesystem::path file;
};

// Look for the entry file of each language (in the order of ENUM_LANGUAGE_) directly
// inside the project directory; the first existing one wins.
std::optional<EntryPoint> ResolveEntryPoint(const std::filesystem::path& project_dir);

#endif  // CODERUN_ENTRY_POINT_H_
