#include "entry_point.h"

#include <spdlog/spdlog.h>
#include "utils.h"

namespace {

const Language kEntryPriority[] = {
#define X(name, ...) Language::name,
  ENUM_LANGUAGE_
#undef X
};

} // namespace

std::optional<EntryPoint> ResolveEntryPoint(const fs::path& project_dir) {
  for (Language lang : kEntryPriority) {
    fs::path file = project_dir / LanguageEntryFile(lang);
    std::error_code ec;
    if (fs::is_regular_file(file, ec)) {
      spdlog::debug("Entry point of {}: {}", project_dir.c_str(), file.c_str());
      return EntryPoint{lang, file};
    }
  }
  return std::nullopt;
}
