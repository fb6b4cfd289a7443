#include "utils.h"

#include <random>
#include <cstring>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <coderun/config.h>

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG1(cls, x, ...) case cls::x: return #x;
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;
#define X_RETURN_ARG3(cls, x, y, z, ...) case cls::x: return z;
#define X_RETURN_ARG4(cls, x, y, z, w, ...) case cls::x: return w;

#define X(...) X_RETURN_ARG3(Status, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* StatusToDesc, Status, ENUM_STATUS_)
#undef X

static const char* kStatusAbrTable[] = {
#define X(name, abr, desc) abr,
  ENUM_STATUS_
#undef X
};

const char* StatusToAbr(Status status) {
  return kStatusAbrTable[(int)status];
}

static const char* kLanguageNameTable[] = {
#define X(name, text, ...) text,
  ENUM_LANGUAGE_
#undef X
};

const char* LanguageName(Language lang) {
  return kLanguageNameTable[(int)lang];
}

Language GetLanguage(const std::string& str) {
  if (str == "js") return Language::JAVASCRIPT;
  for (size_t i = 0; i < sizeof(kLanguageNameTable) / sizeof(kLanguageNameTable[0]); i++) {
    if (str == kLanguageNameTable[i]) return (Language)i;
  }
  return Language::PYTHON;
}

#define X(...) X_RETURN_ARG3(Language, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* LanguageInterpreter, Language, ENUM_LANGUAGE_)
#undef X

#define X(...) X_RETURN_ARG4(Language, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* LanguageEntryFile, Language, ENUM_LANGUAGE_)
#undef X

#define X(...) X_RETURN_ARG1(SourceKind, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* SourceKindName, SourceKind, ENUM_SOURCE_KIND_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG1
#undef X_RETURN_ARG2
#undef X_RETURN_ARG3
#undef X_RETURN_ARG4

const std::string& LanguageImage(Language lang) {
  switch (lang) {
    case Language::PYTHON: return kPythonImage;
    case Language::JAVASCRIPT: return kJavaScriptImage;
  }
  __builtin_unreachable();
}

std::string GenerateInstanceSuffix() {
  thread_local std::mt19937_64 rng(std::random_device{}());
  return fmt::format("{:012x}", rng() & 0xffff'ffff'ffffULL);
}

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), strerror(ec.value()));
  return false;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed deleting {}: {}", path.c_str(), strerror(ec.value()));
  return false;
}

bool GrantReadAccess(const fs::path& path) {
  constexpr fs::perms kDirPerms =
      fs::perms::owner_read | fs::perms::owner_exec |
      fs::perms::group_read | fs::perms::group_exec |
      fs::perms::others_read | fs::perms::others_exec;
  constexpr fs::perms kFilePerms =
      fs::perms::owner_read | fs::perms::group_read | fs::perms::others_read;
  spdlog::debug("Grant read access on {}", path.c_str());
  std::error_code ec;
  fs::permissions(path, kDirPerms, fs::perm_options::add, ec);
  if (ec) goto err;
  for (fs::recursive_directory_iterator it(path, ec), end; !ec && it != end; it.increment(ec)) {
    // symlinks are not followed; the sandbox sees them dangling or pointing inside /app
    if (it->is_symlink(ec)) continue;
    bool is_dir = it->is_directory(ec);
    if (ec) break;
    fs::permissions(it->path(), is_dir ? kDirPerms : kFilePerms, fs::perm_options::add, ec);
  }
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed granting read access on {}: {}", path.c_str(), strerror(ec.value()));
  return false;
}
