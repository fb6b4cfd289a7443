#ifndef CODERUN_UTILS_H_
#define CODERUN_UTILS_H_

#include <string>
#include <filesystem>

#include <coderun/utils.h>

namespace fs = std::filesystem;

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

// 12 random hex digits
std::string GenerateInstanceSuffix();

bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);
// make a tree readable (and directories traversable) by everyone
bool GrantReadAccess(const fs::path&);

#endif  // CODERUN_UTILS_H_
