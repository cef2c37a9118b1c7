#ifndef RUNBOX_UTILS_H_
#define RUNBOX_UTILS_H_

#include <string>
#include <filesystem>

#include <runbox/utils.h>

namespace fs = std::filesystem;

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

constexpr fs::perms kPerm644 =
    fs::perms::owner_read | fs::perms::owner_write |
    fs::perms::group_read | fs::perms::others_read;

// lowercase hex from the random device
std::string RandomToken(size_t length);

bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveFile(const fs::path&);
bool RemoveAll(const fs::path&);
bool WriteFile(const fs::path&, const std::string& content, fs::perms = fs::perms::unknown);

#endif  // RUNBOX_UTILS_H_
