#include "utils.h"

#include <cstring>
#include <random>
#include <fstream>

#include <spdlog/spdlog.h>

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;

#define X(...) X_RETURN_ARG2(Outcome, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* OutcomeToDesc, Outcome, ENUM_OUTCOME_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG2

bool IsServiceError(Outcome outcome) {
  return (int)outcome >= (int)Outcome::LAUNCH_ERROR;
}

size_t Utf8Length(const std::string& str) {
  size_t ret = 0;
  for (unsigned char c : str) {
    if ((c & 0xC0) != 0x80) ret++;
  }
  return ret;
}

std::string RandomToken(size_t length) {
  static const char kHex[] = "0123456789abcdef";
  // random_device is not guaranteed to be thread-safe
  thread_local std::random_device rd;
  std::uniform_int_distribution<int> dist(0, 15);
  std::string ret(length, '0');
  for (auto& i : ret) i = kHex[dist(rd)];
  return ret;
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
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), ec.message());
  return false;
}

bool RemoveFile(const fs::path& path) {
  spdlog::debug("Delete file {}", path.c_str());
  std::error_code ec;
  fs::remove(path, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed deleting {}: {}", path.c_str(), ec.message());
  return false;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed deleting {}: {}", path.c_str(), ec.message());
  return false;
}

bool WriteFile(const fs::path& path, const std::string& content, fs::perms perms) {
  spdlog::debug("Write file {}, size {}", path.c_str(), content.size());
  std::error_code ec;
  {
    std::ofstream fout(path, std::ios::binary | std::ios::trunc);
    if (!fout || !fout.write(content.data(), content.size()) || !fout.flush()) {
      spdlog::warn("Failed writing {}: {}", path.c_str(), strerror(errno));
      return false;
    }
  }
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed setting permissions of {}: {}", path.c_str(), ec.message());
  return false;
}
