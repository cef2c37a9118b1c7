#include "workspace.h"

#include <stdlib.h>
#include <cstring>
#include <vector>

#include <spdlog/spdlog.h>
#include <runbox/paths.h>
#include "utils.h"

namespace {

constexpr size_t kIdLength = 8;

} // namespace

std::optional<Workspace> Workspace::Create(const std::string& source) {
  if (!CreateDirs(kWorkspaceRoot)) return std::nullopt;
  std::string id = RandomToken(kIdLength);
  std::string tmpl = WorkspaceDirTemplate(id);
  std::vector<char> buf(tmpl.begin(), tmpl.end());
  buf.push_back('\0');
  // mkdtemp creates the directory with mode 0700
  if (!mkdtemp(buf.data())) {
    spdlog::warn("Failed creating workspace {}: {}", tmpl, strerror(errno));
    return std::nullopt;
  }
  fs::path dir = buf.data();
  // append the mkdtemp suffix so ids stay unique even if two tokens collide
  std::string name = dir.filename();
  id += name.substr(name.size() - 7);
  Workspace ret(std::move(id), std::move(dir));
  spdlog::debug("Workspace {} created at {}", ret.id_, ret.dir_.c_str());
  if (!WriteFile(ret.Script(), source, kPerm644)) {
    return std::nullopt; // partially created directory is removed by ret
  }
  return std::optional<Workspace>(std::move(ret));
}

Workspace& Workspace::operator=(Workspace&& other) noexcept {
  if (this != &other) {
    Destroy();
    id_ = std::move(other.id_);
    dir_ = std::move(other.dir_);
    other.dir_.clear();
  }
  return *this;
}

void Workspace::Destroy() {
  if (dir_.empty()) return;
  spdlog::debug("Destroying workspace {}", id_);
  std::error_code ec;
  if (fs::exists(Script(), ec)) IGNORE_RETURN(RemoveFile(Script()));
  if (!RemoveAll(dir_)) {
    spdlog::warn("Workspace {} left behind at {}", id_, dir_.c_str());
  }
  dir_.clear();
}

fs::path Workspace::Script() const {
  return WorkspaceScript(dir_);
}
