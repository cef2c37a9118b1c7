#ifndef RUNBOX_WORKSPACE_H_
#define RUNBOX_WORKSPACE_H_

#include <string>
#include <optional>
#include <filesystem>

namespace fs = std::filesystem;

// Per-request staging directory holding the submitted source.
// Nothing in it is writable from the sandbox; the script is mounted read-only.
// The directory is removed when the object is destroyed; removal failures are only logged.
class Workspace {
  std::string id_;
  fs::path dir_;

  Workspace(std::string id, fs::path dir) : id_(std::move(id)), dir_(std::move(dir)) {}
  void Destroy();
 public:
  Workspace(const Workspace&) = delete;
  Workspace& operator=(const Workspace&) = delete;
  Workspace(Workspace&& other) noexcept : id_(std::move(other.id_)), dir_(std::move(other.dir_)) {
    other.dir_.clear();
  }
  Workspace& operator=(Workspace&& other) noexcept;
  ~Workspace() { Destroy(); }

  // nullopt (already logged) if anything could not be created
  static std::optional<Workspace> Create(const std::string& source);

  // unique among live workspaces; also names the container
  const std::string& Id() const { return id_; }
  const fs::path& Dir() const { return dir_; }
  fs::path Script() const;
};

#endif  // RUNBOX_WORKSPACE_H_
