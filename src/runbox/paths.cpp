#include <runbox/paths.h>

fs::path kWorkspaceRoot = "/tmp/runbox";

const char kSandboxScript[] = "/app/script.py";
const char kSandboxScratch[] = "/app/writable";

fs::path WorkspaceDirTemplate(const std::string& id) {
  // the suffix is filled in by mkdtemp
  return kWorkspaceRoot / ("exec_" + id + "_XXXXXX");
}

fs::path WorkspaceScript(const fs::path& workspace_dir) {
  return workspace_dir / "script.py";
}
