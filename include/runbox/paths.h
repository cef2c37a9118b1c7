#ifndef INCLUDE_RUNBOX_PATHS_H_
#define INCLUDE_RUNBOX_PATHS_H_

#include <string>
#include <filesystem>

namespace fs = std::filesystem;

// set once at startup
extern fs::path kWorkspaceRoot;

// fixed locations inside the sandbox
extern const char kSandboxScript[];
extern const char kSandboxScratch[];

fs::path WorkspaceDirTemplate(const std::string& id);
fs::path WorkspaceScript(const fs::path& workspace_dir);

#endif  // INCLUDE_RUNBOX_PATHS_H_
