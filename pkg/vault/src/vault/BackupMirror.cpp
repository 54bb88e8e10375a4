// Repository: NarroVault
// Component: Backup mirror
// Purpose: Secondary copy of vault files written during a run.
// Copyright (c) 2026 NarroVault

#include "narrovault/vault/BackupMirror.hpp"

#include <algorithm>
#include <utility>

#include "narrovault/util/VaultError.hpp"
#include "narrovault/vault/FileOps.hpp"

namespace narrovault::vault {

DirectoryMirror::DirectoryMirror(std::string destination_root)
    : destination_root_(std::move(destination_root)) {}

bool DirectoryMirror::Mirror(const std::string& vault_root, const std::string& relative_path,
                             std::string* error) {
  if (relative_path.empty() || relative_path.front() == '/' ||
      relative_path.find("..") != std::string::npos) {
    *error = "DirectoryMirror: refusing path outside the vault: " + relative_path;
    return false;
  }
  const std::string dst = destination_root_ + "/" + relative_path;
  try {
    MakeDirs(DirName(dst));
    CopyFileAtomic(vault_root + "/" + relative_path, dst);
  } catch (const VaultError& e) {
    *error = e.what();
    return false;
  }
  const std::string dir = DirName(dst);
  if (std::find(pending_dirs_.begin(), pending_dirs_.end(), dir) == pending_dirs_.end()) {
    pending_dirs_.push_back(dir);
  }
  return true;
}

bool DirectoryMirror::Flush(std::string* error) {
  // Files are already fsynced by CopyFileAtomic; sync the directories too.
  try {
    for (const auto& dir : pending_dirs_) SyncPath(dir);
  } catch (const VaultError& e) {
    *error = e.what();
    return false;
  }
  pending_dirs_.clear();
  return true;
}

}  // namespace narrovault::vault
