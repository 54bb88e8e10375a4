// Repository: NarroVault
// Component: Vault file operations
// Purpose: POSIX helpers for durable, never-overwriting file publication.
// Copyright (c) 2026 NarroVault

#ifndef NARROVAULT_VAULT_FILE_OPS_HPP_
#define NARROVAULT_VAULT_FILE_OPS_HPP_

#include <string>
#include <vector>

namespace narrovault::vault {

// mkdir -p. Throws VaultError.
void MakeDirs(const std::string& path);

bool FileExists(const std::string& path);

// Entry names (no "." / ".."). Missing directory yields an empty list.
std::vector<std::string> ListDir(const std::string& path);

// fsync a file (or directory) by path. Throws VaultError.
void SyncPath(const std::string& path);

// Replaces path with content via a temporary sibling + fsync + rename, so
// readers see either the old or the new file. Throws VaultError.
void WriteFileAtomic(const std::string& path, const std::string& content);

// Publishes tmp_path under final_path without ever replacing an existing
// file (link(2) + unlink). Throws IntegrityViolation when final_path exists.
void PublishNoReplace(const std::string& tmp_path, const std::string& final_path);

// Unique sibling name for in-progress writes of final_path.
std::string PartialPathFor(const std::string& final_path);

bool ReadFileToString(const std::string& path, std::string* out);

// Copies src to dst (dst replaced atomically). Throws VaultError.
void CopyFileAtomic(const std::string& src, const std::string& dst);

std::string DirName(const std::string& path);
std::string BaseName(const std::string& path);

}  // namespace narrovault::vault

#endif  // NARROVAULT_VAULT_FILE_OPS_HPP_
