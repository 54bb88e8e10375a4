// Repository: NarroVault
// Component: Backup mirror
// Purpose: Secondary copy of vault files written during a run.
// Copyright (c) 2026 NarroVault

#ifndef NARROVAULT_VAULT_BACKUP_MIRROR_HPP_
#define NARROVAULT_VAULT_BACKUP_MIRROR_HPP_

#include <string>
#include <vector>

namespace narrovault::vault {

class IBackupMirror {
 public:
  virtual ~IBackupMirror() = default;

  // Copies one vault file (path relative to the vault root). Returns false
  // and sets *error on failure.
  virtual bool Mirror(const std::string& vault_root, const std::string& relative_path,
                      std::string* error) = 0;

  // Makes everything mirrored so far durable at the destination.
  virtual bool Flush(std::string* error) = 0;
};

// Mirrors into a local directory tree (e.g. a mounted backup volume).
class DirectoryMirror : public IBackupMirror {
 public:
  explicit DirectoryMirror(std::string destination_root);

  bool Mirror(const std::string& vault_root, const std::string& relative_path,
              std::string* error) override;
  bool Flush(std::string* error) override;

  const std::string& destination_root() const { return destination_root_; }

 private:
  std::string destination_root_;
  std::vector<std::string> pending_dirs_;
};

}  // namespace narrovault::vault

#endif  // NARROVAULT_VAULT_BACKUP_MIRROR_HPP_
