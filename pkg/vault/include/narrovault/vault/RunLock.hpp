// Repository: NarroVault
// Component: Run lock
// Purpose: Single-flight guard for generation runs against one vault, across
//          threads of this process and across processes.
// Copyright (c) 2026 NarroVault

#ifndef NARROVAULT_VAULT_RUN_LOCK_HPP_
#define NARROVAULT_VAULT_RUN_LOCK_HPP_

#include <string>

namespace narrovault::vault {

enum class RunLockPolicy {
  kReject,  // a second run fails with RunInProgress
  kBlock,   // a second run waits for the first to finish
};

const char* RunLockPolicyToString(RunLockPolicy policy);

// RAII holder. Acquired in the constructor, released in the destructor.
class RunLock {
 public:
  // Throws RunInProgress (kReject and the lock is held) or VaultError.
  RunLock(const std::string& lock_path, RunLockPolicy policy);
  ~RunLock();

  RunLock(const RunLock&) = delete;
  RunLock& operator=(const RunLock&) = delete;

  const std::string& path() const { return lock_path_; }

 private:
  std::string lock_path_;
  int fd_ = -1;
};

}  // namespace narrovault::vault

#endif  // NARROVAULT_VAULT_RUN_LOCK_HPP_
