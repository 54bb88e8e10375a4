// Repository: NarroVault
// Component: Run lock
// Purpose: Single-flight guard for generation runs against one vault.
// Copyright (c) 2026 NarroVault

#include "narrovault/vault/RunLock.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <mutex>
#include <set>

#include "narrovault/util/Logger.hpp"
#include "narrovault/util/VaultError.hpp"

namespace narrovault::vault {

using narrovault::util::Logger;

namespace {

// Paths held by this process. flock(2) already excludes other open file
// descriptions, but the in-process registry lets kBlock waiters sleep on a
// condition variable instead of in the kernel.
std::mutex g_held_mutex;
std::condition_variable g_held_cv;
std::set<std::string> g_held;

}  // namespace

const char* RunLockPolicyToString(RunLockPolicy policy) {
  switch (policy) {
    case RunLockPolicy::kReject: return "reject";
    case RunLockPolicy::kBlock: return "block";
  }
  return "unknown";
}

RunLock::RunLock(const std::string& lock_path, RunLockPolicy policy) : lock_path_(lock_path) {
  {
    std::unique_lock<std::mutex> lock(g_held_mutex);
    if (g_held.count(lock_path_) > 0) {
      if (policy == RunLockPolicy::kReject) {
        Logger::Warn("[RunLock] REJECTED path=" + lock_path_ + " holder=this-process");
        throw RunInProgress("generation run already in progress for " + lock_path_);
      }
      Logger::Info("[RunLock] WAITING path=" + lock_path_);
      g_held_cv.wait(lock, [this] { return g_held.count(lock_path_) == 0; });
    }
    g_held.insert(lock_path_);
  }

  auto release_registry = [this] {
    std::lock_guard<std::mutex> lock(g_held_mutex);
    g_held.erase(lock_path_);
    g_held_cv.notify_all();
  };

  fd_ = ::open(lock_path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd_ < 0) {
    int saved = errno;
    release_registry();
    throw VaultError("RunLock: cannot open " + lock_path_ + ": " + std::strerror(saved));
  }

  const int op = policy == RunLockPolicy::kReject ? (LOCK_EX | LOCK_NB) : LOCK_EX;
  while (::flock(fd_, op) != 0) {
    if (errno == EINTR) continue;
    int saved = errno;
    ::close(fd_);
    fd_ = -1;
    release_registry();
    if (saved == EWOULDBLOCK) {
      Logger::Warn("[RunLock] REJECTED path=" + lock_path_ + " holder=other-process");
      throw RunInProgress("generation run already in progress for " + lock_path_);
    }
    throw VaultError("RunLock: flock failed for " + lock_path_ + ": " + std::strerror(saved));
  }

  std::string pid = std::to_string(getpid()) + "\n";
  if (::ftruncate(fd_, 0) == 0) {
    ssize_t n = ::write(fd_, pid.data(), pid.size());
    if (n < 0) Logger::Warn("[RunLock] PID_WRITE_FAILED path=" + lock_path_);
  }
  Logger::Info(std::string("[RunLock] ACQUIRED path=") + lock_path_ +
               " policy=" + RunLockPolicyToString(policy));
}

RunLock::~RunLock() {
  if (fd_ >= 0) {
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
  }
  std::lock_guard<std::mutex> lock(g_held_mutex);
  g_held.erase(lock_path_);
  g_held_cv.notify_all();
  Logger::Info("[RunLock] RELEASED path=" + lock_path_);
}

}  // namespace narrovault::vault
