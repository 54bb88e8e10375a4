// Repository: NarroVault
// Component: Append-only log
// Purpose: One JSONL file of sequenced envelopes. Appends are single
//          write(2) calls followed by fdatasync; replay skips a torn tail.
// Copyright (c) 2026 NarroVault

#ifndef NARROVAULT_VAULT_APPEND_LOG_HPP_
#define NARROVAULT_VAULT_APPEND_LOG_HPP_

#include <sys/types.h>

#include <cstdint>
#include <string>
#include <vector>

#include "narrovault/vault/VaultRecords.hpp"

namespace narrovault::vault {

// Not thread-safe: within a process an AppendLog is owned by exactly one
// writer (LogWriter's thread). Appends from other processes are serialized
// with flock(2) and picked up before each append. Readers use the static
// ReplayFile, which only trusts complete lines.
class AppendLog {
 public:
  // Opens (creating if needed) and scans the existing file for the last
  // committed sequence. Throws VaultError on I/O failure.
  explicit AppendLog(std::string path);
  ~AppendLog();

  AppendLog(const AppendLog&) = delete;
  AppendLog& operator=(const AppendLog&) = delete;

  // Appends payload under the next sequence number and returns it.
  // Does not sync; call Sync() to make it durable.
  uint64_t Append(const std::string& record_type, const std::string& payload,
                  const std::string& written_utc);

  // Compare-and-append of a fully formed record: record.sequence must be
  // exactly LastSequence() + 1. Throws IntegrityViolation otherwise.
  void AppendRecord(const LogRecord& record);

  // fdatasync. Throws VaultError.
  void Sync();

  uint64_t LastSequence() const { return last_sequence_; }
  const std::string& path() const { return path_; }

  // Complete, parseable records in file order. Torn or corrupt lines are
  // skipped (counted in *skipped when non-null).
  static std::vector<LogRecord> ReplayFile(const std::string& path, size_t* skipped = nullptr);

 private:
  // Reconciles with bytes appended by another writer since our last append.
  // Throws IntegrityViolation if the file shrank.
  void CatchUpLocked();
  void WriteLineLocked(const LogRecord& record);

  std::string path_;
  int fd_ = -1;
  uint64_t last_sequence_ = 0;
  off_t committed_bytes_ = 0;
  // File ended without '\n' (torn tail); the next append starts with one so
  // the fragment stays its own ignored line.
  bool needs_newline_ = false;
};

}  // namespace narrovault::vault

#endif  // NARROVAULT_VAULT_APPEND_LOG_HPP_
