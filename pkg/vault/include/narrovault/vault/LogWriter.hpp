// Repository: NarroVault
// Component: Vault log writer
// Purpose: The single writer for every append-only log in a vault. Callers
//          on any thread submit records; one writer thread assigns sequence
//          numbers, appends and syncs, then resolves the caller's future.
// Copyright (c) 2026 NarroVault

#ifndef NARROVAULT_VAULT_LOG_WRITER_HPP_
#define NARROVAULT_VAULT_LOG_WRITER_HPP_

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "narrovault/vault/AppendLog.hpp"
#include "time/ITimeSource.hpp"

namespace narrovault::vault {

class LogWriter {
 public:
  // time_source stamps written_utc; nullptr uses the system clock.
  explicit LogWriter(std::shared_ptr<ITimeSource> time_source = nullptr);
  // Drains everything already submitted, then joins the writer thread.
  ~LogWriter();

  LogWriter(const LogWriter&) = delete;
  LogWriter& operator=(const LogWriter&) = delete;

  // Enqueue one record. The future yields the committed sequence once the
  // record is durable, or rethrows the writer's VaultError /
  // IntegrityViolation.
  std::future<uint64_t> Submit(const std::string& path, const std::string& record_type,
                               const std::string& payload);

  // Submit and wait.
  uint64_t AppendDurable(const std::string& path, const std::string& record_type,
                         const std::string& payload);

  // Number of records durably appended by this writer.
  uint64_t CommittedCount() const;

 private:
  struct Job {
    std::string path;
    std::string record_type;
    std::string payload;
    std::promise<uint64_t> done;
  };

  void WriterLoop();
  AppendLog& LogFor(const std::string& path);

  std::shared_ptr<ITimeSource> time_source_;

  mutable std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::deque<Job> queue_;
  bool shutdown_ = false;
  uint64_t committed_count_ = 0;

  // Writer-thread only.
  std::map<std::string, std::unique_ptr<AppendLog>> logs_;

  std::thread writer_thread_;
};

}  // namespace narrovault::vault

#endif  // NARROVAULT_VAULT_LOG_WRITER_HPP_
