// Repository: NarroVault
// Component: Vault log writer
// Purpose: The single writer for every append-only log in a vault.
// Copyright (c) 2026 NarroVault

#include "narrovault/vault/LogWriter.hpp"

#include <exception>
#include <utility>
#include <vector>

#include "narrovault/util/Logger.hpp"
#include "narrovault/util/TimeFormat.hpp"
#include "narrovault/util/VaultError.hpp"

namespace narrovault::vault {

using narrovault::util::Logger;

LogWriter::LogWriter(std::shared_ptr<ITimeSource> time_source)
    : time_source_(time_source ? std::move(time_source)
                               : std::make_shared<SystemTimeSource>()) {
  writer_thread_ = std::thread(&LogWriter::WriterLoop, this);
}

LogWriter::~LogWriter() {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    shutdown_ = true;
    queue_cv_.notify_all();
  }
  if (writer_thread_.joinable()) writer_thread_.join();
}

std::future<uint64_t> LogWriter::Submit(const std::string& path, const std::string& record_type,
                                        const std::string& payload) {
  Job job;
  job.path = path;
  job.record_type = record_type;
  job.payload = payload;
  std::future<uint64_t> result = job.done.get_future();
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (shutdown_) {
      job.done.set_exception(std::make_exception_ptr(
          VaultError("LogWriter: submit after shutdown for " + path)));
      return result;
    }
    queue_.push_back(std::move(job));
  }
  queue_cv_.notify_one();
  return result;
}

uint64_t LogWriter::AppendDurable(const std::string& path, const std::string& record_type,
                                  const std::string& payload) {
  return Submit(path, record_type, payload).get();
}

uint64_t LogWriter::CommittedCount() const {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  return committed_count_;
}

AppendLog& LogWriter::LogFor(const std::string& path) {
  auto it = logs_.find(path);
  if (it == logs_.end()) {
    it = logs_.emplace(path, std::make_unique<AppendLog>(path)).first;
  }
  return *it->second;
}

void LogWriter::WriterLoop() {
  while (true) {
    std::deque<Job> batch;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_cv_.wait(lock, [this] { return shutdown_ || !queue_.empty(); });
      if (queue_.empty() && shutdown_) break;
      batch.swap(queue_);
    }

    // Append every job, then sync each touched log once before resolving
    // its callers: a future resolves only after its record is durable.
    struct Pending {
      Job* job;
      uint64_t sequence;
    };
    std::map<std::string, std::vector<Pending>> appended;
    for (auto& job : batch) {
      try {
        AppendLog& log = LogFor(job.path);
        uint64_t sequence = log.Append(job.record_type, job.payload,
                                       util::FormatIso8601Utc(time_source_->NowUtcMs()));
        appended[job.path].push_back({&job, sequence});
      } catch (const IntegrityViolation& e) {
        Logger::Error(std::string("[LogWriter] INTEGRITY_VIOLATION ") + e.what());
        job.done.set_exception(std::current_exception());
      } catch (const std::exception& e) {
        Logger::Error(std::string("[LogWriter] APPEND_FAILED ") + e.what());
        job.done.set_exception(std::current_exception());
      }
    }

    uint64_t committed = 0;
    for (auto& [path, pending] : appended) {
      try {
        logs_.at(path)->Sync();
        for (auto& p : pending) p.job->done.set_value(p.sequence);
        committed += pending.size();
      } catch (const std::exception& e) {
        Logger::Error(std::string("[LogWriter] SYNC_FAILED ") + e.what());
        for (auto& p : pending) p.job->done.set_exception(std::current_exception());
      }
    }

    std::lock_guard<std::mutex> lock(queue_mutex_);
    committed_count_ += committed;
  }
}

}  // namespace narrovault::vault
