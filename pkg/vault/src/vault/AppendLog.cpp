// Repository: NarroVault
// Component: Append-only log
// Purpose: One JSONL file of sequenced envelopes. Appends are single
//          write(2) calls followed by fdatasync; replay skips a torn tail.
// Copyright (c) 2026 NarroVault

#include "narrovault/vault/AppendLog.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sstream>

#include "narrovault/util/Logger.hpp"
#include "narrovault/util/VaultError.hpp"

namespace narrovault::vault {

using narrovault::util::Logger;

namespace {

// Holds flock(LOCK_EX) on an fd for one scope.
class FileLockGuard {
 public:
  FileLockGuard(int fd, const std::string& path) : fd_(fd) {
    while (::flock(fd_, LOCK_EX) != 0) {
      if (errno == EINTR) continue;
      throw VaultError("AppendLog: cannot lock " + path + ": " + std::strerror(errno));
    }
  }
  ~FileLockGuard() { ::flock(fd_, LOCK_UN); }

 private:
  int fd_;
};

}  // namespace

AppendLog::AppendLog(std::string path) : path_(std::move(path)) {
  fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
  if (fd_ < 0) {
    throw VaultError("AppendLog: cannot open " + path_ + ": " + std::strerror(errno));
  }
  try {
    FileLockGuard lock(fd_, path_);
    CatchUpLocked();
  } catch (...) {
    ::close(fd_);
    fd_ = -1;
    throw;
  }
}

AppendLog::~AppendLog() {
  if (fd_ >= 0) ::close(fd_);
}

void AppendLog::CatchUpLocked() {
  struct stat st;
  if (fstat(fd_, &st) != 0) {
    throw VaultError("AppendLog: cannot stat " + path_ + ": " + std::strerror(errno));
  }
  if (st.st_size == committed_bytes_) return;
  if (st.st_size < committed_bytes_) {
    throw IntegrityViolation("AppendLog: " + path_ + " shrank from " +
                             std::to_string(committed_bytes_) + " to " +
                             std::to_string(st.st_size) + " bytes");
  }

  std::string tail(static_cast<size_t>(st.st_size - committed_bytes_), '\0');
  size_t got = 0;
  while (got < tail.size()) {
    ssize_t n = ::pread(fd_, &tail[got], tail.size() - got,
                        committed_bytes_ + static_cast<off_t>(got));
    if (n < 0) {
      if (errno == EINTR) continue;
      throw VaultError("AppendLog: cannot read " + path_ + ": " + std::strerror(errno));
    }
    if (n == 0) break;
    got += static_cast<size_t>(n);
  }
  tail.resize(got);

  size_t skipped = 0;
  size_t start = 0;
  while (start < tail.size()) {
    size_t nl = tail.find('\n', start);
    if (nl == std::string::npos) break;  // unterminated fragment
    std::string line = tail.substr(start, nl - start);
    start = nl + 1;
    if (line.empty()) continue;
    LogRecord rec;
    if (!LogRecord::FromJsonLine(line, rec)) {
      ++skipped;
      continue;
    }
    if (rec.sequence > last_sequence_) last_sequence_ = rec.sequence;
  }
  needs_newline_ = !tail.empty() && tail.back() != '\n';
  if (needs_newline_) Logger::Warn("[AppendLog] TORN_TAIL path=" + path_);
  if (skipped > 0) {
    Logger::Warn("[AppendLog] SKIPPED_CORRUPT_LINES path=" + path_ +
                 " count=" + std::to_string(skipped));
  }
  committed_bytes_ = static_cast<off_t>(committed_bytes_ + got);
}

void AppendLog::WriteLineLocked(const LogRecord& record) {
  std::string line;
  if (needs_newline_) line += '\n';
  line += record.ToJsonLine();
  line += '\n';

  size_t written = 0;
  while (written < line.size()) {
    ssize_t n = ::write(fd_, line.data() + written, line.size() - written);
    if (n < 0) {
      if (errno == EINTR) continue;
      int saved = errno;
      // Whatever reached the file is now a torn line; later appends follow it.
      if (written > 0) {
        committed_bytes_ += static_cast<off_t>(written);
        needs_newline_ = true;
      }
      throw VaultError("AppendLog: write failed for " + path_ + ": " + std::strerror(saved));
    }
    written += static_cast<size_t>(n);
  }
  committed_bytes_ += static_cast<off_t>(line.size());
  needs_newline_ = false;
  last_sequence_ = record.sequence;
}

uint64_t AppendLog::Append(const std::string& record_type, const std::string& payload,
                           const std::string& written_utc) {
  FileLockGuard lock(fd_, path_);
  CatchUpLocked();
  LogRecord rec;
  rec.sequence = last_sequence_ + 1;
  rec.record_type = record_type;
  rec.written_utc = written_utc;
  rec.payload = payload;
  WriteLineLocked(rec);
  return rec.sequence;
}

void AppendLog::AppendRecord(const LogRecord& record) {
  FileLockGuard lock(fd_, path_);
  CatchUpLocked();
  if (record.sequence != last_sequence_ + 1) {
    throw IntegrityViolation("AppendLog: sequence gap in " + path_ + " (expected " +
                             std::to_string(last_sequence_ + 1) + ", got " +
                             std::to_string(record.sequence) + ")");
  }
  WriteLineLocked(record);
}

void AppendLog::Sync() {
  if (::fdatasync(fd_) != 0) {
    throw VaultError("AppendLog: fdatasync failed for " + path_ + ": " + std::strerror(errno));
  }
}

std::vector<LogRecord> AppendLog::ReplayFile(const std::string& path, size_t* skipped) {
  std::vector<LogRecord> out;
  size_t bad = 0;
  std::ifstream in(path, std::ios::binary);
  if (in) {
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    size_t start = 0;
    while (start < content.size()) {
      size_t nl = content.find('\n', start);
      if (nl == std::string::npos) {
        // Unterminated tail: never a committed record.
        ++bad;
        break;
      }
      std::string line = content.substr(start, nl - start);
      start = nl + 1;
      if (line.empty()) continue;
      LogRecord rec;
      if (!LogRecord::FromJsonLine(line, rec)) {
        ++bad;
        continue;
      }
      out.push_back(std::move(rec));
    }
  }
  if (skipped) *skipped = bad;
  return out;
}

}  // namespace narrovault::vault
