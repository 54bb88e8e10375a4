// Repository: NarroVault
// Component: Vault file operations
// Purpose: POSIX helpers for durable, never-overwriting file publication.
// Copyright (c) 2026 NarroVault

#include "narrovault/vault/FileOps.hpp"

#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <functional>
#include <sstream>
#include <thread>

#include "narrovault/util/VaultError.hpp"

namespace narrovault::vault {

namespace {

std::atomic<uint64_t> g_partial_counter{0};

std::string Errno() { return std::strerror(errno); }

void WriteAll(int fd, const char* data, size_t size, const std::string& path) {
  size_t written = 0;
  while (written < size) {
    ssize_t n = ::write(fd, data + written, size - written);
    if (n < 0) {
      if (errno == EINTR) continue;
      throw VaultError("write failed for " + path + ": " + Errno());
    }
    written += static_cast<size_t>(n);
  }
}

}  // namespace

std::string DirName(const std::string& path) {
  size_t slash = path.find_last_of('/');
  if (slash == std::string::npos) return ".";
  if (slash == 0) return "/";
  return path.substr(0, slash);
}

std::string BaseName(const std::string& path) {
  size_t slash = path.find_last_of('/');
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

void MakeDirs(const std::string& path) {
  if (path.empty()) return;
  std::string partial;
  std::stringstream ss(path);
  std::string part;
  if (path.front() == '/') partial = "/";
  while (std::getline(ss, part, '/')) {
    if (part.empty()) continue;
    if (!partial.empty() && partial.back() != '/') partial += "/";
    partial += part;
    if (mkdir(partial.c_str(), 0755) != 0 && errno != EEXIST) {
      throw VaultError("cannot create directory " + partial + ": " + Errno());
    }
  }
}

bool FileExists(const std::string& path) {
  struct stat st;
  return stat(path.c_str(), &st) == 0;
}

std::vector<std::string> ListDir(const std::string& path) {
  std::vector<std::string> names;
  DIR* dir = opendir(path.c_str());
  if (!dir) return names;
  while (struct dirent* entry = readdir(dir)) {
    std::string name = entry->d_name;
    if (name == "." || name == "..") continue;
    names.push_back(name);
  }
  closedir(dir);
  return names;
}

void SyncPath(const std::string& path) {
  int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) throw VaultError("cannot open for fsync " + path + ": " + Errno());
  int rc = ::fsync(fd);
  int saved = errno;
  ::close(fd);
  if (rc != 0) {
    errno = saved;
    throw VaultError("fsync failed for " + path + ": " + Errno());
  }
}

std::string PartialPathFor(const std::string& final_path) {
  std::ostringstream o;
  o << final_path << ".partial-" << getpid() << "-"
    << std::hash<std::thread::id>{}(std::this_thread::get_id()) % 100000 << "-"
    << g_partial_counter.fetch_add(1);
  return o.str();
}

void WriteFileAtomic(const std::string& path, const std::string& content) {
  const std::string tmp = PartialPathFor(path);
  int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) throw VaultError("cannot create " + tmp + ": " + Errno());
  try {
    WriteAll(fd, content.data(), content.size(), tmp);
    if (::fsync(fd) != 0) throw VaultError("fsync failed for " + tmp + ": " + Errno());
  } catch (const VaultError&) {
    ::close(fd);
    ::unlink(tmp.c_str());
    throw;
  }
  ::close(fd);
  if (std::rename(tmp.c_str(), path.c_str()) != 0) {
    std::string err = Errno();
    ::unlink(tmp.c_str());
    throw VaultError("rename " + tmp + " -> " + path + " failed: " + err);
  }
  SyncPath(DirName(path));
}

void PublishNoReplace(const std::string& tmp_path, const std::string& final_path) {
  if (::link(tmp_path.c_str(), final_path.c_str()) != 0) {
    int saved = errno;
    ::unlink(tmp_path.c_str());
    if (saved == EEXIST) {
      throw IntegrityViolation("refusing to overwrite committed file " + final_path);
    }
    errno = saved;
    throw VaultError("cannot publish " + final_path + ": " + Errno());
  }
  ::unlink(tmp_path.c_str());
  SyncPath(DirName(final_path));
}

bool ReadFileToString(const std::string& path, std::string* out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  std::ostringstream ss;
  ss << in.rdbuf();
  *out = ss.str();
  return true;
}

void CopyFileAtomic(const std::string& src, const std::string& dst) {
  std::string content;
  if (!ReadFileToString(src, &content)) throw VaultError("cannot read " + src);
  WriteFileAtomic(dst, content);
}

}  // namespace narrovault::vault
