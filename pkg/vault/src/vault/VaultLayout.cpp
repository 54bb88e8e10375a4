// Repository: NarroVault
// Component: Vault layout
// Purpose: Path scheme of the on-disk vault.
// Copyright (c) 2026 NarroVault

#include "narrovault/vault/VaultLayout.hpp"

#include <cctype>
#include <cstdio>
#include <utility>

namespace narrovault::vault {

VaultLayout::VaultLayout(std::string root) : root_(std::move(root)) {
  while (root_.size() > 1 && root_.back() == '/') root_.pop_back();
}

std::string VaultLayout::InventoryLog() const { return root_ + "/inventory.jsonl"; }
std::string VaultLayout::GenerationLog() const { return root_ + "/generation-log.jsonl"; }
std::string VaultLayout::LockFile() const { return root_ + "/.generation.lock"; }

std::string VaultLayout::SessionDir(const std::string& session_id) const {
  return root_ + "/" + session_id;
}

std::string VaultLayout::SessionManifest(const std::string& session_id) const {
  return SessionDir(session_id) + "/session-manifest.json";
}

std::string VaultLayout::StatusLog(const std::string& session_id) const {
  return SessionDir(session_id) + "/status-log.jsonl";
}

std::string VaultLayout::CallLog(const std::string& session_id) const {
  return SessionDir(session_id) + "/api-calls.jsonl";
}

std::string VaultLayout::ChunkDir(const std::string& session_id, int chunk_index) const {
  return SessionDir(session_id) + "/" + ChunkTag(chunk_index);
}

std::string VaultLayout::CandidateAudio(const std::string& session_id, int chunk_index,
                                        int version) const {
  return ChunkDir(session_id, chunk_index) + "/" + CandidateFileName(chunk_index, version);
}

std::string VaultLayout::CandidateMetaLog(const std::string& session_id, int chunk_index) const {
  return ChunkDir(session_id, chunk_index) + "/" + ChunkTag(chunk_index) + "_meta.jsonl";
}

std::string VaultLayout::PicksDir(const std::string& session_id) const {
  return SessionDir(session_id) + "/picks";
}

std::string VaultLayout::PickLog(const std::string& session_id) const {
  return PicksDir(session_id) + "/picks.jsonl";
}

std::string VaultLayout::FinalDir(const std::string& session_id) const {
  return SessionDir(session_id) + "/final";
}

std::string VaultLayout::AssemblyLog(const std::string& session_id) const {
  return FinalDir(session_id) + "/assemblies.jsonl";
}

std::string VaultLayout::FinalArtifact(const std::string& session_id, int assembly_number,
                                       const std::string& artifact) const {
  char tag[16];
  std::snprintf(tag, sizeof(tag), "a%03d", assembly_number);
  return FinalDir(session_id) + "/" + session_id + "-" + tag + "-" + artifact;
}

std::string VaultLayout::Relative(const std::string& path) const {
  const std::string prefix = root_ + "/";
  if (path.compare(0, prefix.size(), prefix) == 0) return path.substr(prefix.size());
  return path;
}

std::string VaultLayout::ChunkTag(int chunk_index) {
  char tag[16];
  std::snprintf(tag, sizeof(tag), "c%02d", chunk_index);
  return tag;
}

std::string VaultLayout::CandidateFileName(int chunk_index, int version) {
  char name[32];
  std::snprintf(name, sizeof(name), "c%02d_v%03d.wav", chunk_index, version);
  return name;
}

int VaultLayout::ParseCandidateVersion(const std::string& file_name, int chunk_index) {
  const std::string prefix = ChunkTag(chunk_index) + "_v";
  if (file_name.compare(0, prefix.size(), prefix) != 0) return -1;
  size_t pos = prefix.size();
  size_t end = pos;
  while (end < file_name.size() && std::isdigit(static_cast<unsigned char>(file_name[end]))) ++end;
  if (end == pos || end - pos > 9) return -1;
  if (file_name.compare(end, 4, ".wav") != 0) return -1;
  const std::string rest = file_name.substr(end + 4);
  if (!rest.empty() && rest.compare(0, 9, ".partial-") != 0) return -1;
  return std::stoi(file_name.substr(pos, end - pos));
}

bool VaultLayout::IsValidSessionId(const std::string& session_id) {
  if (session_id.empty() || session_id == "." || session_id == "..") return false;
  for (char c : session_id) {
    if (c == '/' || c == '\\' || c == '\0' || c == '\n') return false;
  }
  return true;
}

}  // namespace narrovault::vault
