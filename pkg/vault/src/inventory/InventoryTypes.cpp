// Repository: NarroVault
// Component: Inventory Model
// Purpose: Canonical representation of a script's narration chunks.
// Copyright (c) 2026 NarroVault

#include "narrovault/inventory/InventoryTypes.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>

#include "narrovault/util/JsonLine.hpp"
#include "narrovault/util/VaultError.hpp"

namespace narrovault::inventory {

using util::JsonObjectReader;
using util::JsonObjectWriter;

int CountCharacters(const std::string& utf8) {
  int count = 0;
  for (unsigned char c : utf8) {
    // Continuation bytes (10xxxxxx) do not start a code point.
    if ((c & 0xC0) != 0x80) ++count;
  }
  return count;
}

std::string Chunk::ToJson() const {
  JsonObjectWriter w;
  w.Add("script_id", script_id)
      .AddInt("chunk_index", chunk_index)
      .Add("text", text)
      .AddInt("char_count", char_count)
      .Add("category", category)
      .Add("emotion", emotion)
      .AddBool("is_opening", is_opening)
      .AddBool("is_closing", is_closing)
      .AddDouble("pause_after", pause_after_s)
      .AddBool("explicit_pause", explicit_pause);
  return w.str();
}

bool Chunk::FromJson(const std::string& line, Chunk& out) {
  JsonObjectReader r;
  if (!JsonObjectReader::Parse(line, &r)) return false;
  int64_t index = 0;
  if (!r.GetString("text", &out.text)) return false;
  if (!r.GetInt64("chunk_index", &index)) return false;
  out.chunk_index = static_cast<int>(index);
  out.script_id = r.StringOr("script_id", "");
  out.category = r.StringOr("category", "");
  out.emotion = r.StringOr("emotion", "");
  out.pause_after_s = r.DoubleOr("pause_after", 0.0);
  out.explicit_pause = r.BoolOr("explicit_pause", false);
  out.char_count = CountCharacters(out.text);
  return true;
}

ScriptInventory ScriptInventory::FromBlocks(const std::string& script_id,
                                            const std::string& category,
                                            const std::string& emotion,
                                            const std::vector<BlockInput>& blocks) {
  std::vector<Chunk> chunks;
  chunks.reserve(blocks.size());
  for (size_t i = 0; i < blocks.size(); ++i) {
    Chunk c;
    c.script_id = script_id;
    c.chunk_index = static_cast<int>(i);
    c.text = blocks[i].text;
    c.category = category;
    c.emotion = emotion;
    c.pause_after_s = blocks[i].pause_after_s;
    c.explicit_pause = blocks[i].explicit_pause;
    chunks.push_back(std::move(c));
  }
  return FromChunks(script_id, std::move(chunks));
}

ScriptInventory ScriptInventory::FromChunks(std::string script_id, std::vector<Chunk> chunks) {
  std::stable_sort(chunks.begin(), chunks.end(),
                   [](const Chunk& a, const Chunk& b) { return a.chunk_index < b.chunk_index; });
  int max_index = chunks.empty() ? -1 : chunks.back().chunk_index;
  for (auto& c : chunks) {
    if (c.script_id.empty()) c.script_id = script_id;
    c.char_count = CountCharacters(c.text);
    c.is_opening = (c.chunk_index == 0);
    c.is_closing = (c.chunk_index == max_index);
  }
  ScriptInventory inv;
  inv.script_id_ = std::move(script_id);
  inv.chunks_ = std::move(chunks);
  return inv;
}

const Chunk& ScriptInventory::at(int chunk_index) const {
  for (const auto& c : chunks_) {
    if (c.chunk_index == chunk_index) return c;
  }
  throw std::out_of_range("ScriptInventory: no chunk " + std::to_string(chunk_index) +
                          " in script " + script_id_);
}

int ScriptInventory::TotalCharacters() const {
  int total = 0;
  for (const auto& c : chunks_) total += c.char_count;
  return total;
}

const std::string& ScriptInventory::category() const {
  static const std::string kEmpty;
  return chunks_.empty() ? kEmpty : chunks_.front().category;
}

const std::string& ScriptInventory::emotion() const {
  static const std::string kEmpty;
  return chunks_.empty() ? kEmpty : chunks_.front().emotion;
}

ScriptInventory LoadInventoryFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw InventoryInvalid("cannot open inventory file " + path);
  }
  std::vector<Chunk> chunks;
  std::string script_id;
  std::string line;
  int line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty() || line[0] == '#') continue;
    Chunk c;
    if (!Chunk::FromJson(line, c)) {
      throw InventoryInvalid("malformed inventory line " + std::to_string(line_no) +
                             " in " + path);
    }
    if (script_id.empty()) script_id = c.script_id;
    chunks.push_back(std::move(c));
  }
  if (script_id.empty()) {
    throw InventoryInvalid("inventory file has no script_id: " + path);
  }
  return ScriptInventory::FromChunks(script_id, std::move(chunks));
}

}  // namespace narrovault::inventory
