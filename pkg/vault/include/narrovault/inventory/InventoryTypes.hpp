// Repository: NarroVault
// Component: Inventory Model
// Purpose: Canonical representation of a script's narration chunks.
// Copyright (c) 2026 NarroVault

#ifndef NARROVAULT_INVENTORY_INVENTORY_TYPES_HPP_
#define NARROVAULT_INVENTORY_INVENTORY_TYPES_HPP_

#include <string>
#include <vector>

namespace narrovault::inventory {

// Number of Unicode code points in a UTF-8 string.
int CountCharacters(const std::string& utf8);

// One unit of narration text. Immutable once the inventory is built.
struct Chunk {
  std::string script_id;
  int chunk_index = 0;
  std::string text;
  int char_count = 0;
  std::string category;
  std::string emotion;
  bool is_opening = false;
  bool is_closing = false;

  // Declared silence after this chunk (seconds).
  double pause_after_s = 0.0;
  // Pause came from an explicit marker; assembly uses it verbatim.
  bool explicit_pause = false;

  std::string ToJson() const;
  // Reads the script-source form; derived fields are recomputed by the
  // inventory builder, not trusted from the file.
  static bool FromJson(const std::string& line, Chunk& out);
};

// Raw block as supplied by the script source.
struct BlockInput {
  std::string text;
  double pause_after_s = 0.0;
  bool explicit_pause = false;
};

class ScriptInventory {
 public:
  ScriptInventory() = default;

  // Builds chunks 0..N-1 in block order; derives char_count, is_opening and
  // is_closing.
  static ScriptInventory FromBlocks(const std::string& script_id,
                                    const std::string& category,
                                    const std::string& emotion,
                                    const std::vector<BlockInput>& blocks);

  // Takes chunks as given (used by the loader). Derived fields are recomputed
  // from the text and indices; structure is left for InventoryValidator.
  static ScriptInventory FromChunks(std::string script_id, std::vector<Chunk> chunks);

  const std::string& script_id() const { return script_id_; }
  const std::vector<Chunk>& chunks() const { return chunks_; }
  int size() const { return static_cast<int>(chunks_.size()); }
  bool empty() const { return chunks_.empty(); }
  const Chunk& at(int chunk_index) const;

  int TotalCharacters() const;
  const std::string& category() const;
  const std::string& emotion() const;

 private:
  std::string script_id_;
  std::vector<Chunk> chunks_;
};

// Reads a script-source file: one JSON object per line. Throws
// InventoryInvalid if the file is unreadable or a line is malformed.
ScriptInventory LoadInventoryFile(const std::string& path);

}  // namespace narrovault::inventory

#endif  // NARROVAULT_INVENTORY_INVENTORY_TYPES_HPP_
