// Repository: NarroVault
// Component: Inventory Validator
// Purpose: Structural validation of a script inventory plus a pluggable
//          chunk-length policy that decides vault readiness.
// Copyright (c) 2026 NarroVault

#include "narrovault/inventory/InventoryValidator.hpp"

#include <sstream>

namespace narrovault::inventory {

const char* InventoryErrorToString(InventoryError error) {
  switch (error) {
    case InventoryError::kNone: return "NONE";
    case InventoryError::kEmptyScript: return "EMPTY_SCRIPT";
    case InventoryError::kMixedScriptId: return "MIXED_SCRIPT_ID";
    case InventoryError::kEmptyText: return "EMPTY_TEXT";
    case InventoryError::kDuplicateIndex: return "DUPLICATE_INDEX";
    case InventoryError::kIndexGap: return "INDEX_GAP";
    case InventoryError::kCharCountMismatch: return "CHAR_COUNT_MISMATCH";
    case InventoryError::kOpeningFlag: return "OPENING_FLAG";
    case InventoryError::kClosingFlag: return "CLOSING_FLAG";
    case InventoryError::kNegativePause: return "NEGATIVE_PAUSE";
    case InventoryError::kOpeningTooLong: return "OPENING_TOO_LONG";
    case InventoryError::kChunkTooShort: return "CHUNK_TOO_SHORT";
    case InventoryError::kChunkTooLong: return "CHUNK_TOO_LONG";
  }
  return "UNKNOWN";
}

InventoryValidator::InventoryValidator(ChunkPolicy policy) : policy_(policy) {}

InventoryValidator::ValidationResult InventoryValidator::Validate(
    const ScriptInventory& inventory) const {
  auto result = ValidateNonEmpty(inventory);
  if (!result.valid) return result;

  result = ValidateIndices(inventory);
  if (!result.valid) return result;

  return ValidateDerivedFields(inventory);
}

InventoryValidator::ValidationResult InventoryValidator::ValidateNonEmpty(
    const ScriptInventory& inventory) const {
  if (inventory.empty()) {
    return ValidationResult::Failure(InventoryError::kEmptyScript,
                                     "script " + inventory.script_id() + " has no chunks");
  }
  for (const auto& c : inventory.chunks()) {
    if (c.script_id != inventory.script_id()) {
      return ValidationResult::Failure(InventoryError::kMixedScriptId,
                                       "chunk belongs to script " + c.script_id,
                                       c.chunk_index);
    }
    if (c.text.empty()) {
      return ValidationResult::Failure(InventoryError::kEmptyText, "empty text",
                                       c.chunk_index);
    }
  }
  return ValidationResult::Success();
}

InventoryValidator::ValidationResult InventoryValidator::ValidateIndices(
    const ScriptInventory& inventory) const {
  // Chunks are kept sorted, so position i must hold index i.
  const auto& chunks = inventory.chunks();
  for (size_t i = 0; i < chunks.size(); ++i) {
    int expected = static_cast<int>(i);
    if (chunks[i].chunk_index == expected) continue;
    std::ostringstream detail;
    if (i > 0 && chunks[i].chunk_index == chunks[i - 1].chunk_index) {
      detail << "chunk_index " << chunks[i].chunk_index << " appears more than once";
      return ValidationResult::Failure(InventoryError::kDuplicateIndex, detail.str(),
                                       chunks[i].chunk_index);
    }
    detail << "expected chunk_index " << expected << ", found " << chunks[i].chunk_index;
    return ValidationResult::Failure(InventoryError::kIndexGap, detail.str(), expected);
  }
  return ValidationResult::Success();
}

InventoryValidator::ValidationResult InventoryValidator::ValidateDerivedFields(
    const ScriptInventory& inventory) const {
  const int last = inventory.size() - 1;
  for (const auto& c : inventory.chunks()) {
    if (c.char_count != CountCharacters(c.text)) {
      std::ostringstream detail;
      detail << "char_count " << c.char_count << " != text length "
             << CountCharacters(c.text);
      return ValidationResult::Failure(InventoryError::kCharCountMismatch, detail.str(),
                                       c.chunk_index);
    }
    if (c.is_opening != (c.chunk_index == 0)) {
      return ValidationResult::Failure(InventoryError::kOpeningFlag,
                                       "is_opening must be set on chunk 0 only",
                                       c.chunk_index);
    }
    if (c.is_closing != (c.chunk_index == last)) {
      return ValidationResult::Failure(InventoryError::kClosingFlag,
                                       "is_closing must be set on the last chunk only",
                                       c.chunk_index);
    }
    if (c.pause_after_s < 0.0) {
      return ValidationResult::Failure(InventoryError::kNegativePause,
                                       "pause_after must be >= 0", c.chunk_index);
    }
  }
  return ValidationResult::Success();
}

std::vector<InventoryValidator::ValidationResult> InventoryValidator::CheckVaultReady(
    const ScriptInventory& inventory) const {
  std::vector<ValidationResult> issues;
  for (const auto& c : inventory.chunks()) {
    std::ostringstream detail;
    if (c.chunk_index == 0) {
      if (c.char_count >= policy_.opening_max_chars) {
        detail << "opening chunk has " << c.char_count << " chars (limit < "
               << policy_.opening_max_chars << ")";
        issues.push_back(ValidationResult::Failure(InventoryError::kOpeningTooLong,
                                                   detail.str(), c.chunk_index));
      }
      continue;
    }
    if (c.char_count < policy_.min_chars) {
      detail << c.char_count << " chars (minimum " << policy_.min_chars << ")";
      issues.push_back(ValidationResult::Failure(InventoryError::kChunkTooShort,
                                                 detail.str(), c.chunk_index));
    } else if (c.char_count > policy_.max_chars) {
      detail << c.char_count << " chars (maximum " << policy_.max_chars << ")";
      issues.push_back(ValidationResult::Failure(InventoryError::kChunkTooLong,
                                                 detail.str(), c.chunk_index));
    }
  }
  return issues;
}

}  // namespace narrovault::inventory
