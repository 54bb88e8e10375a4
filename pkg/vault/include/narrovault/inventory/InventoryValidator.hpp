// Repository: NarroVault
// Component: Inventory Validator
// Purpose: Structural validation of a script inventory plus a pluggable
//          chunk-length policy that decides vault readiness.
// Copyright (c) 2026 NarroVault

#ifndef NARROVAULT_INVENTORY_INVENTORY_VALIDATOR_HPP_
#define NARROVAULT_INVENTORY_INVENTORY_VALIDATOR_HPP_

#include <string>
#include <vector>

#include "narrovault/inventory/InventoryTypes.hpp"

namespace narrovault::inventory {

enum class InventoryError {
  kNone,
  kEmptyScript,
  kMixedScriptId,
  kEmptyText,
  kDuplicateIndex,
  kIndexGap,
  kCharCountMismatch,
  kOpeningFlag,
  kClosingFlag,
  kNegativePause,
  // Length policy (vault readiness)
  kOpeningTooLong,
  kChunkTooShort,
  kChunkTooLong,
};

const char* InventoryErrorToString(InventoryError error);

// Chunk length thresholds. Defaults: 20..300 chars, opening chunk < 60.
struct ChunkPolicy {
  int min_chars = 20;
  int max_chars = 300;
  // Opening chunk must be strictly shorter than this; it is exempt from
  // min_chars.
  int opening_max_chars = 60;
};

class InventoryValidator {
 public:
  explicit InventoryValidator(ChunkPolicy policy = {});

  struct ValidationResult {
    bool valid;
    InventoryError error;
    std::string detail;
    int chunk_index;  // -1 when not chunk-specific

    static ValidationResult Success() {
      return {true, InventoryError::kNone, "", -1};
    }

    static ValidationResult Failure(InventoryError err, const std::string& detail = "",
                                    int chunk_index = -1) {
      return {false, err, detail, chunk_index};
    }
  };

  // Structural checks, in order, fail fast on first error.
  ValidationResult Validate(const ScriptInventory& inventory) const;

  // Every length-policy violation (empty when the script is vault-ready).
  std::vector<ValidationResult> CheckVaultReady(const ScriptInventory& inventory) const;

  bool IsVaultReady(const ScriptInventory& inventory) const {
    return CheckVaultReady(inventory).empty();
  }

  const ChunkPolicy& policy() const { return policy_; }

 private:
  ValidationResult ValidateNonEmpty(const ScriptInventory& inventory) const;
  // chunk_index values contiguous [0..N-1]
  ValidationResult ValidateIndices(const ScriptInventory& inventory) const;
  // char_count == len(text), opening/closing flags, pauses
  ValidationResult ValidateDerivedFields(const ScriptInventory& inventory) const;

  ChunkPolicy policy_;
};

}  // namespace narrovault::inventory

#endif  // NARROVAULT_INVENTORY_INVENTORY_VALIDATOR_HPP_
