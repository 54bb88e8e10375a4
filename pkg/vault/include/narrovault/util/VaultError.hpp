// Repository: NarroVault
// Component: Vault Error Taxonomy
// Purpose: Structural failures raised as exceptions with session/chunk/stage
//          context. Per-candidate failures (throttling, transient I/O,
//          rejected requests) are outcome values, not exceptions.
// Copyright (c) 2026 NarroVault

#ifndef NARROVAULT_UTIL_VAULT_ERROR_HPP_
#define NARROVAULT_UTIL_VAULT_ERROR_HPP_

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace narrovault {

struct ErrorContext {
  std::string session_id;
  int chunk_index = -1;  // -1 when the failure is not chunk-specific
  std::string stage;

  std::string Describe() const {
    std::string out;
    if (!session_id.empty()) out += " session=" + session_id;
    if (chunk_index >= 0) out += " chunk=" + std::to_string(chunk_index);
    if (!stage.empty()) out += " stage=" + stage;
    return out;
  }
};

class VaultError : public std::runtime_error {
 public:
  VaultError(const std::string& what, ErrorContext context = {})
      : std::runtime_error(what + context.Describe()),
        context_(std::move(context)) {}

  const ErrorContext& context() const { return context_; }

 private:
  ErrorContext context_;
};

// Attempt to overwrite a committed candidate or to write a non-append record.
// Always fatal.
class IntegrityViolation : public VaultError {
 public:
  using VaultError::VaultError;
};

class IncompletePicksError : public VaultError {
 public:
  IncompletePicksError(const std::string& session_id, std::vector<int> missing)
      : VaultError("IncompletePicks missing=" + Join(missing),
                   ErrorContext{session_id, -1, "PICKS_LOADED"}),
        missing_chunks_(std::move(missing)) {}

  const std::vector<int>& missing_chunks() const { return missing_chunks_; }

 private:
  static std::string Join(const std::vector<int>& v) {
    std::string out;
    for (size_t i = 0; i < v.size(); ++i) {
      if (i > 0) out += ",";
      out += std::to_string(v[i]);
    }
    return out;
  }

  std::vector<int> missing_chunks_;
};

class QaGateFailure : public VaultError {
 public:
  QaGateFailure(const std::string& session_id, std::vector<std::string> gates)
      : VaultError("QAGateFailure gates=" + Join(gates),
                   ErrorContext{session_id, -1, "QA_CHECKED"}),
        failed_gates_(std::move(gates)) {}

  const std::vector<std::string>& failed_gates() const { return failed_gates_; }

 private:
  static std::string Join(const std::vector<std::string>& v) {
    std::string out;
    for (size_t i = 0; i < v.size(); ++i) {
      if (i > 0) out += ",";
      out += v[i];
    }
    return out;
  }

  std::vector<std::string> failed_gates_;
};

class AssemblyError : public VaultError {
 public:
  using VaultError::VaultError;
};

class RunInProgress : public VaultError {
 public:
  using VaultError::VaultError;
};

class BackupIncomplete : public VaultError {
 public:
  using VaultError::VaultError;
};

class InventoryInvalid : public VaultError {
 public:
  using VaultError::VaultError;
};

class IllegalTransition : public VaultError {
 public:
  using VaultError::VaultError;
};

class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

}  // namespace narrovault

#endif  // NARROVAULT_UTIL_VAULT_ERROR_HPP_
