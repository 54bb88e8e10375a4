// Repository: NarroVault
// Component: JSON line helpers
// Purpose: Minimal writer/reader for the single-line JSON objects stored in
//          vault logs, manifests and inventory files.
// Copyright (c) 2026 NarroVault

#ifndef NARROVAULT_UTIL_JSON_LINE_HPP_
#define NARROVAULT_UTIL_JSON_LINE_HPP_

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace narrovault::util {

std::string JsonEscape(const std::string& s);

// Shortest representation that parses back to the same double.
// Non-finite values are written as null.
std::string FormatJsonDouble(double v);

// Builds one JSON object. Keys are emitted in insertion order so identical
// inputs always produce identical bytes.
class JsonObjectWriter {
 public:
  JsonObjectWriter& Add(const std::string& key, const std::string& value);
  JsonObjectWriter& Add(const std::string& key, const char* value);
  JsonObjectWriter& AddInt(const std::string& key, int64_t value);
  JsonObjectWriter& AddUint(const std::string& key, uint64_t value);
  JsonObjectWriter& AddDouble(const std::string& key, double value);
  JsonObjectWriter& AddOptionalDouble(const std::string& key,
                                      const std::optional<double>& value);
  JsonObjectWriter& AddBool(const std::string& key, bool value);
  JsonObjectWriter& AddNull(const std::string& key);
  // value must already be valid JSON (object, array, literal).
  JsonObjectWriter& AddRaw(const std::string& key, const std::string& value);

  std::string str() const;

 private:
  void Key(const std::string& key);

  std::string body_;
};

// Joins already-serialized JSON values into an array.
std::string JsonArray(const std::vector<std::string>& raw_items);

// Parses one JSON object and exposes its top-level members. Nested objects
// and arrays are kept as raw text (parse them with another reader).
class JsonObjectReader {
 public:
  // Returns false if text is not a complete, well-formed object. A torn
  // trailing log line fails here.
  static bool Parse(const std::string& text, JsonObjectReader* out);

  bool Has(const std::string& key) const;
  bool IsNull(const std::string& key) const;

  bool GetString(const std::string& key, std::string* out) const;
  bool GetInt64(const std::string& key, int64_t* out) const;
  bool GetUint64(const std::string& key, uint64_t* out) const;
  bool GetDouble(const std::string& key, double* out) const;
  bool GetBool(const std::string& key, bool* out) const;
  bool GetRaw(const std::string& key, std::string* out) const;

  // Splits an array member into raw element texts.
  bool GetArray(const std::string& key, std::vector<std::string>* out) const;

  // Convenience accessors with defaults.
  std::string StringOr(const std::string& key, const std::string& fallback) const;
  int64_t IntOr(const std::string& key, int64_t fallback) const;
  double DoubleOr(const std::string& key, double fallback) const;
  bool BoolOr(const std::string& key, bool fallback) const;
  std::optional<double> OptionalDouble(const std::string& key) const;

 private:
  enum class Kind { kString, kNumber, kBool, kNull, kObject, kArray };
  struct Value {
    Kind kind;
    std::string text;  // decoded for strings, raw otherwise
  };

  std::map<std::string, Value> members_;
};

// Parses a raw JSON array into element texts.
bool ParseJsonArray(const std::string& raw, std::vector<std::string>* out);

}  // namespace narrovault::util

#endif  // NARROVAULT_UTIL_JSON_LINE_HPP_
