// Repository: NarroVault
// Component: JSON line helpers
// Purpose: Minimal writer/reader for the single-line JSON objects stored in
//          vault logs, manifests and inventory files.
// Copyright (c) 2026 NarroVault

#include "narrovault/util/JsonLine.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace narrovault::util {

std::string JsonEscape(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 8);
  for (char c : s) {
    if (c == '"') out += "\\\"";
    else if (c == '\\') out += "\\\\";
    else if (c == '\n') out += "\\n";
    else if (c == '\r') out += "\\r";
    else if (c == '\t') out += "\\t";
    else if (static_cast<unsigned char>(c) < 0x20) {
      char buf[8];
      std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
      out += buf;
    } else {
      out += c;
    }
  }
  return out;
}

std::string FormatJsonDouble(double v) {
  if (!std::isfinite(v)) return "null";
  char buf[40];
  for (int precision = 15; precision <= 17; ++precision) {
    std::snprintf(buf, sizeof(buf), "%.*g", precision, v);
    if (std::strtod(buf, nullptr) == v) break;
  }
  std::string out(buf);
  // Keep the value recognisably floating point.
  if (out.find_first_of(".eEn") == std::string::npos) out += ".0";
  return out;
}

// -----------------------------------------------------------------------------
// JsonObjectWriter
// -----------------------------------------------------------------------------

void JsonObjectWriter::Key(const std::string& key) {
  if (!body_.empty()) body_ += ",";
  body_ += "\"" + JsonEscape(key) + "\":";
}

JsonObjectWriter& JsonObjectWriter::Add(const std::string& key, const std::string& value) {
  Key(key);
  body_ += "\"" + JsonEscape(value) + "\"";
  return *this;
}

JsonObjectWriter& JsonObjectWriter::Add(const std::string& key, const char* value) {
  return Add(key, std::string(value ? value : ""));
}

JsonObjectWriter& JsonObjectWriter::AddInt(const std::string& key, int64_t value) {
  Key(key);
  body_ += std::to_string(value);
  return *this;
}

JsonObjectWriter& JsonObjectWriter::AddUint(const std::string& key, uint64_t value) {
  Key(key);
  body_ += std::to_string(value);
  return *this;
}

JsonObjectWriter& JsonObjectWriter::AddDouble(const std::string& key, double value) {
  Key(key);
  body_ += FormatJsonDouble(value);
  return *this;
}

JsonObjectWriter& JsonObjectWriter::AddOptionalDouble(const std::string& key,
                                                      const std::optional<double>& value) {
  if (!value.has_value()) return AddNull(key);
  return AddDouble(key, *value);
}

JsonObjectWriter& JsonObjectWriter::AddBool(const std::string& key, bool value) {
  Key(key);
  body_ += value ? "true" : "false";
  return *this;
}

JsonObjectWriter& JsonObjectWriter::AddNull(const std::string& key) {
  Key(key);
  body_ += "null";
  return *this;
}

JsonObjectWriter& JsonObjectWriter::AddRaw(const std::string& key, const std::string& value) {
  Key(key);
  body_ += value.empty() ? "null" : value;
  return *this;
}

std::string JsonObjectWriter::str() const { return "{" + body_ + "}"; }

std::string JsonArray(const std::vector<std::string>& raw_items) {
  std::string out = "[";
  for (size_t i = 0; i < raw_items.size(); ++i) {
    if (i > 0) out += ",";
    out += raw_items[i];
  }
  out += "]";
  return out;
}

// -----------------------------------------------------------------------------
// Scanner
// -----------------------------------------------------------------------------

namespace {

void SkipWs(const std::string& s, size_t* i) {
  while (*i < s.size() && std::isspace(static_cast<unsigned char>(s[*i]))) ++*i;
}

void AppendUtf8(uint32_t cp, std::string* out) {
  if (cp < 0x80) {
    *out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    *out += static_cast<char>(0xC0 | (cp >> 6));
    *out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    *out += static_cast<char>(0xE0 | (cp >> 12));
    *out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    *out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    *out += static_cast<char>(0xF0 | (cp >> 18));
    *out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    *out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    *out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

bool ReadHex4(const std::string& s, size_t at, uint32_t* cp) {
  if (at + 4 > s.size()) return false;
  uint32_t v = 0;
  for (size_t k = 0; k < 4; ++k) {
    char h = s[at + k];
    v <<= 4;
    if (h >= '0' && h <= '9') v |= static_cast<uint32_t>(h - '0');
    else if (h >= 'a' && h <= 'f') v |= static_cast<uint32_t>(h - 'a' + 10);
    else if (h >= 'A' && h <= 'F') v |= static_cast<uint32_t>(h - 'A' + 10);
    else return false;
  }
  *cp = v;
  return true;
}

constexpr uint32_t kReplacementChar = 0xFFFD;

bool IsHighSurrogate(uint32_t cp) { return cp >= 0xD800 && cp <= 0xDBFF; }
bool IsLowSurrogate(uint32_t cp) { return cp >= 0xDC00 && cp <= 0xDFFF; }

// s[*i] must be the opening quote. On success *i is one past the closing quote.
bool ScanString(const std::string& s, size_t* i, std::string* out) {
  if (*i >= s.size() || s[*i] != '"') return false;
  ++*i;
  out->clear();
  while (*i < s.size()) {
    char c = s[*i];
    if (c == '"') {
      ++*i;
      return true;
    }
    if (c == '\\') {
      if (*i + 1 >= s.size()) return false;
      char e = s[*i + 1];
      *i += 2;
      switch (e) {
        case '"': *out += '"'; break;
        case '\\': *out += '\\'; break;
        case '/': *out += '/'; break;
        case 'b': *out += '\b'; break;
        case 'f': *out += '\f'; break;
        case 'n': *out += '\n'; break;
        case 'r': *out += '\r'; break;
        case 't': *out += '\t'; break;
        case 'u': {
          uint32_t cp = 0;
          if (!ReadHex4(s, *i, &cp)) return false;
          *i += 4;
          // A pair of \u escapes encodes one supplementary-plane code point.
          // Unpaired surrogates decode to U+FFFD.
          if (IsHighSurrogate(cp)) {
            uint32_t low = 0;
            if (*i + 6 <= s.size() && s[*i] == '\\' && s[*i + 1] == 'u' &&
                ReadHex4(s, *i + 2, &low) && IsLowSurrogate(low)) {
              *i += 6;
              cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
            } else {
              cp = kReplacementChar;
            }
          } else if (IsLowSurrogate(cp)) {
            cp = kReplacementChar;
          }
          AppendUtf8(cp, out);
          break;
        }
        default:
          return false;
      }
      continue;
    }
    *out += c;
    ++*i;
  }
  return false;
}

// Skips a nested object or array, honouring strings. s[*i] is the opener.
bool ScanNested(const std::string& s, size_t* i) {
  int depth = 0;
  while (*i < s.size()) {
    char c = s[*i];
    if (c == '"') {
      std::string ignored;
      if (!ScanString(s, i, &ignored)) return false;
      continue;
    }
    if (c == '{' || c == '[') ++depth;
    else if (c == '}' || c == ']') --depth;
    ++*i;
    if (depth == 0) return true;
  }
  return false;
}

bool ScanNumber(const std::string& s, size_t* i) {
  size_t start = *i;
  if (*i < s.size() && (s[*i] == '-' || s[*i] == '+')) ++*i;
  while (*i < s.size() &&
         (std::isdigit(static_cast<unsigned char>(s[*i])) || s[*i] == '.' ||
          s[*i] == 'e' || s[*i] == 'E' || s[*i] == '-' || s[*i] == '+')) {
    ++*i;
  }
  return *i > start;
}

}  // namespace

bool ParseJsonArray(const std::string& raw, std::vector<std::string>* out) {
  out->clear();
  size_t i = 0;
  SkipWs(raw, &i);
  if (i >= raw.size() || raw[i] != '[') return false;
  ++i;
  SkipWs(raw, &i);
  if (i < raw.size() && raw[i] == ']') return true;
  while (i < raw.size()) {
    SkipWs(raw, &i);
    size_t start = i;
    if (i >= raw.size()) return false;
    char c = raw[i];
    if (c == '"') {
      std::string ignored;
      if (!ScanString(raw, &i, &ignored)) return false;
    } else if (c == '{' || c == '[') {
      if (!ScanNested(raw, &i)) return false;
    } else {
      while (i < raw.size() && raw[i] != ',' && raw[i] != ']' &&
             !std::isspace(static_cast<unsigned char>(raw[i]))) {
        ++i;
      }
    }
    out->push_back(raw.substr(start, i - start));
    SkipWs(raw, &i);
    if (i < raw.size() && raw[i] == ',') {
      ++i;
      continue;
    }
    if (i < raw.size() && raw[i] == ']') return true;
    return false;
  }
  return false;
}

// -----------------------------------------------------------------------------
// JsonObjectReader
// -----------------------------------------------------------------------------

bool JsonObjectReader::Parse(const std::string& text, JsonObjectReader* out) {
  out->members_.clear();
  size_t i = 0;
  SkipWs(text, &i);
  if (i >= text.size() || text[i] != '{') return false;
  ++i;
  SkipWs(text, &i);
  if (i < text.size() && text[i] == '}') {
    ++i;
    SkipWs(text, &i);
    return i == text.size();
  }

  while (i < text.size()) {
    SkipWs(text, &i);
    std::string key;
    if (!ScanString(text, &i, &key)) return false;
    SkipWs(text, &i);
    if (i >= text.size() || text[i] != ':') return false;
    ++i;
    SkipWs(text, &i);
    if (i >= text.size()) return false;

    Value value;
    char c = text[i];
    if (c == '"') {
      value.kind = Kind::kString;
      if (!ScanString(text, &i, &value.text)) return false;
    } else if (c == '{' || c == '[') {
      size_t start = i;
      if (!ScanNested(text, &i)) return false;
      value.kind = (c == '{') ? Kind::kObject : Kind::kArray;
      value.text = text.substr(start, i - start);
    } else if (text.compare(i, 4, "true") == 0) {
      value.kind = Kind::kBool;
      value.text = "true";
      i += 4;
    } else if (text.compare(i, 5, "false") == 0) {
      value.kind = Kind::kBool;
      value.text = "false";
      i += 5;
    } else if (text.compare(i, 4, "null") == 0) {
      value.kind = Kind::kNull;
      i += 4;
    } else {
      size_t start = i;
      if (!ScanNumber(text, &i)) return false;
      value.kind = Kind::kNumber;
      value.text = text.substr(start, i - start);
    }
    out->members_[key] = std::move(value);

    SkipWs(text, &i);
    if (i < text.size() && text[i] == ',') {
      ++i;
      continue;
    }
    if (i < text.size() && text[i] == '}') {
      ++i;
      SkipWs(text, &i);
      return i == text.size();
    }
    return false;
  }
  return false;
}

bool JsonObjectReader::Has(const std::string& key) const {
  return members_.count(key) > 0;
}

bool JsonObjectReader::IsNull(const std::string& key) const {
  auto it = members_.find(key);
  return it != members_.end() && it->second.kind == Kind::kNull;
}

bool JsonObjectReader::GetString(const std::string& key, std::string* out) const {
  auto it = members_.find(key);
  if (it == members_.end() || it->second.kind != Kind::kString) return false;
  *out = it->second.text;
  return true;
}

bool JsonObjectReader::GetInt64(const std::string& key, int64_t* out) const {
  auto it = members_.find(key);
  if (it == members_.end() || it->second.kind != Kind::kNumber) return false;
  char* end = nullptr;
  long long v = std::strtoll(it->second.text.c_str(), &end, 10);
  if (end == it->second.text.c_str()) return false;
  *out = static_cast<int64_t>(v);
  return true;
}

bool JsonObjectReader::GetUint64(const std::string& key, uint64_t* out) const {
  auto it = members_.find(key);
  if (it == members_.end() || it->second.kind != Kind::kNumber) return false;
  if (!it->second.text.empty() && it->second.text[0] == '-') return false;
  char* end = nullptr;
  unsigned long long v = std::strtoull(it->second.text.c_str(), &end, 10);
  if (end == it->second.text.c_str()) return false;
  *out = static_cast<uint64_t>(v);
  return true;
}

bool JsonObjectReader::GetDouble(const std::string& key, double* out) const {
  auto it = members_.find(key);
  if (it == members_.end() || it->second.kind != Kind::kNumber) return false;
  char* end = nullptr;
  double v = std::strtod(it->second.text.c_str(), &end);
  if (end == it->second.text.c_str()) return false;
  *out = v;
  return true;
}

bool JsonObjectReader::GetBool(const std::string& key, bool* out) const {
  auto it = members_.find(key);
  if (it == members_.end() || it->second.kind != Kind::kBool) return false;
  *out = it->second.text == "true";
  return true;
}

bool JsonObjectReader::GetRaw(const std::string& key, std::string* out) const {
  auto it = members_.find(key);
  if (it == members_.end()) return false;
  if (it->second.kind == Kind::kString) {
    *out = "\"" + JsonEscape(it->second.text) + "\"";
  } else if (it->second.kind == Kind::kNull) {
    *out = "null";
  } else {
    *out = it->second.text;
  }
  return true;
}

bool JsonObjectReader::GetArray(const std::string& key, std::vector<std::string>* out) const {
  auto it = members_.find(key);
  if (it == members_.end() || it->second.kind != Kind::kArray) return false;
  return ParseJsonArray(it->second.text, out);
}

std::string JsonObjectReader::StringOr(const std::string& key,
                                       const std::string& fallback) const {
  std::string v;
  return GetString(key, &v) ? v : fallback;
}

int64_t JsonObjectReader::IntOr(const std::string& key, int64_t fallback) const {
  int64_t v = 0;
  return GetInt64(key, &v) ? v : fallback;
}

double JsonObjectReader::DoubleOr(const std::string& key, double fallback) const {
  double v = 0.0;
  return GetDouble(key, &v) ? v : fallback;
}

bool JsonObjectReader::BoolOr(const std::string& key, bool fallback) const {
  bool v = false;
  return GetBool(key, &v) ? v : fallback;
}

std::optional<double> JsonObjectReader::OptionalDouble(const std::string& key) const {
  double v = 0.0;
  if (GetDouble(key, &v)) return v;
  return std::nullopt;
}

}  // namespace narrovault::util
