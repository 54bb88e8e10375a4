// Repository: NarroVault
// Component: JSON line tests
// Purpose: String escapes on read, including supplementary-plane characters
//          written as surrogate pairs.
// Copyright (c) 2026 NarroVault

#include <gtest/gtest.h>

#include <string>

#include "narrovault/util/JsonLine.hpp"

namespace narrovault::util {
namespace {

std::string ReadText(const std::string& json) {
  JsonObjectReader r;
  EXPECT_TRUE(JsonObjectReader::Parse(json, &r)) << json;
  std::string out;
  EXPECT_TRUE(r.GetString("text", &out)) << json;
  return out;
}

TEST(JsonLineTest, SurrogatePairDecodesToOneFourByteSequence) {
  // U+1F600
  EXPECT_EQ(ReadText(R"({"text":"\uD83D\uDE00"})"), "\xF0\x9F\x98\x80");
  EXPECT_EQ(ReadText(R"({"text":"a\ud83d\ude00b"})"), "a\xF0\x9F\x98\x80" "b");
}

TEST(JsonLineTest, BasicPlaneEscapesStayShort) {
  EXPECT_EQ(ReadText(R"({"text":"\u00E9"})"), "\xC3\xA9");
  EXPECT_EQ(ReadText(R"({"text":"\u2014"})"), "\xE2\x80\x94");
  EXPECT_EQ(ReadText(R"({"text":"tab\there"})"), "tab\there");
}

TEST(JsonLineTest, UnpairedSurrogateBecomesReplacementCharacter) {
  EXPECT_EQ(ReadText(R"({"text":"\uD83Dx"})"), "\xEF\xBF\xBDx");
  EXPECT_EQ(ReadText(R"({"text":"\uDE00"})"), "\xEF\xBF\xBD");
  // High surrogate followed by a non-surrogate escape keeps the second one.
  EXPECT_EQ(ReadText(R"({"text":"\uD83D\u0041"})"), "\xEF\xBF\xBD" "A");
}

TEST(JsonLineTest, RawUtf8SurvivesAWriteReadCycle) {
  const std::string emoji_line = "Breathe \xF0\x9F\x8C\x99 slowly";
  JsonObjectWriter w;
  w.Add("text", emoji_line);
  EXPECT_EQ(ReadText(w.str()), emoji_line);
}

TEST(JsonLineTest, TruncatedEscapeIsRejected) {
  JsonObjectReader r;
  EXPECT_FALSE(JsonObjectReader::Parse(R"({"text":"\uD83)", &r));
}

}  // namespace
}  // namespace narrovault::util
