// Repository: NarroVault
// Component: Inventory contract tests
// Purpose: Chunk derivation, structural validation and length policy.
// Copyright (c) 2026 NarroVault

#include <gtest/gtest.h>

#include <fstream>

#include "TempVault.hpp"
#include "narrovault/inventory/InventoryTypes.hpp"
#include "narrovault/inventory/InventoryValidator.hpp"
#include "narrovault/util/VaultError.hpp"

namespace narrovault::inventory {
namespace {

Chunk MakeChunk(const std::string& script, int index, const std::string& text) {
  Chunk c;
  c.script_id = script;
  c.chunk_index = index;
  c.text = text;
  return c;
}

TEST(InventoryContract, FromBlocksDerivesIndicesFlagsAndCounts) {
  auto inv = ScriptInventory::FromBlocks(
      "s1", "sleep", "calm",
      {{"Hello there, friend.", 0.0, false},
       {"Breathe in slowly and hold it for a moment.", 2.5, true},
       {"Rest now.", 0.0, false}});

  ASSERT_EQ(inv.size(), 3);
  EXPECT_EQ(inv.script_id(), "s1");
  EXPECT_EQ(inv.category(), "sleep");
  EXPECT_EQ(inv.emotion(), "calm");
  for (int i = 0; i < 3; ++i) EXPECT_EQ(inv.chunks()[i].chunk_index, i);

  EXPECT_TRUE(inv.at(0).is_opening);
  EXPECT_FALSE(inv.at(0).is_closing);
  EXPECT_FALSE(inv.at(1).is_opening);
  EXPECT_FALSE(inv.at(1).is_closing);
  EXPECT_TRUE(inv.at(2).is_closing);

  EXPECT_EQ(inv.at(0).char_count, 20);
  EXPECT_DOUBLE_EQ(inv.at(1).pause_after_s, 2.5);
  EXPECT_TRUE(inv.at(1).explicit_pause);
  EXPECT_EQ(inv.TotalCharacters(), 20 + 43 + 9);
  EXPECT_THROW(inv.at(3), std::out_of_range);
}

TEST(InventoryContract, SingleChunkScriptIsBothOpeningAndClosing) {
  auto inv = ScriptInventory::FromBlocks("s1", "", "", {{"Only line here.", 0.0, false}});
  EXPECT_TRUE(inv.at(0).is_opening);
  EXPECT_TRUE(inv.at(0).is_closing);
  EXPECT_TRUE(InventoryValidator().Validate(inv).valid);
}

TEST(InventoryContract, CharCountIsCodePoints) {
  EXPECT_EQ(CountCharacters(""), 0);
  EXPECT_EQ(CountCharacters("abc"), 3);
  EXPECT_EQ(CountCharacters("caf\xC3\xA9"), 4);          // café
  EXPECT_EQ(CountCharacters("\xE2\x80\x94"), 1);          // em dash
  EXPECT_EQ(CountCharacters("\xF0\x9F\x8C\x99 moon"), 6);  // crescent moon + " moon"
}

TEST(InventoryContract, ValidatorRejectsEmptyScript) {
  auto inv = ScriptInventory::FromChunks("s1", {});
  auto r = InventoryValidator().Validate(inv);
  EXPECT_FALSE(r.valid);
  EXPECT_EQ(r.error, InventoryError::kEmptyScript);
}

TEST(InventoryContract, ValidatorRejectsIndexGap) {
  auto inv = ScriptInventory::FromChunks(
      "s1", {MakeChunk("s1", 0, "First chunk of text."), MakeChunk("s1", 2, "Third chunk here.")});
  auto r = InventoryValidator().Validate(inv);
  EXPECT_FALSE(r.valid);
  EXPECT_EQ(r.error, InventoryError::kIndexGap);
  EXPECT_EQ(r.chunk_index, 1);
}

TEST(InventoryContract, ValidatorRejectsDuplicateIndex) {
  auto inv = ScriptInventory::FromChunks(
      "s1", {MakeChunk("s1", 0, "First chunk of text."), MakeChunk("s1", 0, "Again chunk zero.")});
  auto r = InventoryValidator().Validate(inv);
  EXPECT_FALSE(r.valid);
  EXPECT_EQ(r.error, InventoryError::kDuplicateIndex);
}

TEST(InventoryContract, ValidatorRejectsMixedScriptAndEmptyText) {
  auto mixed = ScriptInventory::FromChunks(
      "s1", {MakeChunk("s1", 0, "First chunk of text."), MakeChunk("s2", 1, "Wrong script here.")});
  EXPECT_EQ(InventoryValidator().Validate(mixed).error, InventoryError::kMixedScriptId);

  auto empty = ScriptInventory::FromChunks("s1", {MakeChunk("s1", 0, "")});
  EXPECT_EQ(InventoryValidator().Validate(empty).error, InventoryError::kEmptyText);
}

TEST(InventoryContract, ValidatorRejectsNegativePause) {
  auto inv = ScriptInventory::FromBlocks("s1", "", "", {{"Hello there, friend.", -1.0, false}});
  auto r = InventoryValidator().Validate(inv);
  EXPECT_FALSE(r.valid);
  EXPECT_EQ(r.error, InventoryError::kNegativePause);
}

TEST(InventoryContract, LengthPolicyReportsEveryViolation) {
  const std::string long_opening(60, 'a');
  const std::string too_long(301, 'b');
  auto inv = ScriptInventory::FromBlocks("s1", "", "",
                                         {{long_opening, 0.0, false},
                                          {"Too short.", 0.0, false},
                                          {too_long, 0.0, false},
                                          {"This one is comfortably long enough.", 0.0, false}});
  InventoryValidator validator;
  EXPECT_TRUE(validator.Validate(inv).valid);

  auto issues = validator.CheckVaultReady(inv);
  ASSERT_EQ(issues.size(), 3u);
  EXPECT_EQ(issues[0].error, InventoryError::kOpeningTooLong);
  EXPECT_EQ(issues[0].chunk_index, 0);
  EXPECT_EQ(issues[1].error, InventoryError::kChunkTooShort);
  EXPECT_EQ(issues[1].chunk_index, 1);
  EXPECT_EQ(issues[2].error, InventoryError::kChunkTooLong);
  EXPECT_EQ(issues[2].chunk_index, 2);
  EXPECT_FALSE(validator.IsVaultReady(inv));
}

TEST(InventoryContract, ShortOpeningIsExemptFromMinimum) {
  auto inv = ScriptInventory::FromBlocks(
      "s1", "", "", {{"Hi.", 0.0, false}, {"A second chunk of acceptable length.", 0.0, false}});
  EXPECT_TRUE(InventoryValidator().IsVaultReady(inv));
}

TEST(InventoryContract, BoundaryLengthsAreAccepted) {
  auto inv = ScriptInventory::FromBlocks("s1", "", "",
                                         {{std::string(59, 'a'), 0.0, false},
                                          {std::string(20, 'b'), 0.0, false},
                                          {std::string(300, 'c'), 0.0, false}});
  EXPECT_TRUE(InventoryValidator().IsVaultReady(inv));
}

TEST(InventoryContract, LoadInventoryFileReadsJsonLines) {
  test_infra::TempDir dir("inventory");
  const std::string path = dir.Sub("script.jsonl");
  {
    std::ofstream out(path);
    out << "# evening script\n"
        << R"({"script_id":"eve","chunk_index":1,"text":"Second line of the script.","pause_after":1.5})"
        << "\n"
        << R"({"script_id":"eve","chunk_index":0,"text":"Good evening.","category":"sleep","emotion":"calm"})"
        << "\n";
  }
  auto inv = LoadInventoryFile(path);
  ASSERT_EQ(inv.size(), 2);
  EXPECT_EQ(inv.script_id(), "eve");
  EXPECT_EQ(inv.at(0).text, "Good evening.");
  EXPECT_TRUE(inv.at(0).is_opening);
  EXPECT_TRUE(inv.at(1).is_closing);
  EXPECT_DOUBLE_EQ(inv.at(1).pause_after_s, 1.5);
  EXPECT_EQ(inv.at(1).char_count, 26);
}

TEST(InventoryContract, LoadInventoryFileRejectsMalformedLine) {
  test_infra::TempDir dir("inventory");
  const std::string path = dir.Sub("bad.jsonl");
  {
    std::ofstream out(path);
    out << R"({"script_id":"eve","chunk_index":0,"text":"Good evening."})" << "\n"
        << R"({"script_id":"eve","chunk_index":1,"text":)" << "\n";
  }
  EXPECT_THROW(LoadInventoryFile(path), InventoryInvalid);
  EXPECT_THROW(LoadInventoryFile(dir.Sub("missing.jsonl")), InventoryInvalid);
}

}  // namespace
}  // namespace narrovault::inventory
