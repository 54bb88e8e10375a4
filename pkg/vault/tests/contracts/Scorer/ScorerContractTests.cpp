// Repository: NarroVault
// Component: Scorer contract tests
// Purpose: Composite score gates and tonal distance properties.
// Copyright (c) 2026 NarroVault

#include <gtest/gtest.h>

#include <cmath>
#include <string>
#include <vector>

#include "SignalFactory.hpp"
#include "narrovault/scoring/Scorer.hpp"
#include "narrovault/util/Logger.hpp"

namespace narrovault::scoring {
namespace {

using test_infra::Sine;
using test_infra::VoicedTone;
using test_infra::WhiteNoise;

TEST(ScorerContract, VoicedToneScoresAbovePrefilter) {
  Scorer scorer;
  auto result = scorer.Score(VoicedTone(2.0));
  EXPECT_EQ(result.verdict, ScoreVerdict::kOk);
  EXPECT_GE(result.composite, 0.30);
  EXPECT_LE(result.composite, 1.0);
  EXPECT_LT(result.features.spectral_flatness, 0.35);
}

TEST(ScorerContract, WhiteNoiseIsFlaggedAsNoise) {
  Scorer scorer;
  auto result = scorer.Score(WhiteNoise(2.0, 0.3));
  EXPECT_EQ(result.verdict, ScoreVerdict::kNoise);
  EXPECT_LT(result.composite, 0.30);
}

TEST(ScorerContract, SilenceScoresZero) {
  Scorer scorer;
  auto result = scorer.Score(audio::PcmBuffer::Silence(1.0));
  EXPECT_EQ(result.verdict, ScoreVerdict::kSilent);
  EXPECT_DOUBLE_EQ(result.composite, 0.0);
}

TEST(ScorerContract, BufferShorterThanOneWindowIsTooShort) {
  Scorer scorer;
  audio::PcmBuffer tiny = VoicedTone(0.01);
  ASSERT_LT(tiny.size(), static_cast<size_t>(scorer.config().n_fft));
  auto result = scorer.Score(tiny);
  EXPECT_EQ(result.verdict, ScoreVerdict::kTooShort);
  EXPECT_DOUBLE_EQ(result.composite, 0.0);
}

TEST(ScorerContract, UnusableTransformIsAnAnalysisFailureReportedInTheResult) {
  ScorerConfig cfg;
  cfg.n_fft = 2;
  Scorer scorer(cfg);

  std::vector<std::string> lines;
  util::ScopedLogCapture capture(
      [&lines](util::LogLevel, const std::string& line) { lines.push_back(line); },
      util::LogLevel::kDebug);
  const auto result = scorer.Score(VoicedTone(1.0));
  std::string profile_error;
  const MfccProfile profile = scorer.Profile(VoicedTone(1.0), &profile_error);

  EXPECT_EQ(result.verdict, ScoreVerdict::kAnalysisFailed);
  EXPECT_DOUBLE_EQ(result.composite, 0.0);
  EXPECT_FALSE(result.detail.empty());
  EXPECT_TRUE(profile.empty());
  EXPECT_FALSE(profile_error.empty());
  // Scoring reports through its result only.
  EXPECT_TRUE(lines.empty());
}

TEST(ScorerContract, HeavyClippingDrivesScoreToZero) {
  Scorer scorer;
  audio::PcmBuffer clipped = Sine(2.0, 220.0, 4.0);
  for (auto& s : clipped.samples) s = s > 1.0f ? 1.0f : (s < -1.0f ? -1.0f : s);
  auto result = scorer.Score(clipped);
  EXPECT_EQ(result.verdict, ScoreVerdict::kClipped);
  EXPECT_GT(result.features.clip_fraction, 0.01);
  EXPECT_DOUBLE_EQ(result.composite, 0.0);
}

TEST(ScorerContract, ScoreIsDeterministic) {
  Scorer scorer;
  auto a = scorer.Score(VoicedTone(1.5, 180.0));
  auto b = scorer.Score(VoicedTone(1.5, 180.0));
  EXPECT_DOUBLE_EQ(a.composite, b.composite);
  EXPECT_DOUBLE_EQ(a.features.flux_variance, b.features.flux_variance);
}

TEST(ScorerContract, TonalDistanceIsZeroForIdenticalAudio) {
  Scorer scorer;
  auto tone = VoicedTone(1.0);
  EXPECT_NEAR(scorer.TonalDistance(tone, tone), 0.0, 1e-9);
}

TEST(ScorerContract, TonalDistanceIsSymmetricAndNonNegative) {
  Scorer scorer;
  auto low = VoicedTone(1.0, 150.0);
  auto high = VoicedTone(1.0, 900.0);
  const double ab = scorer.TonalDistance(low, high);
  const double ba = scorer.TonalDistance(high, low);
  EXPECT_GE(ab, 0.0);
  EXPECT_NEAR(ab, ba, 1e-12);
}

TEST(ScorerContract, TonalDistanceGrowsWithTimbreChange) {
  Scorer scorer;
  auto reference = VoicedTone(1.0, 220.0);
  auto similar = VoicedTone(1.0, 225.0);
  auto noise = WhiteNoise(1.0, 0.3);
  EXPECT_LT(scorer.TonalDistance(reference, similar), scorer.TonalDistance(reference, noise));
}

TEST(ScorerContract, EmptyProfilesCompare) {
  MfccProfile empty;
  MfccProfile one;
  one.coefficients = {1.0, 2.0, 3.0};
  EXPECT_DOUBLE_EQ(Scorer::TonalDistance(empty, empty), 0.0);
  EXPECT_DOUBLE_EQ(Scorer::TonalDistance(empty, one), 1.0);
}

}  // namespace
}  // namespace narrovault::scoring
