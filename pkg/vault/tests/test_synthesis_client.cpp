// Repository: NarroVault
// Component: gRPC synthesis client tests
// Purpose: Status-code classification and request translation; no server.
// Copyright (c) 2026 NarroVault

#include <gtest/gtest.h>

#include "narrovault/synthesis/GrpcSynthesisClient.hpp"

namespace narrovault::synthesis {
namespace {

TEST(GrpcSynthesisClientTest, StatusCodesDriveTheRetryClass) {
  EXPECT_EQ(GrpcSynthesisClient::MapStatus(grpc::StatusCode::OK), SynthesisStatus::kOk);
  EXPECT_EQ(GrpcSynthesisClient::MapStatus(grpc::StatusCode::RESOURCE_EXHAUSTED),
            SynthesisStatus::kThrottled);
  EXPECT_EQ(GrpcSynthesisClient::MapStatus(grpc::StatusCode::DEADLINE_EXCEEDED),
            SynthesisStatus::kTimeout);
  for (auto code : {grpc::StatusCode::UNAVAILABLE, grpc::StatusCode::ABORTED,
                    grpc::StatusCode::INTERNAL, grpc::StatusCode::UNKNOWN,
                    grpc::StatusCode::CANCELLED}) {
    EXPECT_EQ(GrpcSynthesisClient::MapStatus(code), SynthesisStatus::kTransient);
  }
  for (auto code : {grpc::StatusCode::INVALID_ARGUMENT, grpc::StatusCode::PERMISSION_DENIED,
                    grpc::StatusCode::UNAUTHENTICATED, grpc::StatusCode::NOT_FOUND}) {
    EXPECT_EQ(GrpcSynthesisClient::MapStatus(code), SynthesisStatus::kRejected);
  }
}

TEST(GrpcSynthesisClientTest, RetryableClassesMatchThePolicy) {
  EXPECT_TRUE(IsRetryable(SynthesisStatus::kThrottled));
  EXPECT_TRUE(IsRetryable(SynthesisStatus::kTransient));
  EXPECT_TRUE(IsRetryable(SynthesisStatus::kTimeout));
  EXPECT_FALSE(IsRetryable(SynthesisStatus::kRejected));
  EXPECT_FALSE(IsRetryable(SynthesisStatus::kOk));
}

TEST(GrpcSynthesisClientTest, RequestCarriesCallIdentityAndVoice) {
  SynthesisRequest req;
  req.call_id = "run-1-c02-s1-a3";
  req.attempt = 3;
  req.text = "Let your shoulders drop.";
  req.emotion = "calm";
  req.voice.voice_id = "narrator-warm";
  req.voice.model_version = "2026-06";
  req.voice.format = "wav";
  req.voice.sample_rate = 44100;
  req.voice.speed = 0.9;

  const auto p = GrpcSynthesisClient::ToProto(req);
  EXPECT_EQ(p.call_id(), "run-1-c02-s1-a3");
  EXPECT_EQ(p.attempt(), 3u);
  EXPECT_EQ(p.text(), "Let your shoulders drop.");
  EXPECT_EQ(p.format(), "wav");
  EXPECT_EQ(p.sample_rate(), 44100);
  EXPECT_EQ(p.voice().voice_id(), "narrator-warm");
  EXPECT_EQ(p.voice().model_version(), "2026-06");
  EXPECT_EQ(p.voice().emotion(), "calm");
  EXPECT_FLOAT_EQ(p.voice().speed(), 0.9f);
}

}  // namespace
}  // namespace narrovault::synthesis
