// Repository: NarroVault
// Component: gRPC synthesis client
// Purpose: ISynthesisClient over narrovault.synthesis.v1.SpeechSynthesis.
// Copyright (c) 2026 NarroVault

#ifndef NARROVAULT_SYNTHESIS_GRPC_SYNTHESIS_CLIENT_HPP_
#define NARROVAULT_SYNTHESIS_GRPC_SYNTHESIS_CLIENT_HPP_

#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>
#include "narrovault/synthesis/v1/synthesis.grpc.pb.h"

#include "narrovault/synthesis/ISynthesisClient.hpp"

namespace narrovault::synthesis {

// One channel shared by every worker; gRPC stubs are thread-safe.
class GrpcSynthesisClient : public ISynthesisClient {
 public:
  explicit GrpcSynthesisClient(const std::string& target_address);

  GrpcSynthesisClient(const GrpcSynthesisClient&) = delete;
  GrpcSynthesisClient& operator=(const GrpcSynthesisClient&) = delete;

  SynthesisResponse Synthesize(const SynthesisRequest& request,
                               std::chrono::milliseconds timeout) override;

  // RESOURCE_EXHAUSTED → kThrottled; DEADLINE_EXCEEDED → kTimeout;
  // UNAVAILABLE/ABORTED/INTERNAL/UNKNOWN/CANCELLED → kTransient;
  // everything else → kRejected.
  static SynthesisStatus MapStatus(grpc::StatusCode code);

  static v1::SynthesizeRequest ToProto(const SynthesisRequest& request);

 private:
  std::string target_address_;
  std::shared_ptr<grpc::Channel> grpc_channel_;
  std::unique_ptr<v1::SpeechSynthesis::Stub> stub_;
};

}  // namespace narrovault::synthesis

#endif  // NARROVAULT_SYNTHESIS_GRPC_SYNTHESIS_CLIENT_HPP_
