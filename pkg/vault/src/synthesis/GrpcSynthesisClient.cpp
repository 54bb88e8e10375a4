// Repository: NarroVault
// Component: gRPC synthesis client
// Purpose: ISynthesisClient over narrovault.synthesis.v1.SpeechSynthesis.
// Copyright (c) 2026 NarroVault

#include "narrovault/synthesis/GrpcSynthesisClient.hpp"

#include <sstream>

#include "narrovault/util/Logger.hpp"

namespace narrovault::synthesis {

namespace proto = narrovault::synthesis::v1;
using narrovault::util::Logger;

GrpcSynthesisClient::GrpcSynthesisClient(const std::string& target_address)
    : target_address_(target_address),
      grpc_channel_(grpc::CreateChannel(target_address, grpc::InsecureChannelCredentials())),
      stub_(proto::SpeechSynthesis::NewStub(grpc_channel_)) {
  Logger::Info("[GrpcSynthesisClient] CHANNEL_CREATED target=" + target_address_);
}

SynthesisStatus GrpcSynthesisClient::MapStatus(grpc::StatusCode code) {
  switch (code) {
    case grpc::StatusCode::OK:
      return SynthesisStatus::kOk;
    case grpc::StatusCode::RESOURCE_EXHAUSTED:
      return SynthesisStatus::kThrottled;
    case grpc::StatusCode::DEADLINE_EXCEEDED:
      return SynthesisStatus::kTimeout;
    case grpc::StatusCode::UNAVAILABLE:
    case grpc::StatusCode::ABORTED:
    case grpc::StatusCode::INTERNAL:
    case grpc::StatusCode::UNKNOWN:
    case grpc::StatusCode::CANCELLED:
      return SynthesisStatus::kTransient;
    default:
      return SynthesisStatus::kRejected;
  }
}

proto::SynthesizeRequest GrpcSynthesisClient::ToProto(const SynthesisRequest& request) {
  proto::SynthesizeRequest p;
  p.set_call_id(request.call_id);
  p.set_attempt(static_cast<uint32_t>(request.attempt));
  p.set_text(request.text);
  p.set_format(request.voice.format);
  p.set_sample_rate(request.voice.sample_rate);
  auto* voice = p.mutable_voice();
  voice->set_voice_id(request.voice.voice_id);
  voice->set_model_version(request.voice.model_version);
  voice->set_emotion(request.emotion);
  voice->set_temperature(static_cast<float>(request.voice.temperature));
  voice->set_speed(static_cast<float>(request.voice.speed));
  return p;
}

SynthesisResponse GrpcSynthesisClient::Synthesize(const SynthesisRequest& request,
                                                  std::chrono::milliseconds timeout) {
  grpc::ClientContext context;
  context.set_deadline(std::chrono::system_clock::now() + timeout);

  proto::SynthesizeResponse reply;
  grpc::Status status = stub_->Synthesize(&context, ToProto(request), &reply);

  SynthesisResponse response;
  response.status = MapStatus(status.error_code());
  if (!status.ok()) {
    std::ostringstream oss;
    oss << "grpc_code=" << static_cast<int>(status.error_code())
        << " message=" << status.error_message();
    response.detail = oss.str();
    return response;
  }
  if (reply.audio().empty()) {
    response.status = SynthesisStatus::kTransient;
    response.detail = "empty audio payload";
    return response;
  }
  response.audio.assign(reply.audio().begin(), reply.audio().end());
  response.format = reply.format();
  response.billed_characters = reply.billed_characters();
  return response;
}

}  // namespace narrovault::synthesis
