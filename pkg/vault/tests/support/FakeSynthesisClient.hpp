// Repository: NarroVault
// Component: Fake synthesis client (test only)
// Purpose: Scripted synthesis responses with concurrency instrumentation.
//          Successful calls return a WAV of a steady voiced tone whose length
//          follows the text length.
// Copyright (c) 2026 NarroVault

#ifndef NARROVAULT_TESTS_SUPPORT_FAKE_SYNTHESIS_CLIENT_HPP_
#define NARROVAULT_TESTS_SUPPORT_FAKE_SYNTHESIS_CLIENT_HPP_

#include <chrono>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "SignalFactory.hpp"
#include "narrovault/inventory/InventoryTypes.hpp"
#include "narrovault/synthesis/ISynthesisClient.hpp"

namespace narrovault::test_infra {

class FakeSynthesisClient : public synthesis::ISynthesisClient {
 public:
  using ResponderFn =
      std::function<synthesis::SynthesisResponse(const synthesis::SynthesisRequest&)>;

  // chars / 15 + 0.5 seconds of tone.
  static synthesis::SynthesisResponse ToneResponse(const synthesis::SynthesisRequest& request,
                                                   double f0_hz = 220.0) {
    const double seconds = inventory::CountCharacters(request.text) / 15.0 + 0.5;
    synthesis::SynthesisResponse response;
    response.status = synthesis::SynthesisStatus::kOk;
    response.audio = WavBytes(VoicedTone(seconds, f0_hz));
    response.format = "wav";
    return response;
  }

  static synthesis::SynthesisResponse Failure(synthesis::SynthesisStatus status,
                                              const std::string& detail = "") {
    synthesis::SynthesisResponse response;
    response.status = status;
    response.detail = detail.empty() ? synthesis::SynthesisStatusToString(status) : detail;
    return response;
  }

  // Consumed one per call, in call order; once exhausted every call succeeds.
  void ScriptStatuses(std::vector<synthesis::SynthesisStatus> statuses) {
    std::lock_guard<std::mutex> lock(mutex_);
    scripted_.assign(statuses.begin(), statuses.end());
  }

  // Replaces the default tone response for calls not covered by the script.
  void SetResponder(ResponderFn fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    responder_ = std::move(fn);
  }

  // Time each call spends "in flight" (real sleep).
  void SetCallLatency(std::chrono::milliseconds latency) {
    std::lock_guard<std::mutex> lock(mutex_);
    latency_ = latency;
  }

  synthesis::SynthesisResponse Synthesize(const synthesis::SynthesisRequest& request,
                                          std::chrono::milliseconds /*timeout*/) override {
    std::chrono::milliseconds latency{0};
    bool scripted = false;
    synthesis::SynthesisStatus status = synthesis::SynthesisStatus::kOk;
    ResponderFn responder;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++in_flight_;
      if (in_flight_ > peak_) peak_ = in_flight_;
      calls_.push_back(request);
      latency = latency_;
      if (!scripted_.empty()) {
        scripted = true;
        status = scripted_.front();
        scripted_.pop_front();
      }
      responder = responder_;
    }

    if (latency.count() > 0) std::this_thread::sleep_for(latency);

    synthesis::SynthesisResponse response;
    if (scripted && status != synthesis::SynthesisStatus::kOk) {
      response = Failure(status);
    } else if (responder) {
      response = responder(request);
    } else {
      response = ToneResponse(request);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    --in_flight_;
    return response;
  }

  int Peak() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_;
  }

  size_t CallCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_.size();
  }

  std::vector<synthesis::SynthesisRequest> Calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
  }

 private:
  mutable std::mutex mutex_;
  std::deque<synthesis::SynthesisStatus> scripted_;
  ResponderFn responder_;
  std::chrono::milliseconds latency_{0};
  int in_flight_ = 0;
  int peak_ = 0;
  std::vector<synthesis::SynthesisRequest> calls_;
};

}  // namespace narrovault::test_infra

#endif  // NARROVAULT_TESTS_SUPPORT_FAKE_SYNTHESIS_CLIENT_HPP_
