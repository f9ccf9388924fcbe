// Repository: Reelforge
// Component: Fake Muxer (test only)
// Purpose: Records what the pipeline hands to the container writer.
// Copyright (c) 2025 Reelforge

#ifndef REELFORGE_TESTS_SUPPORT_FAKE_MUXER_HPP_
#define REELFORGE_TESTS_SUPPORT_FAKE_MUXER_HPP_

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

#include "reelforge/mux/IMuxer.hpp"
#include "reelforge/mux/Mp4Muxer.hpp"

namespace reelforge::tests {

// Applies the same track-order checks as Mp4Muxer, then produces a small
// placeholder buffer instead of a real container.
class FakeMuxer : public mux::IMuxer {
 public:
  std::atomic<bool> fail{false};

  bool Mux(const std::vector<encode::EncodedChunk>& video,
           const std::vector<encode::EncodedChunk>& audio,
           const mux::MuxConfig& config,
           mux::MuxedOutput& output,
           std::string* error) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++calls_;
    last_video_ = video;
    last_audio_ = audio;
    last_config_ = config;
    if (fail) {
      if (error) *error = "fake muxer failure";
      return false;
    }
    if (video.empty()) {
      if (error) *error = "no video chunks to mux";
      return false;
    }
    if (!mux::ValidateTrackOrder(video, "video", error) ||
        !mux::ValidateTrackOrder(audio, "audio", error)) {
      return false;
    }
    output.buffer = {'f', 't', 'y', 'p', 'i', 's', 'o', 'm'};
    output.size = output.buffer.size();
    output.duration_seconds = config.duration_seconds;
    output.video_tracks = 1;
    output.audio_tracks = 1;
    output.video_samples = static_cast<int64_t>(video.size());
    output.audio_samples = static_cast<int64_t>(audio.size());
    return true;
  }

  int calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
  }
  std::vector<encode::EncodedChunk> last_video() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_video_;
  }
  std::vector<encode::EncodedChunk> last_audio() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_audio_;
  }
  mux::MuxConfig last_config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_config_;
  }

 private:
  mutable std::mutex mutex_;
  int calls_ = 0;
  std::vector<encode::EncodedChunk> last_video_;
  std::vector<encode::EncodedChunk> last_audio_;
  mux::MuxConfig last_config_;
};

}  // namespace reelforge::tests

#endif  // REELFORGE_TESTS_SUPPORT_FAKE_MUXER_HPP_
