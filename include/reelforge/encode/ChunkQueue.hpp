// Repository: Reelforge
// Component: Chunk Queue
// Purpose: Ordered, mutex-protected per-track queue of encoded chunks.
// Copyright (c) 2025 Reelforge

#ifndef REELFORGE_ENCODE_CHUNK_QUEUE_HPP_
#define REELFORGE_ENCODE_CHUNK_QUEUE_HPP_

#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

#include "reelforge/encode/EncodedChunk.hpp"

namespace reelforge::encode {

// Single producer (the encoder worker), single consumer (the orchestrator).
// Pop order equals push order.
class ChunkQueue {
 public:
  ChunkQueue() = default;
  ChunkQueue(const ChunkQueue&) = delete;
  ChunkQueue& operator=(const ChunkQueue&) = delete;

  void Push(EncodedChunk chunk) {
    std::lock_guard<std::mutex> lock(mutex_);
    chunks_.push_back(std::move(chunk));
  }

  // Removes and returns everything queued, in arrival order.
  std::vector<EncodedChunk> DrainAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<EncodedChunk> out;
    out.reserve(chunks_.size());
    while (!chunks_.empty()) {
      out.push_back(std::move(chunks_.front()));
      chunks_.pop_front();
    }
    return out;
  }

  size_t Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_.size();
  }

  void Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    chunks_.clear();
  }

 private:
  mutable std::mutex mutex_;
  std::deque<EncodedChunk> chunks_;
};

}  // namespace reelforge::encode

#endif  // REELFORGE_ENCODE_CHUNK_QUEUE_HPP_
