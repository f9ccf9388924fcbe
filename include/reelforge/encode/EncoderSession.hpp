// Repository: Reelforge
// Component: Encoder Session
// Purpose: Shared state machine, bounded input queue and worker thread for the
//          video and audio encoder sessions.
// Copyright (c) 2025 Reelforge

#ifndef REELFORGE_ENCODE_ENCODER_SESSION_HPP_
#define REELFORGE_ENCODE_ENCODER_SESSION_HPP_

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "reelforge/encode/ChunkQueue.hpp"
#include "reelforge/encode/EncodedChunk.hpp"
#include "reelforge/util/Logger.hpp"

namespace reelforge::encode {

// uninitialized -> configured -> encoding -> flushing -> stopped
// Any hard encoder error jumps straight to stopped.
enum class SessionState {
  kUninitialized,
  kConfigured,
  kEncoding,
  kFlushing,
  kStopped,
};

inline const char* SessionStateName(SessionState state) {
  switch (state) {
    case SessionState::kUninitialized: return "uninitialized";
    case SessionState::kConfigured:    return "configured";
    case SessionState::kEncoding:      return "encoding";
    case SessionState::kFlushing:      return "flushing";
    case SessionState::kStopped:       return "stopped";
  }
  return "unknown";
}

inline constexpr size_t kDefaultSessionQueueDepth = 8;

// EncoderSession<InputT> runs a derived class's synchronous encoder on a
// dedicated worker thread.
//
// Producer side: Submit() blocks while max_queue_depth inputs are pending.
// This is the pipeline's backpressure point.
//
// Worker side: inputs are encoded strictly in submission order and the
// resulting chunks are pushed to chunks() (and the chunk callback) in
// emission order.
//
// Stop() closes input, waits for every queued input plus the encoder drain,
// and returns the complete ordered chunk list. Destroy() is idempotent,
// callable from any state, and discards queued input and output.
//
// Derived classes must call Destroy() from their own destructor so the
// worker is joined before their encoder state goes away.
template <typename InputT>
class EncoderSession {
 public:
  using ChunkCallback = std::function<void(const EncodedChunk&)>;
  using ErrorCallback = std::function<void(const std::string&)>;

  virtual ~EncoderSession() = default;

  EncoderSession(const EncoderSession&) = delete;
  EncoderSession& operator=(const EncoderSession&) = delete;

  // Callbacks run on the worker thread. Set them before Start().
  void SetChunkCallback(ChunkCallback cb) { chunk_callback_ = std::move(cb); }
  void SetErrorCallback(ErrorCallback cb) { error_callback_ = std::move(cb); }

  bool Start(std::string* error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SessionState::kConfigured) {
      SetError(error, tag_ + " cannot start in state " + SessionStateName(state_));
      return false;
    }
    state_ = SessionState::kEncoding;
    worker_ = std::thread(&EncoderSession::WorkerLoop, this);
    return true;
  }

  // Returns false (chunks untouched) if the session failed or was never
  // started. A configured-but-idle session stops with no chunks.
  bool Stop(std::vector<EncodedChunk>& chunks, std::string* error) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (state_ == SessionState::kConfigured) {
        state_ = SessionState::kStopped;
        chunks.clear();
        return true;
      }
      if (state_ == SessionState::kEncoding) {
        state_ = SessionState::kFlushing;
        input_closed_ = true;
        input_cv_.notify_all();
        space_cv_.notify_all();
      } else if (state_ != SessionState::kFlushing) {
        SetError(error, failed_ ? last_error_
                                : tag_ + " cannot stop in state " + SessionStateName(state_));
        return false;
      }
    }

    JoinWorker();

    std::lock_guard<std::mutex> lock(mutex_);
    if (failed_) {
      SetError(error, last_error_);
      return false;
    }
    state_ = SessionState::kStopped;
    chunks = chunk_queue_.DrainAll();
    return true;
  }

  void Destroy() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (destroyed_) return;
      destroyed_ = true;
      abort_ = true;
      state_ = SessionState::kStopped;
      inputs_.clear();
      input_cv_.notify_all();
      space_cv_.notify_all();
    }
    JoinWorker();
    ReleaseEncoder();
    chunk_queue_.Clear();
  }

  SessionState state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
  }

  bool failed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failed_;
  }

  std::string last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
  }

  size_t pending_inputs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return inputs_.size();
  }

  ChunkQueue& chunks() { return chunk_queue_; }

 protected:
  EncoderSession(std::string tag, size_t max_queue_depth)
      : tag_(std::move(tag)),
        max_queue_depth_(max_queue_depth == 0 ? 1 : max_queue_depth) {}

  // uninitialized -> configured. Called by derived Configure() after the
  // encoder opened.
  bool MarkConfigured(std::string* error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SessionState::kUninitialized) {
      SetError(error, tag_ + " cannot configure in state " + SessionStateName(state_));
      return false;
    }
    state_ = SessionState::kConfigured;
    return true;
  }

  bool CanConfigure(std::string* error) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SessionState::kUninitialized) {
      SetError(error, tag_ + " cannot configure in state " + SessionStateName(state_));
      return false;
    }
    return true;
  }

  bool Submit(InputT input, std::string* error) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (state_ != SessionState::kEncoding) {
      SetError(error, failed_ ? last_error_
                              : tag_ + " not encoding (state " + SessionStateName(state_) + ")");
      return false;
    }
    space_cv_.wait(lock, [this] {
      return inputs_.size() < max_queue_depth_ || state_ != SessionState::kEncoding;
    });
    if (state_ != SessionState::kEncoding) {
      SetError(error, failed_ ? last_error_ : tag_ + " stopped while waiting for queue space");
      return false;
    }
    inputs_.push_back(std::move(input));
    input_cv_.notify_one();
    return true;
  }

  const std::string& tag() const { return tag_; }

  virtual bool EncodeInput(const InputT& input, std::vector<EncodedChunk>& out,
                           std::string* error) = 0;
  virtual bool DrainEncoder(std::vector<EncodedChunk>& out, std::string* error) = 0;
  virtual void ReleaseEncoder() = 0;

 private:
  static void SetError(std::string* error, const std::string& message) {
    if (error) *error = message;
  }

  void JoinWorker() {
    if (!worker_.joinable()) return;
    if (worker_.get_id() == std::this_thread::get_id()) {
      worker_.detach();
      return;
    }
    worker_.join();
  }

  void WorkerLoop() {
    while (true) {
      InputT item;
      {
        std::unique_lock<std::mutex> lock(mutex_);
        input_cv_.wait(lock, [this] { return !inputs_.empty() || input_closed_ || abort_; });
        if (abort_) return;
        if (inputs_.empty()) break;  // closed and fully drained
        item = std::move(inputs_.front());
        inputs_.pop_front();
        space_cv_.notify_one();
      }

      std::vector<EncodedChunk> out;
      std::string err;
      if (!EncodeInput(item, out, &err)) {
        Fail(err);
        return;
      }
      Emit(out);
    }

    std::vector<EncodedChunk> out;
    std::string err;
    if (!DrainEncoder(out, &err)) {
      Fail(err);
      return;
    }
    Emit(out);
  }

  void Emit(std::vector<EncodedChunk>& out) {
    for (auto& chunk : out) {
      if (chunk_callback_) {
        chunk_callback_(chunk);
      }
      chunk_queue_.Push(std::move(chunk));
    }
  }

  void Fail(const std::string& message) {
    const std::string reason = message.empty() ? tag_ + " encoder error" : message;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (abort_) return;
      failed_ = true;
      last_error_ = reason;
      state_ = SessionState::kStopped;
      inputs_.clear();
      space_cv_.notify_all();
    }
    util::Logger::Error("[" + tag_ + "] Hard encoder error, session stopped: " + reason);
    if (error_callback_) {
      error_callback_(reason);
    }
  }

  const std::string tag_;
  const size_t max_queue_depth_;

  mutable std::mutex mutex_;
  std::condition_variable input_cv_;
  std::condition_variable space_cv_;
  std::deque<InputT> inputs_;
  SessionState state_ = SessionState::kUninitialized;
  bool input_closed_ = false;
  bool abort_ = false;
  bool failed_ = false;
  bool destroyed_ = false;
  std::string last_error_;

  std::thread worker_;
  ChunkQueue chunk_queue_;
  ChunkCallback chunk_callback_;
  ErrorCallback error_callback_;
};

}  // namespace reelforge::encode

#endif  // REELFORGE_ENCODE_ENCODER_SESSION_HPP_
