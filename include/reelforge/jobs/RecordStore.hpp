// Repository: Reelforge
// Component: Record Store
// Purpose: Small keyed storage seam behind the job tracker.
// Copyright (c) 2025 Reelforge

#ifndef REELFORGE_JOBS_RECORD_STORE_HPP_
#define REELFORGE_JOBS_RECORD_STORE_HPP_

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace reelforge::jobs {

// Not synchronized; the owner serializes access.
template <typename T>
class RecordStore {
 public:
  virtual ~RecordStore() = default;

  virtual std::optional<T> Get(const std::string& id) const = 0;
  virtual void Put(const std::string& id, T record) = 0;
  virtual bool Erase(const std::string& id) = 0;
  virtual void ForEach(const std::function<void(const T&)>& fn) const = 0;
  // Returns the number of records removed.
  virtual size_t EraseIf(const std::function<bool(const T&)>& predicate) = 0;
  virtual size_t Size() const = 0;
};

template <typename T>
class InMemoryRecordStore : public RecordStore<T> {
 public:
  std::optional<T> Get(const std::string& id) const override {
    auto it = records_.find(id);
    if (it == records_.end()) return std::nullopt;
    return it->second;
  }

  void Put(const std::string& id, T record) override {
    records_[id] = std::move(record);
  }

  bool Erase(const std::string& id) override {
    return records_.erase(id) > 0;
  }

  void ForEach(const std::function<void(const T&)>& fn) const override {
    for (const auto& [id, record] : records_) {
      (void)id;
      fn(record);
    }
  }

  size_t EraseIf(const std::function<bool(const T&)>& predicate) override {
    size_t removed = 0;
    for (auto it = records_.begin(); it != records_.end();) {
      if (predicate(it->second)) {
        it = records_.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }
    return removed;
  }

  size_t Size() const override { return records_.size(); }

 private:
  std::map<std::string, T> records_;
};

}  // namespace reelforge::jobs

#endif  // REELFORGE_JOBS_RECORD_STORE_HPP_
