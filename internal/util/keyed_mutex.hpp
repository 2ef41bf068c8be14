#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace chunkscribe::util {

/*
  One mutex per key.

  Entries are created on first Lock() and erased when the last holder
  or waiter lets go, so the map only ever holds keys in active use.
*/
class KeyedMutex {
 public:
  class Guard {
   public:
    Guard(KeyedMutex* owner, std::string key, std::shared_ptr<std::mutex> mutex)
        : owner_(owner), key_(std::move(key)), mutex_(std::move(mutex)) {
      mutex_->lock();
    }

    ~Guard() {
      mutex_->unlock();
      mutex_.reset();
      owner_->Release(key_);
    }

    Guard(const Guard&)            = delete;
    Guard& operator=(const Guard&) = delete;

   private:
    KeyedMutex*                 owner_;
    std::string                 key_;
    std::shared_ptr<std::mutex> mutex_;
  };

  Guard Lock(const std::string& key) {
    return Guard(this, key, Acquire(key));
  }

  // Keys currently held or waited on.
  size_t Size() const {
    std::lock_guard<std::mutex> lock(guard_);
    return mutexes_.size();
  }

 private:
  std::shared_ptr<std::mutex> Acquire(const std::string& key) {
    std::lock_guard<std::mutex> lock(guard_);
    auto&                       mutex = mutexes_[key];
    if (!mutex) {
      mutex = std::make_shared<std::mutex>();
    }
    return mutex;
  }

  void Release(const std::string& key) {
    std::lock_guard<std::mutex> lock(guard_);
    auto                        it = mutexes_.find(key);
    // the map's own reference is the last one left
    if (it != mutexes_.end() && it->second.use_count() == 1) {
      mutexes_.erase(it);
    }
  }

  mutable std::mutex                                           guard_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> mutexes_;
};

} // namespace chunkscribe::util
