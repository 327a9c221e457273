#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace songqueue::queue {

/*
  One mutex per venue, created on first use and kept for the process
  lifetime. Different venues never share a mutex.
*/
class VenueLockTable {
 public:
  // Holds the venue mutex until destroyed. Keeps the mutex alive itself.
  class Guard {
   public:
    Guard(Guard&&) noexcept            = default;
    Guard& operator=(Guard&&) noexcept = default;

   private:
    friend class VenueLockTable;
    explicit Guard(std::shared_ptr<std::mutex> mutex) : mutex_(std::move(mutex)), lock_(*mutex_) {
    }

    std::shared_ptr<std::mutex>  mutex_;
    std::unique_lock<std::mutex> lock_;
  };

  Guard Acquire(const std::string& venue_id);

  std::size_t Size() const;

 private:
  std::shared_ptr<std::mutex> VenueMutex(const std::string& venue_id);

  mutable std::mutex                                           guard_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> mutexes_;
};

} // namespace songqueue::queue
