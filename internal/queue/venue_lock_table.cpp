#include "venue_lock_table.hpp"

namespace songqueue::queue {

std::shared_ptr<std::mutex> VenueLockTable::VenueMutex(const std::string& venue_id) {
  std::lock_guard<std::mutex> lock(guard_);
  auto&                       venue_mutex = mutexes_[venue_id];
  if (!venue_mutex) {
    venue_mutex = std::make_shared<std::mutex>();
  }
  return venue_mutex;
}

VenueLockTable::Guard VenueLockTable::Acquire(const std::string& venue_id) {
  return Guard(VenueMutex(venue_id));
}

std::size_t VenueLockTable::Size() const {
  std::lock_guard<std::mutex> lock(guard_);
  return mutexes_.size();
}

} // namespace songqueue::queue
