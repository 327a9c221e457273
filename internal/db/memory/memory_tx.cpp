#include "memory_tx.hpp"

#include <stdexcept>

namespace songqueue::db::memory {

namespace {

template <typename Map, typename Keys>
void MergeKeys(Map& committed, const Map& working, const Keys& keys) {
  for (const auto& key : keys) {
    auto it = working.find(key);
    if (it == working.end()) {
      committed.erase(key);
    } else {
      committed[key] = it->second;
    }
  }
}

} // namespace

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw std::logic_error("memory transaction already finished");
  }

  std::scoped_lock lock(repo_.mutex_);
  MergeKeys(repo_.committed_.venues, working_.venues, writes_.venues);
  MergeKeys(repo_.committed_.tracks, working_.tracks, writes_.tracks);
  MergeKeys(repo_.committed_.patrons, working_.patrons, writes_.patrons);
  MergeKeys(repo_.committed_.requests, working_.requests, writes_.requests);
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
}

} // namespace songqueue::db::memory
