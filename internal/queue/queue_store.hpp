#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/queue/venue_lock_table.hpp"

namespace songqueue::queue {

/*
  Per-venue unit of work.

  Owns, in acquisition order:
    1. the in-process venue mutex
    2. a storage transaction
    3. the storage-level venue lock (row lock on Postgres)

  Members are declared so destruction releases them in reverse. Nothing
  is visible to other units of work until Commit(); dropping the scope
  without Commit() rolls back.
*/
class VenueScope {
 public:
  VenueScope(VenueScope&&) noexcept            = default;
  VenueScope& operator=(VenueScope&&) noexcept = default;

  const std::string& VenueId() const {
    return venue_id_;
  }

  db::Transaction& Tx() {
    return *tx_;
  }

  void Commit();

 private:
  friend class QueueStore;
  VenueScope(VenueLockTable::Guard lock, std::unique_ptr<db::Transaction> tx, std::string venue_id);

  VenueLockTable::Guard            lock_;
  std::unique_ptr<db::Transaction> tx_;
  std::string                      venue_id_;
};

/*
  Durable ordered collection of requests per venue.

  Owns queue_position: pending positions of a venue are always 1..N.
  Mutating calls take an open VenueScope for that venue.
*/
class QueueStore {
 public:
  explicit QueueStore(std::shared_ptr<db::Repository> repository);

  VenueScope OpenVenueScope(const std::string& venue_id);

  // Assigns position = pending count + 1 and persists a pending request.
  db::model::RequestRecord Append(VenueScope& scope, db::model::RequestRecord request);

  // Closes the gap left by a request that held removed_position.
  void Renumber(VenueScope& scope, uint32_t removed_position);

  // Writes r if the stored status still equals expected; InvalidTransition otherwise.
  void Update(VenueScope& scope, const db::model::RequestRecord& r, songqueue::model::RequestStatus expected);

  std::optional<db::model::RequestRecord> Get(VenueScope& scope, const std::string& request_id);

  uint64_t PendingCount(VenueScope& scope);
  uint64_t PendingCountForPatron(VenueScope& scope, const std::string& patron_id);
  bool     HasOutstanding(VenueScope& scope, const std::string& patron_id, const std::string& track_id);

  std::vector<db::model::RequestRecord> ListPending(VenueScope& scope);
  std::vector<db::model::RequestRecord> ListPending(const std::string& venue_id);

  db::Repository& Repository() {
    return *repository_;
  }

  // Venues that have an in-process lock.
  std::size_t VenueLockCount() const {
    return locks_.Size();
  }

 private:
  static void CheckScope(const VenueScope& scope, const std::string& venue_id);

  std::shared_ptr<db::Repository> repository_;
  VenueLockTable                  locks_;
};

} // namespace songqueue::queue
