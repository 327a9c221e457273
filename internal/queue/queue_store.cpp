#include "queue_store.hpp"

#include <stdexcept>

#include "internal/db/api/error_translation.hpp"
#include "internal/util/errors.hpp"

namespace songqueue::queue {

using songqueue::model::RequestStatus;

VenueScope::VenueScope(VenueLockTable::Guard lock, std::unique_ptr<db::Transaction> tx, std::string venue_id)
    : lock_(std::move(lock)), tx_(std::move(tx)), venue_id_(std::move(venue_id)) {
}

void VenueScope::Commit() {
  db::WithStorage("commit venue " + venue_id_, [&] { tx_->Commit(); });
}

QueueStore::QueueStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

void QueueStore::CheckScope(const VenueScope& scope, const std::string& venue_id) {
  if (scope.VenueId() != venue_id) {
    throw std::logic_error("venue scope " + scope.VenueId() + " used for venue " + venue_id);
  }
}

VenueScope QueueStore::OpenVenueScope(const std::string& venue_id) {
  auto lock = locks_.Acquire(venue_id);
  auto tx   = db::WithStorage("begin venue " + venue_id, [&] { return repository_->Begin(); });
  db::ThrowIfDbError(repository_->LockVenue(*tx, venue_id), "lock venue " + venue_id);
  return VenueScope(std::move(lock), std::move(tx), venue_id);
}

db::model::RequestRecord QueueStore::Append(VenueScope& scope, db::model::RequestRecord request) {
  CheckScope(scope, request.venue_id);

  request.status         = RequestStatus::kPending;
  request.queue_position = static_cast<uint32_t>(PendingCount(scope) + 1);
  db::ThrowIfDbError(repository_->InsertRequest(scope.Tx(), request), "append request");
  return request;
}

void QueueStore::Renumber(VenueScope& scope, uint32_t removed_position) {
  if (removed_position == 0) {
    return;
  }
  db::ThrowIfDbError(repository_->ShiftPendingPositions(scope.Tx(), scope.VenueId(), removed_position), "renumber queue");
}

void QueueStore::Update(VenueScope& scope, const db::model::RequestRecord& r, RequestStatus expected) {
  CheckScope(scope, r.venue_id);
  db::ThrowIfDbError(repository_->UpdateRequest(scope.Tx(), r, expected), "update request " + r.id);
}

std::optional<db::model::RequestRecord> QueueStore::Get(VenueScope& scope, const std::string& request_id) {
  return db::WithStorage("get request", [&] { return repository_->GetRequest(scope.Tx(), request_id); });
}

uint64_t QueueStore::PendingCount(VenueScope& scope) {
  return db::WithStorage("count pending", [&] { return repository_->CountPending(scope.Tx(), scope.VenueId()); });
}

uint64_t QueueStore::PendingCountForPatron(VenueScope& scope, const std::string& patron_id) {
  return db::WithStorage("count patron pending",
                         [&] { return repository_->CountPendingForPatron(scope.Tx(), scope.VenueId(), patron_id); });
}

bool QueueStore::HasOutstanding(VenueScope& scope, const std::string& patron_id, const std::string& track_id) {
  return db::WithStorage("check outstanding",
                         [&] { return repository_->HasOutstanding(scope.Tx(), scope.VenueId(), patron_id, track_id); });
}

std::vector<db::model::RequestRecord> QueueStore::ListPending(VenueScope& scope) {
  return db::WithStorage("list pending", [&] { return repository_->ListPending(scope.Tx(), scope.VenueId()); });
}

std::vector<db::model::RequestRecord> QueueStore::ListPending(const std::string& venue_id) {
  return db::WithStorage("list pending", [&] {
    auto tx = repository_->Begin();
    return repository_->ListPending(*tx, venue_id);
  });
}

} // namespace songqueue::queue
