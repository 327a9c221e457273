#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace songqueue::db::memory {

using songqueue::model::RequestStatus;

namespace {

bool IsOutstanding(RequestStatus status) {
  return status == RequestStatus::kPending || status == RequestStatus::kPlaying;
}

bool ByPosition(const model::RequestRecord& a, const model::RequestRecord& b) {
  if (a.queue_position != b.queue_position) return a.queue_position < b.queue_position;
  return a.submitted_at_ms < b.submitted_at_ms;
}

bool MostRecentFirst(const model::RequestRecord& a, const model::RequestRecord& b) {
  if (a.submitted_at_ms != b.submitted_at_ms) return a.submitted_at_ms > b.submitted_at_ms;
  return a.id > b.id;
}

void CountInto(StatusCounts& counts, RequestStatus status) {
  switch (status) {
    case RequestStatus::kPending:
      ++counts.pending;
      break;
    case RequestStatus::kPlaying:
      ++counts.playing;
      break;
    case RequestStatus::kCompleted:
      ++counts.completed;
      break;
    case RequestStatus::kCancelled:
      ++counts.cancelled;
      break;
  }
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::LockVenue(Transaction&, const std::string&) {
  return Result::Ok();
}

// ------------------------------------------------------------------
// Catalog
// ------------------------------------------------------------------

Result MemoryRepository::UpsertVenue(Transaction& t, const model::VenueRecord& r) {
  auto& tx = TX(t);
  tx.Mutable().venues[r.id] = r;
  tx.Writes().venues.insert(r.id);
  return Result::Ok();
}

std::optional<model::VenueRecord> MemoryRepository::GetVenue(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.venues.find(id);
  if (it == s.venues.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpsertTrack(Transaction& t, const model::TrackRecord& r) {
  auto& tx = TX(t);
  if (!tx.View().venues.contains(r.venue_id)) return Result::Err(ErrorCode::ConstraintViolation, "track venue does not exist");
  tx.Mutable().tracks[r.id] = r;
  tx.Writes().tracks.insert(r.id);
  return Result::Ok();
}

std::optional<model::TrackRecord> MemoryRepository::GetTrack(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.tracks.find(id);
  if (it == s.tracks.end()) return std::nullopt;
  return it->second;
}

std::vector<model::TrackRecord> MemoryRepository::ListTracks(Transaction& t, const std::string& venue_id) {
  std::vector<model::TrackRecord> out;
  for (const auto& [_, track] : TX(t).View().tracks)
    if (track.venue_id == venue_id) out.push_back(track);
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.id < b.id; });
  return out;
}

// ------------------------------------------------------------------
// Patrons
// ------------------------------------------------------------------

Result MemoryRepository::InsertPatron(Transaction& t, const model::PatronRecord& r) {
  auto& tx = TX(t);
  if (tx.View().patrons.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists);
  tx.Mutable().patrons[r.id] = r;
  tx.Writes().patrons.insert(r.id);
  return Result::Ok();
}

Result MemoryRepository::UpdatePatron(Transaction& t, const model::PatronRecord& r) {
  auto& tx = TX(t);
  if (!tx.View().patrons.contains(r.id)) return Result::Err(ErrorCode::NotFound);
  tx.Mutable().patrons[r.id] = r;
  tx.Writes().patrons.insert(r.id);
  return Result::Ok();
}

std::optional<model::PatronRecord> MemoryRepository::GetPatron(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.patrons.find(id);
  if (it == s.patrons.end()) return std::nullopt;
  return it->second;
}

std::optional<model::PatronRecord> MemoryRepository::FindPatronByAccount(Transaction& t, const std::string& venue_id,
                                                                         const std::string& account_id) {
  if (account_id.empty()) return std::nullopt;
  for (const auto& [_, patron] : TX(t).View().patrons)
    if (patron.venue_id == venue_id && patron.account_id == account_id) return patron;
  return std::nullopt;
}

std::optional<model::PatronRecord> MemoryRepository::FindPatronBySession(Transaction& t, const std::string& venue_id,
                                                                         const std::string& table_tag,
                                                                         const std::string& client_address) {
  std::optional<model::PatronRecord> best;
  for (const auto& [_, patron] : TX(t).View().patrons) {
    if (patron.venue_id != venue_id || !patron.account_id.empty()) continue;

    const bool tag_match     = !table_tag.empty() && patron.table_tag == table_tag;
    const bool address_match = !client_address.empty() && patron.client_address == client_address;
    if (!tag_match && !address_match) continue;

    if (!best || patron.created_at_ms > best->created_at_ms ||
        (patron.created_at_ms == best->created_at_ms && patron.id > best->id)) {
      best = patron;
    }
  }
  return best;
}

// ------------------------------------------------------------------
// Requests
// ------------------------------------------------------------------

Result MemoryRepository::InsertRequest(Transaction& t, const model::RequestRecord& r) {
  auto& tx = TX(t);
  if (tx.View().requests.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists);
  if (IsOutstanding(r.status) && HasOutstanding(t, r.venue_id, r.patron_id, r.track_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "patron already has this track outstanding");
  }
  tx.Mutable().requests[r.id] = r;
  tx.Writes().requests.insert(r.id);
  return Result::Ok();
}

std::optional<model::RequestRecord> MemoryRepository::GetRequest(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.requests.find(id);
  if (it == s.requests.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateRequest(Transaction& t, const model::RequestRecord& r, RequestStatus expected) {
  auto& tx = TX(t);
  auto  it = tx.Mutable().requests.find(r.id);
  if (it == tx.Mutable().requests.end()) return Result::Err(ErrorCode::NotFound);
  if (it->second.status != expected) return Result::Err(ErrorCode::Conflict, "request status changed concurrently");
  it->second = r;
  tx.Writes().requests.insert(r.id);
  return Result::Ok();
}

uint64_t MemoryRepository::CountPending(Transaction& t, const std::string& venue_id) {
  uint64_t count = 0;
  for (const auto& [_, r] : TX(t).View().requests)
    if (r.venue_id == venue_id && r.status == RequestStatus::kPending) ++count;
  return count;
}

uint64_t MemoryRepository::CountPendingForPatron(Transaction& t, const std::string& venue_id, const std::string& patron_id) {
  uint64_t count = 0;
  for (const auto& [_, r] : TX(t).View().requests)
    if (r.venue_id == venue_id && r.patron_id == patron_id && r.status == RequestStatus::kPending) ++count;
  return count;
}

bool MemoryRepository::HasOutstanding(Transaction& t, const std::string& venue_id, const std::string& patron_id,
                                      const std::string& track_id) {
  for (const auto& [_, r] : TX(t).View().requests)
    if (r.venue_id == venue_id && r.patron_id == patron_id && r.track_id == track_id && IsOutstanding(r.status)) return true;
  return false;
}

Result MemoryRepository::ShiftPendingPositions(Transaction& t, const std::string& venue_id, uint32_t removed_position) {
  auto& tx = TX(t);
  for (auto& [id, r] : tx.Mutable().requests) {
    if (r.venue_id != venue_id || r.status != RequestStatus::kPending || r.queue_position <= removed_position) continue;
    --r.queue_position;
    tx.Writes().requests.insert(id);
  }
  return Result::Ok();
}

std::vector<model::RequestRecord> MemoryRepository::ListPending(Transaction& t, const std::string& venue_id) {
  std::vector<model::RequestRecord> out;
  for (const auto& [_, r] : TX(t).View().requests)
    if (r.venue_id == venue_id && r.status == RequestStatus::kPending) out.push_back(r);
  std::sort(out.begin(), out.end(), ByPosition);
  return out;
}

std::vector<model::RequestRecord> MemoryRepository::ListVenueRequests(Transaction& t, const std::string& venue_id,
                                                                      std::optional<RequestStatus> status,
                                                                      const Pagination& pagination) {
  std::vector<model::RequestRecord> matched;
  for (const auto& [_, r] : TX(t).View().requests) {
    if (r.venue_id != venue_id) continue;
    if (status.has_value() && r.status != *status) continue;
    matched.push_back(r);
  }

  if (status == RequestStatus::kPending) {
    std::sort(matched.begin(), matched.end(), ByPosition);
  } else {
    std::sort(matched.begin(), matched.end(), MostRecentFirst);
  }

  if (pagination.offset >= matched.size()) return {};
  const auto begin = matched.begin() + static_cast<std::ptrdiff_t>(pagination.offset);
  const auto count = std::min(pagination.limit, matched.size() - pagination.offset);
  return {begin, begin + static_cast<std::ptrdiff_t>(count)};
}

std::vector<model::RequestRecord> MemoryRepository::ListPatronRequests(Transaction& t, const std::string& patron_id,
                                                                       std::optional<RequestStatus> status, std::size_t limit) {
  std::vector<model::RequestRecord> out;
  for (const auto& [_, r] : TX(t).View().requests) {
    if (r.patron_id != patron_id) continue;
    if (status.has_value() && r.status != *status) continue;
    out.push_back(r);
  }
  std::sort(out.begin(), out.end(), MostRecentFirst);
  if (out.size() > limit) out.resize(limit);
  return out;
}

StatusCounts MemoryRepository::CountByStatus(Transaction& t, const std::string& venue_id) {
  StatusCounts counts;
  for (const auto& [_, r] : TX(t).View().requests)
    if (r.venue_id == venue_id) CountInto(counts, r.status);
  return counts;
}

StatusCounts MemoryRepository::CountByStatusForPatron(Transaction& t, const std::string& patron_id) {
  StatusCounts counts;
  for (const auto& [_, r] : TX(t).View().requests)
    if (r.patron_id == patron_id) CountInto(counts, r.status);
  return counts;
}

} // namespace songqueue::db::memory
