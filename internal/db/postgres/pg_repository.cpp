#include "pg_repository.hpp"

#include <string_view>

namespace songqueue::db::postgres {

using songqueue::model::RequestStatus;

namespace {

// Read paths surface driver failures as DatabaseError.
template <typename Fn>
auto Read(Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const pqxx::broken_connection& e) {
    throw DatabaseError(ErrorCode::IOError, e.what());
  } catch (const pqxx::failure& e) {
    throw DatabaseError(ErrorCode::InternalError, e.what());
  }
}

RequestStatus ToStatus(const pqxx::field& field) {
  auto status = songqueue::model::FromStorage(field.as<int>());
  if (!status) {
    throw DatabaseError(ErrorCode::Corruption, "unknown request status " + std::string(field.c_str()));
  }
  return *status;
}

model::VenueRecord ReadVenue(const pqxx::row& row) {
  model::VenueRecord r;
  r.id                      = row[0].c_str();
  r.name                    = row[1].c_str();
  r.active                  = row[2].as<bool>();
  r.max_requests_per_patron = row[3].as<uint32_t>();
  r.queue_limit             = row[4].as<uint32_t>();
  return r;
}

model::TrackRecord ReadTrack(const pqxx::row& row) {
  model::TrackRecord r;
  r.id           = row[0].c_str();
  r.venue_id     = row[1].c_str();
  r.active       = row[2].as<bool>();
  r.title        = row[3].c_str();
  r.artist       = row[4].c_str();
  r.duration_sec = row[5].as<uint32_t>();
  return r;
}

model::PatronRecord ReadPatron(const pqxx::row& row) {
  model::PatronRecord r;
  r.id             = row[0].c_str();
  r.venue_id       = row[1].c_str();
  r.account_id     = row[2].c_str();
  r.table_tag      = row[3].c_str();
  r.client_address = row[4].c_str();
  r.created_at_ms  = row[5].as<uint64_t>();
  r.last_seen_ms   = row[6].as<uint64_t>();
  return r;
}

model::RequestRecord ReadRequest(const pqxx::row& row) {
  model::RequestRecord r;
  r.id              = row[0].c_str();
  r.venue_id        = row[1].c_str();
  r.patron_id       = row[2].c_str();
  r.track_id        = row[3].c_str();
  r.status          = ToStatus(row[4]);
  r.queue_position  = row[5].as<uint32_t>();
  r.display_tag     = row[6].c_str();
  r.submitted_at_ms = row[7].as<uint64_t>();
  r.started_at_ms   = row[8].as<uint64_t>();
  r.completed_at_ms = row[9].as<uint64_t>();
  r.cancelled_at_ms = row[10].as<uint64_t>();
  return r;
}

std::vector<model::RequestRecord> ReadRequests(const pqxx::result& res) {
  std::vector<model::RequestRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadRequest(row));
  }
  return out;
}

StatusCounts ReadStatusCounts(const pqxx::result& res) {
  StatusCounts counts;
  for (const auto& row : res) {
    const auto n = row[1].as<uint64_t>();
    switch (ToStatus(row[0])) {
      case RequestStatus::kPending:
        counts.pending = n;
        break;
      case RequestStatus::kPlaying:
        counts.playing = n;
        break;
      case RequestStatus::kCompleted:
        counts.completed = n;
        break;
      case RequestStatus::kCancelled:
        counts.cancelled = n;
        break;
    }
  }
  return counts;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (const auto* unique = dynamic_cast<const pqxx::unique_violation*>(&e)) {
    // Primary key collisions are id reuse; any other unique index is a rule violation.
    if (std::string_view(unique->what()).find("_pkey") != std::string_view::npos) {
      return Result::Err(ErrorCode::AlreadyExists, e.what());
    }
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::LockVenue(Transaction& t, const std::string& venue_id) {
  try {
    TX(t).Work().exec_prepared("lock_venue", venue_id);
    return Result::Ok();
  } catch (const pqxx::failure& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Catalog
// ------------------------------------------------------------------

Result PgRepository::UpsertVenue(Transaction& t, const model::VenueRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_venue", r.id, r.name, r.active, r.max_requests_per_patron, r.queue_limit);
    return Result::Ok();
  } catch (const pqxx::failure& e) {
    return Translate(e);
  }
}

std::optional<model::VenueRecord> PgRepository::GetVenue(Transaction& t, const std::string& id) {
  return Read([&]() -> std::optional<model::VenueRecord> {
    auto res = TX(t).Work().exec_prepared("get_venue", id);
    if (res.empty()) return std::nullopt;
    return ReadVenue(res[0]);
  });
}

Result PgRepository::UpsertTrack(Transaction& t, const model::TrackRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_track", r.id, r.venue_id, r.active, r.title, r.artist, r.duration_sec);
    return Result::Ok();
  } catch (const pqxx::failure& e) {
    return Translate(e);
  }
}

std::optional<model::TrackRecord> PgRepository::GetTrack(Transaction& t, const std::string& id) {
  return Read([&]() -> std::optional<model::TrackRecord> {
    auto res = TX(t).Work().exec_prepared("get_track", id);
    if (res.empty()) return std::nullopt;
    return ReadTrack(res[0]);
  });
}

std::vector<model::TrackRecord> PgRepository::ListTracks(Transaction& t, const std::string& venue_id) {
  return Read([&] {
    auto res = TX(t).Work().exec_prepared("list_tracks", venue_id);

    std::vector<model::TrackRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      out.push_back(ReadTrack(row));
    }
    return out;
  });
}

// ------------------------------------------------------------------
// Patrons
// ------------------------------------------------------------------

Result PgRepository::InsertPatron(Transaction& t, const model::PatronRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_patron", r.id, r.venue_id, r.account_id, r.table_tag, r.client_address, r.created_at_ms,
                               r.last_seen_ms);
    return Result::Ok();
  } catch (const pqxx::failure& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdatePatron(Transaction& t, const model::PatronRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_patron", r.id, r.table_tag, r.client_address, r.last_seen_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const pqxx::failure& e) {
    return Translate(e);
  }
}

std::optional<model::PatronRecord> PgRepository::GetPatron(Transaction& t, const std::string& id) {
  return Read([&]() -> std::optional<model::PatronRecord> {
    auto res = TX(t).Work().exec_prepared("get_patron", id);
    if (res.empty()) return std::nullopt;
    return ReadPatron(res[0]);
  });
}

std::optional<model::PatronRecord> PgRepository::FindPatronByAccount(Transaction& t, const std::string& venue_id,
                                                                     const std::string& account_id) {
  if (account_id.empty()) return std::nullopt;
  return Read([&]() -> std::optional<model::PatronRecord> {
    auto res = TX(t).Work().exec_prepared("find_patron_by_account", venue_id, account_id);
    if (res.empty()) return std::nullopt;
    return ReadPatron(res[0]);
  });
}

std::optional<model::PatronRecord> PgRepository::FindPatronBySession(Transaction& t, const std::string& venue_id,
                                                                     const std::string& table_tag,
                                                                     const std::string& client_address) {
  return Read([&]() -> std::optional<model::PatronRecord> {
    auto res = TX(t).Work().exec_prepared("find_patron_by_session", venue_id, table_tag, client_address);
    if (res.empty()) return std::nullopt;
    return ReadPatron(res[0]);
  });
}

// ------------------------------------------------------------------
// Requests
// ------------------------------------------------------------------

Result PgRepository::InsertRequest(Transaction& t, const model::RequestRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_request", r.id, r.venue_id, r.patron_id, r.track_id, static_cast<int>(r.status),
                               r.queue_position, r.display_tag, r.submitted_at_ms, r.started_at_ms, r.completed_at_ms,
                               r.cancelled_at_ms);
    return Result::Ok();
  } catch (const pqxx::failure& e) {
    return Translate(e);
  }
}

std::optional<model::RequestRecord> PgRepository::GetRequest(Transaction& t, const std::string& id) {
  return Read([&]() -> std::optional<model::RequestRecord> {
    auto res = TX(t).Work().exec_prepared("get_request", id);
    if (res.empty()) return std::nullopt;
    return ReadRequest(res[0]);
  });
}

Result PgRepository::UpdateRequest(Transaction& t, const model::RequestRecord& r, RequestStatus expected) {
  try {
    auto& work = TX(t).Work();
    auto  res  = work.exec_prepared("update_request", r.id, static_cast<int>(r.status), r.queue_position, r.display_tag,
                                    r.started_at_ms, r.completed_at_ms, r.cancelled_at_ms, static_cast<int>(expected));
    if (res.affected_rows() > 0) return Result::Ok();

    auto probe = work.exec_prepared("get_request_status", r.id);
    if (probe.empty()) return Result::Err(ErrorCode::NotFound);
    return Result::Err(ErrorCode::Conflict, "request status changed concurrently");
  } catch (const pqxx::failure& e) {
    return Translate(e);
  }
}

uint64_t PgRepository::CountPending(Transaction& t, const std::string& venue_id) {
  return Read([&] { return TX(t).Work().exec_prepared("count_pending", venue_id)[0][0].as<uint64_t>(); });
}

uint64_t PgRepository::CountPendingForPatron(Transaction& t, const std::string& venue_id, const std::string& patron_id) {
  return Read([&] { return TX(t).Work().exec_prepared("count_pending_for_patron", venue_id, patron_id)[0][0].as<uint64_t>(); });
}

bool PgRepository::HasOutstanding(Transaction& t, const std::string& venue_id, const std::string& patron_id,
                                  const std::string& track_id) {
  return Read([&] { return !TX(t).Work().exec_prepared("has_outstanding", venue_id, patron_id, track_id).empty(); });
}

Result PgRepository::ShiftPendingPositions(Transaction& t, const std::string& venue_id, uint32_t removed_position) {
  try {
    TX(t).Work().exec_prepared("shift_pending_positions", venue_id, removed_position);
    return Result::Ok();
  } catch (const pqxx::failure& e) {
    return Translate(e);
  }
}

std::vector<model::RequestRecord> PgRepository::ListPending(Transaction& t, const std::string& venue_id) {
  return Read([&] { return ReadRequests(TX(t).Work().exec_prepared("list_pending", venue_id)); });
}

std::vector<model::RequestRecord> PgRepository::ListVenueRequests(Transaction& t, const std::string& venue_id,
                                                                  std::optional<RequestStatus> status,
                                                                  const Pagination& pagination) {
  return Read([&] {
    auto& work = TX(t).Work();
    if (status == RequestStatus::kPending) {
      return ReadRequests(work.exec_prepared("list_venue_pending", venue_id, pagination.limit, pagination.offset));
    }
    if (status.has_value()) {
      return ReadRequests(
          work.exec_prepared("list_venue_by_status", venue_id, pagination.limit, pagination.offset, static_cast<int>(*status)));
    }
    return ReadRequests(work.exec_prepared("list_venue_all", venue_id, pagination.limit, pagination.offset));
  });
}

std::vector<model::RequestRecord> PgRepository::ListPatronRequests(Transaction& t, const std::string& patron_id,
                                                                   std::optional<RequestStatus> status, std::size_t limit) {
  return Read([&] {
    auto& work = TX(t).Work();
    if (status.has_value()) {
      return ReadRequests(work.exec_prepared("list_patron_by_status", patron_id, limit, static_cast<int>(*status)));
    }
    return ReadRequests(work.exec_prepared("list_patron_all", patron_id, limit));
  });
}

StatusCounts PgRepository::CountByStatus(Transaction& t, const std::string& venue_id) {
  return Read([&] { return ReadStatusCounts(TX(t).Work().exec_prepared("count_by_status", venue_id)); });
}

StatusCounts PgRepository::CountByStatusForPatron(Transaction& t, const std::string& patron_id) {
  return Read([&] { return ReadStatusCounts(TX(t).Work().exec_prepared("count_by_status_for_patron", patron_id)); });
}

} // namespace songqueue::db::postgres
