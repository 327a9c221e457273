#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/sql_queries.hpp"

namespace songqueue::db::sqlite {

using songqueue::db::ErrorCode;
using songqueue::db::Result;
using songqueue::model::RequestStatus;

namespace {

using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

// Read paths throw; write paths translate into Result.
StmtPtr PrepareOrThrow(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
        throw DatabaseError(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
    return StmtPtr(st, &sqlite3_finalize);
}

StmtPtr TryPrepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
        return StmtPtr(nullptr, &sqlite3_finalize);
    }
    return StmtPtr(st, &sqlite3_finalize);
}

// True on SQLITE_ROW, false on SQLITE_DONE, throws otherwise.
bool StepRow(sqlite3* db, sqlite3_stmt* st) {
    int rc = sqlite3_step(st);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw DatabaseError(rc == SQLITE_BUSY || rc == SQLITE_LOCKED ? ErrorCode::Busy : ErrorCode::IOError, sqlite3_errmsg(db));
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

void BindBool(sqlite3_stmt* st, int idx, bool v) {
    sqlite3_bind_int(st, idx, v ? 1 : 0);
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

uint32_t ColU32(sqlite3_stmt* st, int col) {
    return static_cast<uint32_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

RequestStatus ColStatus(sqlite3_stmt* st, int col) {
    auto status = songqueue::model::FromStorage(ColI32(st, col));
    if (!status) {
        throw DatabaseError(ErrorCode::Corruption, "unknown request status " + std::to_string(ColI32(st, col)));
    }
    return *status;
}

model::VenueRecord ReadVenue(sqlite3_stmt* st) {
    model::VenueRecord r;
    r.id                      = ColText(st, 0);
    r.name                    = ColText(st, 1);
    r.active                  = ColI32(st, 2) != 0;
    r.max_requests_per_patron = ColU32(st, 3);
    r.queue_limit             = ColU32(st, 4);
    return r;
}

model::TrackRecord ReadTrack(sqlite3_stmt* st) {
    model::TrackRecord r;
    r.id           = ColText(st, 0);
    r.venue_id     = ColText(st, 1);
    r.active       = ColI32(st, 2) != 0;
    r.title        = ColText(st, 3);
    r.artist       = ColText(st, 4);
    r.duration_sec = ColU32(st, 5);
    return r;
}

model::PatronRecord ReadPatron(sqlite3_stmt* st) {
    model::PatronRecord r;
    r.id             = ColText(st, 0);
    r.venue_id       = ColText(st, 1);
    r.account_id     = ColText(st, 2);
    r.table_tag      = ColText(st, 3);
    r.client_address = ColText(st, 4);
    r.created_at_ms  = ColU64(st, 5);
    r.last_seen_ms   = ColU64(st, 6);
    return r;
}

model::RequestRecord ReadRequest(sqlite3_stmt* st) {
    model::RequestRecord r;
    r.id              = ColText(st, 0);
    r.venue_id        = ColText(st, 1);
    r.patron_id       = ColText(st, 2);
    r.track_id        = ColText(st, 3);
    r.status          = ColStatus(st, 4);
    r.queue_position  = ColU32(st, 5);
    r.display_tag     = ColText(st, 6);
    r.submitted_at_ms = ColU64(st, 7);
    r.started_at_ms   = ColU64(st, 8);
    r.completed_at_ms = ColU64(st, 9);
    r.cancelled_at_ms = ColU64(st, 10);
    return r;
}

std::vector<model::RequestRecord> ReadRequests(sqlite3* db, sqlite3_stmt* st) {
    std::vector<model::RequestRecord> out;
    while (StepRow(db, st)) {
        out.push_back(ReadRequest(st));
    }
    return out;
}

uint64_t ReadCount(sqlite3* db, sqlite3_stmt* st) {
    return StepRow(db, st) ? ColU64(st, 0) : 0;
}

StatusCounts ReadStatusCounts(sqlite3* db, sqlite3_stmt* st) {
    StatusCounts counts;
    while (StepRow(db, st)) {
        const auto n = ColU64(st, 1);
        switch (ColStatus(st, 0)) {
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

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// BEGIN IMMEDIATE already holds the database write lock.
Result SqliteRepository::LockVenue(Transaction&, const std::string&) {
    return Result::Ok();
}

// ------------------------------------------------------------------
// Catalog
// ------------------------------------------------------------------

Result SqliteRepository::UpsertVenue(Transaction& t, const model::VenueRecord& r) {
    auto* db = TX(t).Handle();

    auto st = TryPrepare(db, sql::UPSERT_VENUE);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.name);
    BindBool(st.get(), 3, r.active);
    BindU64(st.get(), 4, r.max_requests_per_patron);
    BindU64(st.get(), 5, r.queue_limit);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::VenueRecord> SqliteRepository::GetVenue(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db, sql::SELECT_VENUE);
    BindText(st.get(), 1, id);

    if (!StepRow(db, st.get())) return std::nullopt;
    return ReadVenue(st.get());
}

Result SqliteRepository::UpsertTrack(Transaction& t, const model::TrackRecord& r) {
    auto* db = TX(t).Handle();

    auto st = TryPrepare(db, sql::UPSERT_TRACK);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.venue_id);
    BindBool(st.get(), 3, r.active);
    BindText(st.get(), 4, r.title);
    BindText(st.get(), 5, r.artist);
    BindU64(st.get(), 6, r.duration_sec);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::TrackRecord> SqliteRepository::GetTrack(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db, sql::SELECT_TRACK);
    BindText(st.get(), 1, id);

    if (!StepRow(db, st.get())) return std::nullopt;
    return ReadTrack(st.get());
}

std::vector<model::TrackRecord> SqliteRepository::ListTracks(Transaction& t, const std::string& venue_id) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db, sql::SELECT_TRACKS_BY_VENUE);
    BindText(st.get(), 1, venue_id);

    std::vector<model::TrackRecord> out;
    while (StepRow(db, st.get())) {
        out.push_back(ReadTrack(st.get()));
    }
    return out;
}

// ------------------------------------------------------------------
// Patrons
// ------------------------------------------------------------------

Result SqliteRepository::InsertPatron(Transaction& t, const model::PatronRecord& r) {
    auto* db = TX(t).Handle();

    auto st = TryPrepare(db, sql::INSERT_PATRON);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.venue_id);
    BindText(st.get(), 3, r.account_id);
    BindText(st.get(), 4, r.table_tag);
    BindText(st.get(), 5, r.client_address);
    BindU64(st.get(), 6, r.created_at_ms);
    BindU64(st.get(), 7, r.last_seen_ms);

    return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::UpdatePatron(Transaction& t, const model::PatronRecord& r) {
    auto* db = TX(t).Handle();

    auto st = TryPrepare(db, sql::UPDATE_PATRON);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.table_tag);
    BindText(st.get(), 3, r.client_address);
    BindU64(st.get(), 4, r.last_seen_ms);

    auto res = Translate(db, sqlite3_step(st.get()));
    if (res && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
    return res;
}

std::optional<model::PatronRecord> SqliteRepository::GetPatron(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db, sql::SELECT_PATRON);
    BindText(st.get(), 1, id);

    if (!StepRow(db, st.get())) return std::nullopt;
    return ReadPatron(st.get());
}

std::optional<model::PatronRecord> SqliteRepository::FindPatronByAccount(Transaction& t, const std::string& venue_id,
                                                                         const std::string& account_id) {
    if (account_id.empty()) return std::nullopt;
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db, sql::SELECT_PATRON_BY_ACCOUNT);
    BindText(st.get(), 1, venue_id);
    BindText(st.get(), 2, account_id);

    if (!StepRow(db, st.get())) return std::nullopt;
    return ReadPatron(st.get());
}

std::optional<model::PatronRecord> SqliteRepository::FindPatronBySession(Transaction& t, const std::string& venue_id,
                                                                         const std::string& table_tag,
                                                                         const std::string& client_address) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db, sql::SELECT_PATRON_BY_SESSION);
    BindText(st.get(), 1, venue_id);
    BindText(st.get(), 2, table_tag);
    BindText(st.get(), 3, client_address);

    if (!StepRow(db, st.get())) return std::nullopt;
    return ReadPatron(st.get());
}

// ------------------------------------------------------------------
// Requests
// ------------------------------------------------------------------

Result SqliteRepository::InsertRequest(Transaction& t, const model::RequestRecord& r) {
    auto* db = TX(t).Handle();

    auto st = TryPrepare(db, sql::INSERT_REQUEST);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.venue_id);
    BindText(st.get(), 3, r.patron_id);
    BindText(st.get(), 4, r.track_id);
    BindI32(st.get(), 5, static_cast<int>(r.status));
    BindU64(st.get(), 6, r.queue_position);
    BindText(st.get(), 7, r.display_tag);
    BindU64(st.get(), 8, r.submitted_at_ms);
    BindU64(st.get(), 9, r.started_at_ms);
    BindU64(st.get(), 10, r.completed_at_ms);
    BindU64(st.get(), 11, r.cancelled_at_ms);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE && sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_PRIMARYKEY) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
    }
    return Translate(db, rc);
}

std::optional<model::RequestRecord> SqliteRepository::GetRequest(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db, sql::SELECT_REQUEST);
    BindText(st.get(), 1, id);

    if (!StepRow(db, st.get())) return std::nullopt;
    return ReadRequest(st.get());
}

Result SqliteRepository::UpdateRequest(Transaction& t, const model::RequestRecord& r, RequestStatus expected) {
    auto* db = TX(t).Handle();

    auto st = TryPrepare(db, sql::UPDATE_REQUEST);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.id);
    BindI32(st.get(), 2, static_cast<int>(r.status));
    BindU64(st.get(), 3, r.queue_position);
    BindText(st.get(), 4, r.display_tag);
    BindU64(st.get(), 5, r.started_at_ms);
    BindU64(st.get(), 6, r.completed_at_ms);
    BindU64(st.get(), 7, r.cancelled_at_ms);
    BindI32(st.get(), 8, static_cast<int>(expected));

    auto res = Translate(db, sqlite3_step(st.get()));
    if (!res || sqlite3_changes(db) > 0) return res;

    // Nothing matched: either the row is gone or its status moved on.
    auto probe = TryPrepare(db, sql::SELECT_REQUEST_STATUS);
    if (!probe) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindText(probe.get(), 1, r.id);

    int rc = sqlite3_step(probe.get());
    if (rc == SQLITE_ROW) return Result::Err(ErrorCode::Conflict, "request status changed concurrently");
    if (rc == SQLITE_DONE) return Result::Err(ErrorCode::NotFound);
    return Translate(db, rc);
}

uint64_t SqliteRepository::CountPending(Transaction& t, const std::string& venue_id) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db, sql::COUNT_PENDING);
    BindText(st.get(), 1, venue_id);
    return ReadCount(db, st.get());
}

uint64_t SqliteRepository::CountPendingForPatron(Transaction& t, const std::string& venue_id, const std::string& patron_id) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db, sql::COUNT_PENDING_FOR_PATRON);
    BindText(st.get(), 1, venue_id);
    BindText(st.get(), 2, patron_id);
    return ReadCount(db, st.get());
}

bool SqliteRepository::HasOutstanding(Transaction& t, const std::string& venue_id, const std::string& patron_id,
                                      const std::string& track_id) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db, sql::HAS_OUTSTANDING);
    BindText(st.get(), 1, venue_id);
    BindText(st.get(), 2, patron_id);
    BindText(st.get(), 3, track_id);
    return StepRow(db, st.get());
}

Result SqliteRepository::ShiftPendingPositions(Transaction& t, const std::string& venue_id, uint32_t removed_position) {
    auto* db = TX(t).Handle();

    auto st = TryPrepare(db, sql::SHIFT_PENDING_POSITIONS);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, venue_id);
    BindU64(st.get(), 2, removed_position);

    return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::RequestRecord> SqliteRepository::ListPending(Transaction& t, const std::string& venue_id) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db, sql::SELECT_PENDING);
    BindText(st.get(), 1, venue_id);
    return ReadRequests(db, st.get());
}

std::vector<model::RequestRecord> SqliteRepository::ListVenueRequests(Transaction& t, const std::string& venue_id,
                                                                      std::optional<RequestStatus> status,
                                                                      const Pagination& pagination) {
    auto* db = TX(t).Handle();

    const char* query = sql::SELECT_VENUE_REQUESTS_ALL;
    if (status == RequestStatus::kPending) {
        query = sql::SELECT_VENUE_REQUESTS_PENDING;
    } else if (status.has_value()) {
        query = sql::SELECT_VENUE_REQUESTS_BY_STATUS;
    }

    auto st = PrepareOrThrow(db, query);
    BindText(st.get(), 1, venue_id);
    BindU64(st.get(), 2, pagination.limit);
    BindU64(st.get(), 3, pagination.offset);
    if (status.has_value() && *status != RequestStatus::kPending) {
        BindI32(st.get(), 4, static_cast<int>(*status));
    }
    return ReadRequests(db, st.get());
}

std::vector<model::RequestRecord> SqliteRepository::ListPatronRequests(Transaction& t, const std::string& patron_id,
                                                                       std::optional<RequestStatus> status, std::size_t limit) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db, status.has_value() ? sql::SELECT_PATRON_REQUESTS_BY_STATUS : sql::SELECT_PATRON_REQUESTS_ALL);
    BindText(st.get(), 1, patron_id);
    BindU64(st.get(), 2, limit);
    if (status.has_value()) {
        BindI32(st.get(), 3, static_cast<int>(*status));
    }
    return ReadRequests(db, st.get());
}

StatusCounts SqliteRepository::CountByStatus(Transaction& t, const std::string& venue_id) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db, sql::COUNT_BY_STATUS);
    BindText(st.get(), 1, venue_id);
    return ReadStatusCounts(db, st.get());
}

StatusCounts SqliteRepository::CountByStatusForPatron(Transaction& t, const std::string& patron_id) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db, sql::COUNT_BY_STATUS_FOR_PATRON);
    BindText(st.get(), 1, patron_id);
    return ReadStatusCounts(db, st.get());
}

} // namespace songqueue::db::sqlite
