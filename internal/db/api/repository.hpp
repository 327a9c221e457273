#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/patron_record.hpp"
#include "internal/db/model/request_record.hpp"
#include "internal/db/model/track_record.hpp"
#include "internal/db/model/venue_record.hpp"

namespace songqueue::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes happen inside a Transaction
  - Reads inside a transaction see its writes
  - Writes report failures as Result; reads throw DatabaseError
  - UpdateRequest is conditional on the stored status (optimistic check)
  - ShiftPendingPositions + the status update that vacated the position
    commit together or not at all

  The DB is the source of truth for:
    venues / tracks (catalog)
    patrons
    song requests and their queue positions
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // Storage-level venue lock held until the transaction ends.
  // Postgres: SELECT ... FOR UPDATE on the venue row.
  // Embedded backends rely on the in-process venue lock and return Ok.
  virtual Result LockVenue(Transaction&, const std::string& venue_id) = 0;

  // ---------------------------------------------------------------------
  // Catalog
  // ---------------------------------------------------------------------

  virtual Result UpsertVenue(Transaction&, const model::VenueRecord&) = 0;

  virtual std::optional<model::VenueRecord> GetVenue(Transaction&, const std::string& id) = 0;

  virtual Result UpsertTrack(Transaction&, const model::TrackRecord&) = 0;

  virtual std::optional<model::TrackRecord> GetTrack(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::TrackRecord> ListTracks(Transaction&, const std::string& venue_id) = 0;

  // ---------------------------------------------------------------------
  // Patrons
  // ---------------------------------------------------------------------

  virtual Result InsertPatron(Transaction&, const model::PatronRecord&) = 0;

  virtual Result UpdatePatron(Transaction&, const model::PatronRecord&) = 0;

  virtual std::optional<model::PatronRecord> GetPatron(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::PatronRecord> FindPatronByAccount(Transaction&, const std::string& venue_id,
                                                                 const std::string& account_id) = 0;

  // Most recently created anonymous patron whose table tag or client address matches.
  // Empty arguments never match.
  virtual std::optional<model::PatronRecord> FindPatronBySession(Transaction&, const std::string& venue_id, const std::string& table_tag,
                                                                 const std::string& client_address) = 0;

  // ---------------------------------------------------------------------
  // Requests
  // ---------------------------------------------------------------------

  virtual Result InsertRequest(Transaction&, const model::RequestRecord&) = 0;

  virtual std::optional<model::RequestRecord> GetRequest(Transaction&, const std::string& id) = 0;

  // Applies r only if the stored status still equals expected; Conflict otherwise.
  virtual Result UpdateRequest(Transaction&, const model::RequestRecord& r, songqueue::model::RequestStatus expected) = 0;

  virtual uint64_t CountPending(Transaction&, const std::string& venue_id) = 0;

  virtual uint64_t CountPendingForPatron(Transaction&, const std::string& venue_id, const std::string& patron_id) = 0;

  // True if the patron holds a pending or playing request for the track.
  virtual bool HasOutstanding(Transaction&, const std::string& venue_id, const std::string& patron_id, const std::string& track_id) = 0;

  // Decrements queue_position of every pending request in the venue with
  // queue_position > removed_position.
  virtual Result ShiftPendingPositions(Transaction&, const std::string& venue_id, uint32_t removed_position) = 0;

  // Pending requests ordered by queue_position, then submitted_at.
  virtual std::vector<model::RequestRecord> ListPending(Transaction&, const std::string& venue_id) = 0;

  // Pending filter orders by position; any other filter (or none) is most recent first.
  virtual std::vector<model::RequestRecord> ListVenueRequests(Transaction&, const std::string& venue_id,
                                                              std::optional<songqueue::model::RequestStatus> status,
                                                              const Pagination& pagination) = 0;

  // Most recent first.
  virtual std::vector<model::RequestRecord> ListPatronRequests(Transaction&, const std::string& patron_id,
                                                               std::optional<songqueue::model::RequestStatus> status, std::size_t limit) = 0;

  virtual StatusCounts CountByStatus(Transaction&, const std::string& venue_id) = 0;

  virtual StatusCounts CountByStatusForPatron(Transaction&, const std::string& patron_id) = 0;
};

} // namespace songqueue::db
