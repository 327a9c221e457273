#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace songqueue::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result LockVenue(Transaction&, const std::string& venue_id) override;

  Result UpsertVenue(Transaction&, const model::VenueRecord&) override;
  std::optional<model::VenueRecord> GetVenue(Transaction&, const std::string&) override;
  Result UpsertTrack(Transaction&, const model::TrackRecord&) override;
  std::optional<model::TrackRecord> GetTrack(Transaction&, const std::string&) override;
  std::vector<model::TrackRecord> ListTracks(Transaction&, const std::string& venue_id) override;

  Result InsertPatron(Transaction&, const model::PatronRecord&) override;
  Result UpdatePatron(Transaction&, const model::PatronRecord&) override;
  std::optional<model::PatronRecord> GetPatron(Transaction&, const std::string&) override;
  std::optional<model::PatronRecord> FindPatronByAccount(Transaction&, const std::string& venue_id,
                                                         const std::string& account_id) override;
  std::optional<model::PatronRecord> FindPatronBySession(Transaction&, const std::string& venue_id,
                                                         const std::string& table_tag,
                                                         const std::string& client_address) override;

  Result InsertRequest(Transaction&, const model::RequestRecord&) override;
  std::optional<model::RequestRecord> GetRequest(Transaction&, const std::string&) override;
  Result UpdateRequest(Transaction&, const model::RequestRecord&, songqueue::model::RequestStatus expected) override;
  uint64_t CountPending(Transaction&, const std::string& venue_id) override;
  uint64_t CountPendingForPatron(Transaction&, const std::string& venue_id, const std::string& patron_id) override;
  bool HasOutstanding(Transaction&, const std::string& venue_id, const std::string& patron_id,
                      const std::string& track_id) override;
  Result ShiftPendingPositions(Transaction&, const std::string& venue_id, uint32_t removed_position) override;
  std::vector<model::RequestRecord> ListPending(Transaction&, const std::string& venue_id) override;
  std::vector<model::RequestRecord> ListVenueRequests(Transaction&, const std::string& venue_id,
                                                      std::optional<songqueue::model::RequestStatus> status,
                                                      const Pagination& pagination) override;
  std::vector<model::RequestRecord> ListPatronRequests(Transaction&, const std::string& patron_id,
                                                       std::optional<songqueue::model::RequestStatus> status,
                                                       std::size_t limit) override;
  StatusCounts CountByStatus(Transaction&, const std::string& venue_id) override;
  StatusCounts CountByStatusForPatron(Transaction&, const std::string& patron_id) override;

private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
};

}
