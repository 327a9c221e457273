#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace songqueue::catalog {

/*
  Venue and track records.

  Records are immutable from the point of view of admission; the upsert
  calls exist so a stand-alone deployment can seed its catalog.
  Lookups of absent ids throw util::NotFound.
*/
class CatalogLookup {
 public:
  explicit CatalogLookup(std::shared_ptr<db::Repository> repository);

  db::model::VenueRecord GetVenue(const std::string& venue_id);
  db::model::TrackRecord GetTrack(const std::string& track_id);

  // Same lookups inside an open unit of work.
  db::model::VenueRecord GetVenue(db::Transaction& tx, const std::string& venue_id);
  db::model::TrackRecord GetTrack(db::Transaction& tx, const std::string& track_id);

  std::vector<db::model::TrackRecord> ListTracks(const std::string& venue_id, bool include_inactive);

  db::model::VenueRecord UpsertVenue(const db::model::VenueRecord& venue);
  db::model::TrackRecord UpsertTrack(const db::model::TrackRecord& track);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace songqueue::catalog
