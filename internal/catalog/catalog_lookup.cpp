#include "catalog_lookup.hpp"

#include "internal/db/api/error_translation.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace songqueue::catalog {

using songqueue::observability::StringField;
using songqueue::observability::UIntField;

CatalogLookup::CatalogLookup(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

db::model::VenueRecord CatalogLookup::GetVenue(const std::string& venue_id) {
  return db::WithStorage("get venue", [&] {
    auto tx = repository_->Begin();
    return GetVenue(*tx, venue_id);
  });
}

db::model::TrackRecord CatalogLookup::GetTrack(const std::string& track_id) {
  return db::WithStorage("get track", [&] {
    auto tx = repository_->Begin();
    return GetTrack(*tx, track_id);
  });
}

db::model::VenueRecord CatalogLookup::GetVenue(db::Transaction& tx, const std::string& venue_id) {
  auto venue = db::WithStorage("get venue", [&] { return repository_->GetVenue(tx, venue_id); });
  if (!venue) {
    throw util::NotFound("venue not found: " + venue_id);
  }
  return *venue;
}

db::model::TrackRecord CatalogLookup::GetTrack(db::Transaction& tx, const std::string& track_id) {
  auto track = db::WithStorage("get track", [&] { return repository_->GetTrack(tx, track_id); });
  if (!track) {
    throw util::NotFound("track not found: " + track_id);
  }
  return *track;
}

std::vector<db::model::TrackRecord> CatalogLookup::ListTracks(const std::string& venue_id, bool include_inactive) {
  return db::WithStorage("list tracks", [&] {
    auto tx = repository_->Begin();
    GetVenue(*tx, venue_id);

    auto tracks = repository_->ListTracks(*tx, venue_id);
    if (!include_inactive) {
      std::erase_if(tracks, [](const auto& track) { return !track.active; });
    }
    return tracks;
  });
}

db::model::VenueRecord CatalogLookup::UpsertVenue(const db::model::VenueRecord& venue) {
  if (venue.id.empty()) {
    throw util::InvalidArgument("venue id is required");
  }
  if (venue.max_requests_per_patron == 0 || venue.queue_limit == 0) {
    throw util::InvalidArgument("venue limits must be at least 1");
  }

  db::WithStorage("upsert venue", [&] {
    auto tx = repository_->Begin();
    db::ThrowIfDbError(repository_->UpsertVenue(*tx, venue), "upsert venue");
    tx->Commit();
  });

  SONGQUEUE_LOG_INFO("venue upserted", {StringField("venue_id", venue.id), UIntField("max_requests_per_patron", venue.max_requests_per_patron),
                                        UIntField("queue_limit", venue.queue_limit)});
  return venue;
}

db::model::TrackRecord CatalogLookup::UpsertTrack(const db::model::TrackRecord& track) {
  if (track.id.empty() || track.venue_id.empty()) {
    throw util::InvalidArgument("track id and venue id are required");
  }

  db::WithStorage("upsert track", [&] {
    auto tx = repository_->Begin();
    GetVenue(*tx, track.venue_id);
    db::ThrowIfDbError(repository_->UpsertTrack(*tx, track), "upsert track");
    tx->Commit();
  });

  SONGQUEUE_LOG_INFO("track upserted", {StringField("track_id", track.id), StringField("venue_id", track.venue_id)});
  return track;
}

} // namespace songqueue::catalog
