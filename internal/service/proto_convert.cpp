#include "proto_convert.hpp"

#include "internal/util/errors.hpp"

namespace songqueue::service {

using songqueue::model::RequestStatus;

songqueue::v1::RequestStatus ToProto(RequestStatus status) {
  switch (status) {
    case RequestStatus::kPending:
      return songqueue::v1::REQUEST_STATUS_PENDING;
    case RequestStatus::kPlaying:
      return songqueue::v1::REQUEST_STATUS_PLAYING;
    case RequestStatus::kCompleted:
      return songqueue::v1::REQUEST_STATUS_COMPLETED;
    case RequestStatus::kCancelled:
      return songqueue::v1::REQUEST_STATUS_CANCELLED;
  }
  return songqueue::v1::REQUEST_STATUS_UNSPECIFIED;
}

std::optional<RequestStatus> FromProto(songqueue::v1::RequestStatus status) {
  switch (status) {
    case songqueue::v1::REQUEST_STATUS_UNSPECIFIED:
      return std::nullopt;
    case songqueue::v1::REQUEST_STATUS_PENDING:
      return RequestStatus::kPending;
    case songqueue::v1::REQUEST_STATUS_PLAYING:
      return RequestStatus::kPlaying;
    case songqueue::v1::REQUEST_STATUS_COMPLETED:
      return RequestStatus::kCompleted;
    case songqueue::v1::REQUEST_STATUS_CANCELLED:
      return RequestStatus::kCancelled;
    default:
      throw util::InvalidArgument("unknown request status " + std::to_string(static_cast<int>(status)));
  }
}

songqueue::v1::SongRequest ToProto(const db::model::RequestRecord& record) {
  songqueue::v1::SongRequest out;
  out.set_id(record.id);
  out.set_venue_id(record.venue_id);
  out.set_patron_id(record.patron_id);
  out.set_track_id(record.track_id);
  out.set_status(ToProto(record.status));
  out.set_queue_position(record.queue_position);
  out.set_display_tag(record.display_tag);
  out.set_submitted_at_ms(record.submitted_at_ms);
  out.set_started_at_ms(record.started_at_ms);
  out.set_completed_at_ms(record.completed_at_ms);
  out.set_cancelled_at_ms(record.cancelled_at_ms);
  return out;
}

songqueue::v1::Venue ToProto(const db::model::VenueRecord& record) {
  songqueue::v1::Venue out;
  out.set_id(record.id);
  out.set_name(record.name);
  out.set_active(record.active);
  out.set_max_requests_per_patron(record.max_requests_per_patron);
  out.set_queue_limit(record.queue_limit);
  return out;
}

songqueue::v1::Track ToProto(const db::model::TrackRecord& record) {
  songqueue::v1::Track out;
  out.set_id(record.id);
  out.set_venue_id(record.venue_id);
  out.set_active(record.active);
  out.set_title(record.title);
  out.set_artist(record.artist);
  out.set_duration_sec(record.duration_sec);
  return out;
}

songqueue::v1::StatusCounts ToProto(const db::StatusCounts& counts) {
  songqueue::v1::StatusCounts out;
  out.set_pending(counts.pending);
  out.set_playing(counts.playing);
  out.set_completed(counts.completed);
  out.set_cancelled(counts.cancelled);
  out.set_total(counts.Total());
  return out;
}

db::model::VenueRecord FromProto(const songqueue::v1::Venue& venue) {
  db::model::VenueRecord record;
  record.id                      = venue.id();
  record.name                    = venue.name();
  record.active                  = venue.active();
  record.max_requests_per_patron = venue.max_requests_per_patron();
  record.queue_limit             = venue.queue_limit();
  return record;
}

db::model::TrackRecord FromProto(const songqueue::v1::Track& track) {
  db::model::TrackRecord record;
  record.id           = track.id();
  record.venue_id     = track.venue_id();
  record.active       = track.active();
  record.title        = track.title();
  record.artist       = track.artist();
  record.duration_sec = track.duration_sec();
  return record;
}

session::CallerIdentity FromProto(const songqueue::v1::CallerContext& caller) {
  session::CallerIdentity identity;
  identity.account_id     = caller.account_id();
  identity.table_tag      = caller.table_tag();
  identity.client_address = caller.client_address();
  return identity;
}

} // namespace songqueue::service
