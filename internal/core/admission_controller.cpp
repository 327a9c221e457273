#include "admission_controller.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace songqueue::core {

using songqueue::observability::Metrics;
using songqueue::observability::StringField;
using songqueue::observability::UIntField;

AdmissionController::AdmissionController(std::shared_ptr<catalog::CatalogLookup> catalog, std::shared_ptr<queue::QueueStore> store,
                                         AdmissionOptions options)
    : catalog_(std::move(catalog)), store_(std::move(store)), options_(options) {
}

Admission AdmissionController::Submit(const std::string& venue_id, const std::string& patron_id, const std::string& track_id,
                                      const std::string& display_tag) {
  if (venue_id.empty() || patron_id.empty() || track_id.empty()) {
    throw util::InvalidArgument("submit: venue, patron and track ids are required");
  }

  // Unknown venues are rejected before they get a lock table entry;
  // the check under the scope below is the authoritative one.
  catalog_->GetVenue(venue_id);

  auto scope = store_->OpenVenueScope(venue_id);

  const auto venue = catalog_->GetVenue(scope.Tx(), venue_id);
  if (!venue.active) {
    throw util::NotFound("venue is not active: " + venue_id);
  }

  const auto track = catalog_->GetTrack(scope.Tx(), track_id);
  if (!track.active || track.venue_id != venue_id) {
    throw util::NotFound("track not available at venue " + venue_id + ": " + track_id);
  }

  if (store_->PendingCountForPatron(scope, patron_id) >= venue.max_requests_per_patron) {
    Metrics::Instance().RecordAdmission("patron_limit");
    throw util::LimitExceeded(util::LimitScope::kPatron, "patron request limit reached (" +
                                                             std::to_string(venue.max_requests_per_patron) + ")");
  }

  const auto pending = store_->PendingCount(scope);
  if (pending >= venue.queue_limit) {
    Metrics::Instance().RecordAdmission("queue_limit");
    throw util::LimitExceeded(util::LimitScope::kQueue, "venue queue is full (" + std::to_string(venue.queue_limit) + ")");
  }

  if (store_->HasOutstanding(scope, patron_id, track_id)) {
    Metrics::Instance().RecordAdmission("duplicate");
    throw util::Duplicate("track already requested by patron: " + track_id);
  }

  db::model::RequestRecord request;
  request.id              = util::NewId();
  request.venue_id        = venue_id;
  request.patron_id       = patron_id;
  request.track_id        = track_id;
  request.display_tag     = display_tag;
  request.submitted_at_ms = util::NowMillis();

  request = store_->Append(scope, std::move(request));
  scope.Commit();

  Metrics::Instance().RecordAdmission("admitted");
  Metrics::Instance().SetQueueDepth(venue_id, pending + 1);
  SONGQUEUE_LOG_INFO("request admitted", {StringField("request_id", request.id), StringField("venue_id", venue_id),
                                          StringField("patron_id", patron_id), StringField("track_id", track_id),
                                          UIntField("position", request.queue_position)});

  Admission admission;
  admission.estimated_wait_minutes = request.queue_position * options_.average_track_minutes;
  admission.request                = std::move(request);
  return admission;
}

} // namespace songqueue::core
