#pragma once

#include <memory>
#include <string>

#include "internal/catalog/catalog_lookup.hpp"
#include "internal/core/admission_controller.hpp"
#include "internal/core/queue_reader.hpp"
#include "internal/core/request_state_machine.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/queue/queue_store.hpp"
#include "internal/session/session_resolver.hpp"

namespace songqueue::testing {

// Core components wired over one repository, as the factory does.
struct Harness {
  explicit Harness(std::shared_ptr<db::Repository> repo = std::make_shared<db::memory::MemoryRepository>())
      : repository(std::move(repo)),
        catalog(std::make_shared<catalog::CatalogLookup>(repository)),
        sessions(std::make_shared<session::SessionResolver>(repository)),
        store(std::make_shared<queue::QueueStore>(repository)),
        admission(std::make_shared<core::AdmissionController>(catalog, store)),
        state_machine(std::make_shared<core::RequestStateMachine>(store)),
        reader(std::make_shared<core::QueueReader>(repository)) {
  }

  db::model::VenueRecord AddVenue(const std::string& id, uint32_t max_per_patron, uint32_t queue_limit, bool active = true) {
    db::model::VenueRecord venue;
    venue.id                      = id;
    venue.name                    = "Venue " + id;
    venue.active                  = active;
    venue.max_requests_per_patron = max_per_patron;
    venue.queue_limit             = queue_limit;
    return catalog->UpsertVenue(venue);
  }

  db::model::TrackRecord AddTrack(const std::string& id, const std::string& venue_id, bool active = true) {
    db::model::TrackRecord track;
    track.id       = id;
    track.venue_id = venue_id;
    track.active   = active;
    track.title    = "Title " + id;
    track.artist   = "Artist";
    return catalog->UpsertTrack(track);
  }

  std::string Patron(const std::string& venue_id, const std::string& table_tag) {
    session::CallerIdentity caller;
    caller.table_tag = table_tag;
    return sessions->ResolvePatron(caller, venue_id);
  }

  db::model::RequestRecord Submit(const std::string& venue_id, const std::string& patron_id, const std::string& track_id) {
    return admission->Submit(venue_id, patron_id, track_id, "table").request;
  }

  db::model::RequestRecord Staff(const std::string& request_id, const std::string& venue_id, songqueue::model::RequestStatus target) {
    core::TransitionCommand command;
    command.request_id     = request_id;
    command.target         = target;
    command.actor          = core::Actor::kStaff;
    command.staff_venue_id = venue_id;
    return state_machine->Transition(command);
  }

  std::shared_ptr<db::Repository>            repository;
  std::shared_ptr<catalog::CatalogLookup>    catalog;
  std::shared_ptr<session::SessionResolver>  sessions;
  std::shared_ptr<queue::QueueStore>         store;
  std::shared_ptr<core::AdmissionController> admission;
  std::shared_ptr<core::RequestStateMachine> state_machine;
  std::shared_ptr<core::QueueReader>         reader;
};

// Runs fn and reports whether it threw E.
template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

// Pending positions of a venue are exactly 1..N in list order.
inline bool DensePositions(const std::vector<db::model::RequestRecord>& pending) {
  for (std::size_t i = 0; i < pending.size(); ++i) {
    if (pending[i].queue_position != i + 1) {
      return false;
    }
  }
  return true;
}

} // namespace songqueue::testing
