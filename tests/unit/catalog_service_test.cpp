#include "internal/service/catalog_service.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/service/request_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/fixtures.hpp"

namespace {

using namespace songqueue::v1;
using songqueue::service::CatalogService;
using songqueue::service::RequestService;
using songqueue::service::ServiceContext;
using songqueue::testing::Harness;
using songqueue::testing::Throws;

ServiceContext BuildServiceContext(const Harness& h) {
  ServiceContext ctx;
  ctx.repository    = h.repository;
  ctx.catalog       = h.catalog;
  ctx.sessions      = h.sessions;
  ctx.store         = h.store;
  ctx.admission     = h.admission;
  ctx.state_machine = h.state_machine;
  ctx.reader        = h.reader;
  return ctx;
}

UpsertVenueRequest VenueRequest(const std::string& id, uint32_t per_patron, uint32_t limit) {
  UpsertVenueRequest req;
  req.mutable_venue()->set_id(id);
  req.mutable_venue()->set_name("Room " + id);
  req.mutable_venue()->set_active(true);
  req.mutable_venue()->set_max_requests_per_patron(per_patron);
  req.mutable_venue()->set_queue_limit(limit);
  return req;
}

UpsertTrackRequest TrackRequest(const std::string& id, const std::string& venue_id, bool active = true) {
  UpsertTrackRequest req;
  req.mutable_track()->set_id(id);
  req.mutable_track()->set_venue_id(venue_id);
  req.mutable_track()->set_active(active);
  req.mutable_track()->set_title("Title " + id);
  req.mutable_track()->set_artist("Artist");
  req.mutable_track()->set_duration_sec(215);
  return req;
}

void TestUpsertVenueValidatesAndReplaces() {
  Harness        h;
  CatalogService catalog(BuildServiceContext(h));

  assert(Throws<songqueue::util::InvalidArgument>([&] { catalog.UpsertVenue(VenueRequest("", 1, 10)); }));
  assert(Throws<songqueue::util::InvalidArgument>([&] { catalog.UpsertVenue(VenueRequest("V", 0, 10)); }));
  assert(Throws<songqueue::util::InvalidArgument>([&] { catalog.UpsertVenue(VenueRequest("V", 1, 0)); }));

  catalog.UpsertVenue(VenueRequest("V", 1, 10));
  auto updated = catalog.UpsertVenue(VenueRequest("V", 3, 40));
  assert(updated.venue().max_requests_per_patron() == 3);

  GetVenueRequest get;
  get.set_venue_id("V");
  auto venue = catalog.GetVenue(get).venue();
  assert(venue.name() == "Room V");
  assert(venue.max_requests_per_patron() == 3);
  assert(venue.queue_limit() == 40);

  get.set_venue_id("nope");
  assert(Throws<songqueue::util::NotFound>([&] { catalog.GetVenue(get); }));
}

void TestUpsertTrackRequiresVenue() {
  Harness        h;
  CatalogService catalog(BuildServiceContext(h));

  assert(Throws<songqueue::util::InvalidArgument>([&] { catalog.UpsertTrack(TrackRequest("T1", "")); }));
  assert(Throws<songqueue::util::NotFound>([&] { catalog.UpsertTrack(TrackRequest("T1", "ghost")); }));

  catalog.UpsertVenue(VenueRequest("V", 1, 10));
  auto track = catalog.UpsertTrack(TrackRequest("T1", "V")).track();
  assert(track.duration_sec() == 215);

  GetTrackRequest get;
  get.set_track_id("T1");
  assert(catalog.GetTrack(get).track().artist() == "Artist");
}

void TestListTracksFiltersInactive() {
  Harness        h;
  CatalogService catalog(BuildServiceContext(h));
  catalog.UpsertVenue(VenueRequest("V", 1, 10));
  catalog.UpsertVenue(VenueRequest("W", 1, 10));

  catalog.UpsertTrack(TrackRequest("T1", "V"));
  catalog.UpsertTrack(TrackRequest("T2", "V", false));
  catalog.UpsertTrack(TrackRequest("T3", "W"));

  ListTracksRequest list;
  list.set_venue_id("V");
  auto active = catalog.ListTracks(list);
  assert(active.tracks_size() == 1);
  assert(active.tracks(0).id() == "T1");

  list.set_include_inactive(true);
  assert(catalog.ListTracks(list).tracks_size() == 2);

  list.set_venue_id("missing");
  assert(Throws<songqueue::util::NotFound>([&] { catalog.ListTracks(list); }));
}

void TestDeactivatedTrackIsNotRequestable() {
  Harness        h;
  CatalogService catalog(BuildServiceContext(h));
  RequestService requests(BuildServiceContext(h));
  catalog.UpsertVenue(VenueRequest("V", 2, 10));
  catalog.UpsertTrack(TrackRequest("T1", "V"));

  SubmitRequest submit;
  submit.set_venue_id("V");
  submit.set_track_id("T1");
  submit.mutable_caller()->set_table_tag("table 9");
  assert(requests.Submit(submit).request().queue_position() == 1);

  catalog.UpsertTrack(TrackRequest("T1", "V", false));
  submit.mutable_caller()->set_table_tag("table 10");
  assert(Throws<songqueue::util::NotFound>([&] { requests.Submit(submit); }));

  // Deactivating the venue closes it to every track.
  catalog.UpsertTrack(TrackRequest("T1", "V", true));
  auto closed = VenueRequest("V", 2, 10);
  closed.mutable_venue()->set_active(false);
  catalog.UpsertVenue(closed);
  assert(Throws<songqueue::util::NotFound>([&] { requests.Submit(submit); }));
}

} // namespace

int main() {
  TestUpsertVenueValidatesAndReplaces();
  TestUpsertTrackRequiresVenue();
  TestListTracksFiltersInactive();
  TestDeactivatedTrackIsNotRequestable();

  std::cout << "songqueue_unit_catalog_service: pass\n";
  return 0;
}
