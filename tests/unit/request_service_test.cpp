#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "api/songqueue/v1.hpp"
#include "internal/service/catalog_service.hpp"
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

ServiceContext ContextOf(const Harness& h) {
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

void SeedCatalog(CatalogService& catalog) {
  UpsertVenueRequest venue;
  venue.mutable_venue()->set_id("V");
  venue.mutable_venue()->set_name("The Venue");
  venue.mutable_venue()->set_active(true);
  venue.mutable_venue()->set_max_requests_per_patron(2);
  venue.mutable_venue()->set_queue_limit(50);
  assert(catalog.UpsertVenue(venue).venue().name() == "The Venue");

  for (const auto* id : {"T1", "T2", "T3"}) {
    UpsertTrackRequest track;
    track.mutable_track()->set_id(id);
    track.mutable_track()->set_venue_id("V");
    track.mutable_track()->set_active(true);
    track.mutable_track()->set_title(std::string("Song ") + id);
    catalog.UpsertTrack(track);
  }
}

SubmitRequest SubmitFrom(const std::string& table, const std::string& track) {
  SubmitRequest req;
  req.set_venue_id("V");
  req.set_track_id(track);
  req.mutable_caller()->set_table_tag(table);
  return req;
}

void TestSubmitResolvesPatronAndDefaultsDisplayTag() {
  Harness        h;
  CatalogService catalog(ContextOf(h));
  RequestService requests(ContextOf(h));
  SeedCatalog(catalog);

  const auto first  = requests.Submit(SubmitFrom("table 4", "T1"));
  const auto second = requests.Submit(SubmitFrom("table 4", "T2"));

  assert(first.request().status() == REQUEST_STATUS_PENDING);
  assert(first.request().queue_position() == 1);
  assert(first.request().display_tag() == "table 4");
  assert(first.estimated_wait_minutes() == 3);
  assert(second.request().patron_id() == first.request().patron_id());
  assert(second.request().queue_position() == 2);
}

void TestStaffTransitionAndPatronCancel() {
  Harness        h;
  CatalogService catalog(ContextOf(h));
  RequestService requests(ContextOf(h));
  SeedCatalog(catalog);

  const auto a = requests.Submit(SubmitFrom("A", "T1")).request();
  const auto b = requests.Submit(SubmitFrom("B", "T2")).request();

  TransitionRequest play;
  play.set_request_id(a.id());
  play.set_target(REQUEST_STATUS_PLAYING);
  play.set_actor(ACTOR_STAFF);
  play.set_staff_venue_id("V");
  play.set_expected_status(REQUEST_STATUS_PENDING);
  const auto playing = requests.Transition(play).request();
  assert(playing.status() == REQUEST_STATUS_PLAYING);
  assert(playing.queue_position() == 0);

  // Table A cannot cancel table B's request.
  CancelRequest steal;
  steal.set_request_id(b.id());
  steal.mutable_caller()->set_table_tag("A");
  assert(Throws<songqueue::util::PermissionDenied>([&] { requests.Cancel(steal); }));

  // A stranger has no patron at the venue at all.
  CancelRequest stranger;
  stranger.set_request_id(b.id());
  stranger.mutable_caller()->set_table_tag("Z");
  assert(Throws<songqueue::util::PermissionDenied>([&] { requests.Cancel(stranger); }));

  CancelRequest own;
  own.set_request_id(b.id());
  own.mutable_caller()->set_table_tag("B");
  assert(requests.Cancel(own).request().status() == REQUEST_STATUS_CANCELLED);

  ListPendingRequest list;
  list.set_venue_id("V");
  assert(requests.ListPending(list).requests_size() == 0);
}

void TestTransitionArgumentValidation() {
  Harness        h;
  CatalogService catalog(ContextOf(h));
  RequestService requests(ContextOf(h));
  SeedCatalog(catalog);
  const auto a = requests.Submit(SubmitFrom("A", "T1")).request();

  TransitionRequest missing_target;
  missing_target.set_request_id(a.id());
  missing_target.set_actor(ACTOR_STAFF);
  missing_target.set_staff_venue_id("V");
  assert(Throws<songqueue::util::InvalidArgument>([&] { requests.Transition(missing_target); }));

  TransitionRequest missing_actor;
  missing_actor.set_request_id(a.id());
  missing_actor.set_target(REQUEST_STATUS_CANCELLED);
  assert(Throws<songqueue::util::InvalidArgument>([&] { requests.Transition(missing_actor); }));

  TransitionRequest bogus_status;
  bogus_status.set_request_id(a.id());
  bogus_status.set_actor(ACTOR_STAFF);
  bogus_status.set_staff_venue_id("V");
  bogus_status.set_target(static_cast<RequestStatus>(42));
  assert(Throws<songqueue::util::InvalidArgument>([&] { requests.Transition(bogus_status); }));
}

void TestPatronViews() {
  Harness        h;
  CatalogService catalog(ContextOf(h));
  RequestService requests(ContextOf(h));
  SeedCatalog(catalog);

  ListByPatronRequest unknown;
  unknown.set_venue_id("V");
  unknown.mutable_caller()->set_table_tag("A");
  const auto empty = requests.ListByPatron(unknown);
  assert(empty.patron_id().empty());
  assert(empty.requests_size() == 0);
  assert(empty.counts().total() == 0);

  requests.Submit(SubmitFrom("A", "T1"));
  requests.Submit(SubmitFrom("A", "T2"));
  requests.Submit(SubmitFrom("B", "T3"));

  const auto mine = requests.ListByPatron(unknown);
  assert(!mine.patron_id().empty());
  assert(mine.requests_size() == 2);
  assert(mine.requests(0).track_id() == "T2");
  assert(mine.counts().pending() == 2);

  GetStatusCountsRequest counts;
  counts.set_venue_id("V");
  assert(requests.GetStatusCounts(counts).counts().pending() == 3);

  ListVenueRequestsRequest page;
  page.set_venue_id("V");
  page.set_page_size(2);
  const auto venue_page = requests.ListVenueRequests(page);
  assert(venue_page.requests_size() == 2);
  assert(venue_page.page().total() == 3);
  assert(venue_page.page().total_pages() == 2);

  GetRequestRequest get;
  get.set_request_id(mine.requests(0).id());
  assert(requests.GetRequest(get).request().track_id() == "T2");
}

void TestCatalogViews() {
  Harness        h;
  CatalogService catalog(ContextOf(h));
  SeedCatalog(catalog);

  GetVenueRequest venue;
  venue.set_venue_id("V");
  assert(catalog.GetVenue(venue).venue().queue_limit() == 50);

  GetTrackRequest track;
  track.set_track_id("T2");
  assert(catalog.GetTrack(track).track().title() == "Song T2");

  ListTracksRequest tracks;
  tracks.set_venue_id("V");
  assert(catalog.ListTracks(tracks).tracks_size() == 3);

  track.set_track_id("missing");
  assert(Throws<songqueue::util::NotFound>([&] { catalog.GetTrack(track); }));
}

} // namespace

int main() {
  TestSubmitResolvesPatronAndDefaultsDisplayTag();
  TestStaffTransitionAndPatronCancel();
  TestTransitionArgumentValidation();
  TestPatronViews();
  TestCatalogViews();

  std::cout << "songqueue_unit_request_service: pass\n";
  return 0;
}
