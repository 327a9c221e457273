#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include "songqueue/v1/catalog_service.grpc.pb.h"
#include "songqueue/v1/request_service.grpc.pb.h"
#include "api/songqueue/v1.hpp"

using namespace songqueue::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  songqueuectl <addr> venue-put <venue_id> <max_per_patron> <queue_limit> [name]\n"
            << "  songqueuectl <addr> venue-get <venue_id>\n"
            << "  songqueuectl <addr> track-put <track_id> <venue_id> [title] [artist]\n"
            << "  songqueuectl <addr> tracks <venue_id>\n"
            << "  songqueuectl <addr> submit <venue_id> <track_id> <table_tag>\n"
            << "  songqueuectl <addr> cancel <request_id> <table_tag>\n"
            << "  songqueuectl <addr> transition <request_id> <venue_id> <status=playing|completed|cancelled>\n"
            << "  songqueuectl <addr> get <request_id>\n"
            << "  songqueuectl <addr> pending <venue_id>\n"
            << "  songqueuectl <addr> mine <venue_id> <table_tag>\n"
            << "  songqueuectl <addr> history <venue_id> [status] [page]\n"
            << "  songqueuectl <addr> counts <venue_id>\n";
}

static std::optional<RequestStatus> ParseStatus(const std::string& value) {
  if (value == "pending") return REQUEST_STATUS_PENDING;
  if (value == "playing") return REQUEST_STATUS_PLAYING;
  if (value == "completed") return REQUEST_STATUS_COMPLETED;
  if (value == "cancelled") return REQUEST_STATUS_CANCELLED;
  return std::nullopt;
}

static const char* StatusName(RequestStatus status) {
  switch (status) {
    case REQUEST_STATUS_PENDING:
      return "pending";
    case REQUEST_STATUS_PLAYING:
      return "playing";
    case REQUEST_STATUS_COMPLETED:
      return "completed";
    case REQUEST_STATUS_CANCELLED:
      return "cancelled";
    default:
      return "unspecified";
  }
}

static void Print(const SongRequest& r) {
  std::cout << r.id() << " status=" << StatusName(r.status()) << " position=" << r.queue_position() << " track=" << r.track_id()
            << " tag=" << r.display_tag() << "\n";
}

static void Print(const StatusCounts& c) {
  std::cout << "pending=" << c.pending() << " playing=" << c.playing() << " completed=" << c.completed()
            << " cancelled=" << c.cancelled() << " total=" << c.total() << "\n";
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_code() << ": " << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto request_stub = SongRequestService::NewStub(channel);
  auto catalog_stub = VenueCatalogService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "venue-put") {
    if (argc < 6) return 1;

    UpsertVenueRequest req;
    auto*              venue = req.mutable_venue();
    venue->set_id(argv[3]);
    venue->set_active(true);
    venue->set_max_requests_per_patron(static_cast<uint32_t>(std::stoul(argv[4])));
    venue->set_queue_limit(static_cast<uint32_t>(std::stoul(argv[5])));
    if (argc >= 7) venue->set_name(argv[6]);

    UpsertVenueResponse resp;
    auto                status = catalog_stub->UpsertVenue(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "venue=" << resp.venue().id() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "venue-get") {
    if (argc < 4) return 1;

    GetVenueRequest req;
    req.set_venue_id(argv[3]);

    GetVenueResponse resp;
    auto             status = catalog_stub->GetVenue(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    const auto& v = resp.venue();
    std::cout << v.id() << " name=" << v.name() << " active=" << v.active() << " max_per_patron=" << v.max_requests_per_patron()
              << " queue_limit=" << v.queue_limit() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "track-put") {
    if (argc < 5) return 1;

    UpsertTrackRequest req;
    auto*              track = req.mutable_track();
    track->set_id(argv[3]);
    track->set_venue_id(argv[4]);
    track->set_active(true);
    if (argc >= 6) track->set_title(argv[5]);
    if (argc >= 7) track->set_artist(argv[6]);

    UpsertTrackResponse resp;
    auto                status = catalog_stub->UpsertTrack(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "track=" << resp.track().id() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "tracks") {
    if (argc < 4) return 1;

    ListTracksRequest req;
    req.set_venue_id(argv[3]);

    ListTracksResponse resp;
    auto               status = catalog_stub->ListTracks(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& t : resp.tracks()) {
      std::cout << t.id() << " " << t.artist() << " - " << t.title() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "submit") {
    if (argc < 6) return 1;

    SubmitRequest req;
    req.set_venue_id(argv[3]);
    req.set_track_id(argv[4]);
    req.mutable_caller()->set_table_tag(argv[5]);

    SubmitResponse resp;
    auto           status = request_stub->Submit(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    Print(resp.request());
    std::cout << "estimated_wait_minutes=" << resp.estimated_wait_minutes() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "cancel") {
    if (argc < 5) return 1;

    CancelRequest req;
    req.set_request_id(argv[3]);
    req.mutable_caller()->set_table_tag(argv[4]);

    CancelResponse resp;
    auto           status = request_stub->Cancel(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    Print(resp.request());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "transition") {
    if (argc < 6) return 1;

    auto target = ParseStatus(argv[5]);
    if (!target.has_value()) {
      std::cerr << "unsupported status: " << argv[5] << "\n";
      return 1;
    }

    TransitionRequest req;
    req.set_request_id(argv[3]);
    req.set_staff_venue_id(argv[4]);
    req.set_actor(ACTOR_STAFF);
    req.set_target(target.value());

    TransitionResponse resp;
    auto               status = request_stub->Transition(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    Print(resp.request());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "get") {
    if (argc < 4) return 1;

    GetRequestRequest req;
    req.set_request_id(argv[3]);

    GetRequestResponse resp;
    auto               status = request_stub->GetRequest(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    Print(resp.request());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "pending") {
    if (argc < 4) return 1;

    ListPendingRequest req;
    req.set_venue_id(argv[3]);

    ListPendingResponse resp;
    auto                status = request_stub->ListPending(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& r : resp.requests()) Print(r);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "mine") {
    if (argc < 5) return 1;

    ListByPatronRequest req;
    req.set_venue_id(argv[3]);
    req.mutable_caller()->set_table_tag(argv[4]);

    ListByPatronResponse resp;
    auto                 status = request_stub->ListByPatron(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& r : resp.requests()) Print(r);
    Print(resp.counts());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "history") {
    if (argc < 4) return 1;

    ListVenueRequestsRequest req;
    req.set_venue_id(argv[3]);
    if (argc >= 5 && std::string(argv[4]) != "all") {
      auto parsed = ParseStatus(argv[4]);
      if (!parsed.has_value()) {
        std::cerr << "unsupported status: " << argv[4] << "\n";
        return 1;
      }
      req.set_status(parsed.value());
    }
    if (argc >= 6) req.set_page(static_cast<uint32_t>(std::stoul(argv[5])));

    ListVenueRequestsResponse resp;
    auto                      status = request_stub->ListVenueRequests(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& r : resp.requests()) Print(r);
    std::cout << "page=" << resp.page().page() << "/" << resp.page().total_pages() << " total=" << resp.page().total() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "counts") {
    if (argc < 4) return 1;

    GetStatusCountsRequest req;
    req.set_venue_id(argv[3]);

    GetStatusCountsResponse resp;
    auto                    status = request_stub->GetStatusCounts(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    Print(resp.counts());
    return 0;
  }

  Usage();
  return 1;
}
