#include "catalog_service.hpp"

#include "internal/catalog/catalog_lookup.hpp"
#include "observe_rpc.hpp"
#include "proto_convert.hpp"

namespace songqueue::service {

using namespace songqueue::v1;

CatalogService::CatalogService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

UpsertVenueResponse CatalogService::UpsertVenue(const UpsertVenueRequest& req) {
  return ObserveRpc("CatalogService.UpsertVenue", req.venue().id(), [&] {
    UpsertVenueResponse resp;
    *resp.mutable_venue() = ToProto(ctx_.catalog->UpsertVenue(FromProto(req.venue())));
    return resp;
  });
}

GetVenueResponse CatalogService::GetVenue(const GetVenueRequest& req) {
  return ObserveRpc("CatalogService.GetVenue", req.venue_id(), [&] {
    GetVenueResponse resp;
    *resp.mutable_venue() = ToProto(ctx_.catalog->GetVenue(req.venue_id()));
    return resp;
  });
}

UpsertTrackResponse CatalogService::UpsertTrack(const UpsertTrackRequest& req) {
  return ObserveRpc("CatalogService.UpsertTrack", req.track().id(), [&] {
    UpsertTrackResponse resp;
    *resp.mutable_track() = ToProto(ctx_.catalog->UpsertTrack(FromProto(req.track())));
    return resp;
  });
}

GetTrackResponse CatalogService::GetTrack(const GetTrackRequest& req) {
  return ObserveRpc("CatalogService.GetTrack", req.track_id(), [&] {
    GetTrackResponse resp;
    *resp.mutable_track() = ToProto(ctx_.catalog->GetTrack(req.track_id()));
    return resp;
  });
}

ListTracksResponse CatalogService::ListTracks(const ListTracksRequest& req) {
  return ObserveRpc("CatalogService.ListTracks", req.venue_id(), [&] {
    ListTracksResponse resp;
    for (const auto& track : ctx_.catalog->ListTracks(req.venue_id(), req.include_inactive())) {
      *resp.add_tracks() = ToProto(track);
    }
    return resp;
  });
}

}
