#pragma once

#include "api/songqueue/v1.hpp"
#include "service_context.hpp"

namespace songqueue::service {

class CatalogService {
public:
  explicit CatalogService(ServiceContext ctx);

  songqueue::v1::UpsertVenueResponse UpsertVenue(const songqueue::v1::UpsertVenueRequest& req);

  songqueue::v1::GetVenueResponse GetVenue(const songqueue::v1::GetVenueRequest& req);

  songqueue::v1::UpsertTrackResponse UpsertTrack(const songqueue::v1::UpsertTrackRequest& req);

  songqueue::v1::GetTrackResponse GetTrack(const songqueue::v1::GetTrackRequest& req);

  songqueue::v1::ListTracksResponse ListTracks(const songqueue::v1::ListTracksRequest& req);

private:
  ServiceContext ctx_;
};

}
