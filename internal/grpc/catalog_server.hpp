#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "songqueue/v1/catalog_service.grpc.pb.h"
#include "internal/service/catalog_service.hpp"

namespace songqueue::grpc {

class CatalogServer final : public songqueue::v1::VenueCatalogService::Service {
public:
  explicit CatalogServer(std::shared_ptr<songqueue::service::CatalogService> svc);

  ::grpc::Status UpsertVenue(::grpc::ServerContext*, const songqueue::v1::UpsertVenueRequest*,
                             songqueue::v1::UpsertVenueResponse*) override;

  ::grpc::Status GetVenue(::grpc::ServerContext*, const songqueue::v1::GetVenueRequest*, songqueue::v1::GetVenueResponse*) override;

  ::grpc::Status UpsertTrack(::grpc::ServerContext*, const songqueue::v1::UpsertTrackRequest*,
                             songqueue::v1::UpsertTrackResponse*) override;

  ::grpc::Status GetTrack(::grpc::ServerContext*, const songqueue::v1::GetTrackRequest*, songqueue::v1::GetTrackResponse*) override;

  ::grpc::Status ListTracks(::grpc::ServerContext*, const songqueue::v1::ListTracksRequest*,
                            songqueue::v1::ListTracksResponse*) override;

private:
  std::shared_ptr<songqueue::service::CatalogService> service_;
};

}
