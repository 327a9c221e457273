#include "catalog_server.hpp"
#include "grpc_error.hpp"

namespace songqueue::grpc {

using namespace songqueue::v1;

CatalogServer::CatalogServer(std::shared_ptr<songqueue::service::CatalogService> svc) : service_(std::move(svc)) {}

::grpc::Status CatalogServer::UpsertVenue(::grpc::ServerContext*, const UpsertVenueRequest* req, UpsertVenueResponse* resp) {
  try {
    *resp = service_->UpsertVenue(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CatalogServer::GetVenue(::grpc::ServerContext*, const GetVenueRequest* req, GetVenueResponse* resp) {
  try {
    *resp = service_->GetVenue(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CatalogServer::UpsertTrack(::grpc::ServerContext*, const UpsertTrackRequest* req, UpsertTrackResponse* resp) {
  try {
    *resp = service_->UpsertTrack(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CatalogServer::GetTrack(::grpc::ServerContext*, const GetTrackRequest* req, GetTrackResponse* resp) {
  try {
    *resp = service_->GetTrack(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CatalogServer::ListTracks(::grpc::ServerContext*, const ListTracksRequest* req, ListTracksResponse* resp) {
  try {
    *resp = service_->ListTracks(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
