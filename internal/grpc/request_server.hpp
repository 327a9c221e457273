#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "songqueue/v1/request_service.grpc.pb.h"
#include "internal/service/request_service.hpp"

namespace songqueue::grpc {

class RequestServer final : public songqueue::v1::SongRequestService::Service {
public:
  explicit RequestServer(std::shared_ptr<songqueue::service::RequestService> svc);

  ::grpc::Status Submit(::grpc::ServerContext*, const songqueue::v1::SubmitRequest*, songqueue::v1::SubmitResponse*) override;

  ::grpc::Status Transition(::grpc::ServerContext*, const songqueue::v1::TransitionRequest*,
                            songqueue::v1::TransitionResponse*) override;

  ::grpc::Status Cancel(::grpc::ServerContext*, const songqueue::v1::CancelRequest*, songqueue::v1::CancelResponse*) override;

  ::grpc::Status GetRequest(::grpc::ServerContext*, const songqueue::v1::GetRequestRequest*,
                            songqueue::v1::GetRequestResponse*) override;

  ::grpc::Status ListPending(::grpc::ServerContext*, const songqueue::v1::ListPendingRequest*,
                             songqueue::v1::ListPendingResponse*) override;

  ::grpc::Status ListByPatron(::grpc::ServerContext*, const songqueue::v1::ListByPatronRequest*,
                              songqueue::v1::ListByPatronResponse*) override;

  ::grpc::Status ListVenueRequests(::grpc::ServerContext*, const songqueue::v1::ListVenueRequestsRequest*,
                                   songqueue::v1::ListVenueRequestsResponse*) override;

  ::grpc::Status GetStatusCounts(::grpc::ServerContext*, const songqueue::v1::GetStatusCountsRequest*,
                                 songqueue::v1::GetStatusCountsResponse*) override;

private:
  std::shared_ptr<songqueue::service::RequestService> service_;
};

}
