#include "request_server.hpp"
#include "grpc_error.hpp"

namespace songqueue::grpc {

using namespace songqueue::v1;

namespace {

template <typename Fn>
::grpc::Status Handle(Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace

RequestServer::RequestServer(std::shared_ptr<songqueue::service::RequestService> svc) : service_(std::move(svc)) {}

::grpc::Status RequestServer::Submit(::grpc::ServerContext*, const SubmitRequest* req, SubmitResponse* resp) {
  return Handle([&] { *resp = service_->Submit(*req); });
}

::grpc::Status RequestServer::Transition(::grpc::ServerContext*, const TransitionRequest* req, TransitionResponse* resp) {
  return Handle([&] { *resp = service_->Transition(*req); });
}

::grpc::Status RequestServer::Cancel(::grpc::ServerContext*, const CancelRequest* req, CancelResponse* resp) {
  return Handle([&] { *resp = service_->Cancel(*req); });
}

::grpc::Status RequestServer::GetRequest(::grpc::ServerContext*, const GetRequestRequest* req, GetRequestResponse* resp) {
  return Handle([&] { *resp = service_->GetRequest(*req); });
}

::grpc::Status RequestServer::ListPending(::grpc::ServerContext*, const ListPendingRequest* req, ListPendingResponse* resp) {
  return Handle([&] { *resp = service_->ListPending(*req); });
}

::grpc::Status RequestServer::ListByPatron(::grpc::ServerContext*, const ListByPatronRequest* req, ListByPatronResponse* resp) {
  return Handle([&] { *resp = service_->ListByPatron(*req); });
}

::grpc::Status RequestServer::ListVenueRequests(::grpc::ServerContext*, const ListVenueRequestsRequest* req,
                                                ListVenueRequestsResponse* resp) {
  return Handle([&] { *resp = service_->ListVenueRequests(*req); });
}

::grpc::Status RequestServer::GetStatusCounts(::grpc::ServerContext*, const GetStatusCountsRequest* req,
                                              GetStatusCountsResponse* resp) {
  return Handle([&] { *resp = service_->GetStatusCounts(*req); });
}

}
