#pragma once

#include "api/songqueue/v1.hpp"
#include "service_context.hpp"

namespace songqueue::service {

class RequestService {
public:
  explicit RequestService(ServiceContext ctx);

  songqueue::v1::SubmitResponse Submit(const songqueue::v1::SubmitRequest& req);

  songqueue::v1::TransitionResponse Transition(const songqueue::v1::TransitionRequest& req);

  songqueue::v1::CancelResponse Cancel(const songqueue::v1::CancelRequest& req);

  songqueue::v1::GetRequestResponse GetRequest(const songqueue::v1::GetRequestRequest& req);

  songqueue::v1::ListPendingResponse ListPending(const songqueue::v1::ListPendingRequest& req);

  songqueue::v1::ListByPatronResponse ListByPatron(const songqueue::v1::ListByPatronRequest& req);

  songqueue::v1::ListVenueRequestsResponse ListVenueRequests(const songqueue::v1::ListVenueRequestsRequest& req);

  songqueue::v1::GetStatusCountsResponse GetStatusCounts(const songqueue::v1::GetStatusCountsRequest& req);

private:
  // Patron of the caller in the venue owning request_id; PermissionDenied if unknown.
  std::string PatronForRequest(const std::string& request_id, const songqueue::v1::CallerContext& caller);

  ServiceContext ctx_;
};

}
