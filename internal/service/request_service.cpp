#include "request_service.hpp"

#include "internal/core/admission_controller.hpp"
#include "internal/core/queue_reader.hpp"
#include "internal/core/request_state_machine.hpp"
#include "internal/session/session_resolver.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"
#include "proto_convert.hpp"

namespace songqueue::service {

using namespace songqueue::v1;

RequestService::RequestService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

std::string RequestService::PatronForRequest(const std::string& request_id, const CallerContext& caller) {
  const auto request = ctx_.reader->GetRequest(request_id);
  auto       patron  = ctx_.sessions->FindPatron(FromProto(caller), request.venue_id);
  if (!patron) {
    throw songqueue::util::PermissionDenied("caller has no patron at venue " + request.venue_id);
  }
  return *patron;
}

SubmitResponse RequestService::Submit(const SubmitRequest& req) {
  return ObserveRpc("RequestService.Submit", req.venue_id(), [&] {
    const auto patron_id   = ctx_.sessions->ResolvePatron(FromProto(req.caller()), req.venue_id());
    const auto display_tag = req.display_tag().empty() ? req.caller().table_tag() : req.display_tag();

    const auto admission = ctx_.admission->Submit(req.venue_id(), patron_id, req.track_id(), display_tag);

    SubmitResponse resp;
    *resp.mutable_request() = ToProto(admission.request);
    resp.set_estimated_wait_minutes(admission.estimated_wait_minutes);
    return resp;
  });
}

TransitionResponse RequestService::Transition(const TransitionRequest& req) {
  return ObserveRpc("RequestService.Transition", req.request_id(), [&] {
    const auto target = FromProto(req.target());
    if (!target) {
      throw songqueue::util::InvalidArgument("transition target is required");
    }

    songqueue::core::TransitionCommand command;
    command.request_id      = req.request_id();
    command.target          = *target;
    command.expected_status = FromProto(req.expected_status());

    switch (req.actor()) {
      case ACTOR_STAFF:
        command.actor          = songqueue::core::Actor::kStaff;
        command.staff_venue_id = req.staff_venue_id();
        break;
      case ACTOR_PATRON:
        command.actor     = songqueue::core::Actor::kPatron;
        command.patron_id = PatronForRequest(req.request_id(), req.caller());
        break;
      default:
        throw songqueue::util::InvalidArgument("transition actor is required");
    }

    TransitionResponse resp;
    *resp.mutable_request() = ToProto(ctx_.state_machine->Transition(command));
    return resp;
  });
}

CancelResponse RequestService::Cancel(const CancelRequest& req) {
  return ObserveRpc("RequestService.Cancel", req.request_id(), [&] {
    songqueue::core::TransitionCommand command;
    command.request_id = req.request_id();
    command.target     = songqueue::model::RequestStatus::kCancelled;
    command.actor      = songqueue::core::Actor::kPatron;
    command.patron_id  = PatronForRequest(req.request_id(), req.caller());

    CancelResponse resp;
    *resp.mutable_request() = ToProto(ctx_.state_machine->Transition(command));
    return resp;
  });
}

GetRequestResponse RequestService::GetRequest(const GetRequestRequest& req) {
  return ObserveRpc("RequestService.GetRequest", req.request_id(), [&] {
    GetRequestResponse resp;
    *resp.mutable_request() = ToProto(ctx_.reader->GetRequest(req.request_id()));
    return resp;
  });
}

ListPendingResponse RequestService::ListPending(const ListPendingRequest& req) {
  return ObserveRpc("RequestService.ListPending", req.venue_id(), [&] {
    ListPendingResponse resp;
    for (const auto& record : ctx_.reader->ListPending(req.venue_id())) {
      *resp.add_requests() = ToProto(record);
    }
    return resp;
  });
}

ListByPatronResponse RequestService::ListByPatron(const ListByPatronRequest& req) {
  return ObserveRpc("RequestService.ListByPatron", req.venue_id(), [&] {
    ListByPatronResponse resp;

    // A caller that never submitted has no patron yet and an empty history.
    const auto patron = ctx_.sessions->FindPatron(FromProto(req.caller()), req.venue_id());
    if (!patron) {
      *resp.mutable_counts() = ToProto(songqueue::db::StatusCounts{});
      return resp;
    }

    resp.set_patron_id(*patron);
    for (const auto& record : ctx_.reader->ListByPatron(*patron, FromProto(req.status()), req.limit())) {
      *resp.add_requests() = ToProto(record);
    }
    *resp.mutable_counts() = ToProto(ctx_.reader->CountByStatusForPatron(*patron));
    return resp;
  });
}

ListVenueRequestsResponse RequestService::ListVenueRequests(const ListVenueRequestsRequest& req) {
  return ObserveRpc("RequestService.ListVenueRequests", req.venue_id(), [&] {
    const auto page = ctx_.reader->ListVenueRequests(req.venue_id(), FromProto(req.status()), req.page(), req.page_size());

    ListVenueRequestsResponse resp;
    for (const auto& record : page.requests) {
      *resp.add_requests() = ToProto(record);
    }
    auto* info = resp.mutable_page();
    info->set_page(page.page);
    info->set_page_size(page.page_size);
    info->set_total(page.total);
    info->set_total_pages(page.total_pages);
    return resp;
  });
}

GetStatusCountsResponse RequestService::GetStatusCounts(const GetStatusCountsRequest& req) {
  return ObserveRpc("RequestService.GetStatusCounts", req.venue_id(), [&] {
    GetStatusCountsResponse resp;
    *resp.mutable_counts() = ToProto(ctx_.reader->CountByStatus(req.venue_id()));
    return resp;
  });
}

}
