#include "request_state_machine.hpp"

#include <algorithm>

#include "internal/db/api/error_translation.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace songqueue::core {

using songqueue::model::RequestStatus;
using songqueue::observability::Metrics;
using songqueue::observability::StringField;
using songqueue::observability::UIntField;

namespace {

std::string Describe(RequestStatus from, RequestStatus to) {
  return std::string(songqueue::model::ToString(from)) + " -> " + std::string(songqueue::model::ToString(to));
}

void Stamp(db::model::RequestRecord& r, RequestStatus target) {
  const auto now = std::max({util::NowMillis(), r.submitted_at_ms, r.started_at_ms});
  switch (target) {
    case RequestStatus::kPlaying:
      r.started_at_ms = now;
      break;
    case RequestStatus::kCompleted:
      r.completed_at_ms = now;
      break;
    case RequestStatus::kCancelled:
      r.cancelled_at_ms = now;
      break;
    case RequestStatus::kPending:
      break;
  }
}

} // namespace

RequestStateMachine::RequestStateMachine(std::shared_ptr<queue::QueueStore> store) : store_(std::move(store)) {
}

db::model::RequestRecord RequestStateMachine::ReadUnlocked(const std::string& request_id) {
  auto request = db::WithStorage("read request", [&] {
    auto tx = store_->Repository().Begin();
    return store_->Repository().GetRequest(*tx, request_id);
  });
  if (!request) {
    throw util::NotFound("request not found: " + request_id);
  }
  return *request;
}

void RequestStateMachine::Authorize(const TransitionCommand& command, const db::model::RequestRecord& observed) {
  if (command.actor == Actor::kStaff) {
    if (command.staff_venue_id.empty()) {
      throw util::InvalidArgument("staff transition needs the acting venue");
    }
    // Requests of other venues are invisible to staff.
    if (command.staff_venue_id != observed.venue_id) {
      throw util::NotFound("request not found: " + observed.id);
    }
    return;
  }

  if (command.patron_id.empty() || command.patron_id != observed.patron_id) {
    throw util::PermissionDenied("request belongs to another patron");
  }
  if (command.target != RequestStatus::kCancelled) {
    throw util::PermissionDenied("patrons may only cancel their requests");
  }
}

db::model::RequestRecord RequestStateMachine::Transition(const TransitionCommand& command) {
  if (command.request_id.empty()) {
    throw util::InvalidArgument("request id is required");
  }

  const auto observed = ReadUnlocked(command.request_id);
  Authorize(command, observed);

  auto scope   = store_->OpenVenueScope(observed.venue_id);
  auto current = store_->Get(scope, command.request_id);
  if (!current) {
    throw util::NotFound("request not found: " + command.request_id);
  }

  const auto from = current->status;
  if (from != observed.status) {
    throw util::InvalidTransition("request status changed concurrently: " + Describe(observed.status, from));
  }
  if (command.expected_status && *command.expected_status != from) {
    throw util::InvalidTransition("request is " + std::string(songqueue::model::ToString(from)) + ", expected " +
                                  std::string(songqueue::model::ToString(*command.expected_status)));
  }
  if (!songqueue::model::CanTransition(from, command.target)) {
    throw util::InvalidTransition("illegal transition " + Describe(from, command.target));
  }
  if (command.actor == Actor::kPatron && from != RequestStatus::kPending) {
    throw util::InvalidTransition("only pending requests can be cancelled by the patron");
  }

  const auto vacated = current->queue_position;
  const bool leaves  = songqueue::model::LeavesPendingSet(from, command.target);

  auto updated   = *current;
  updated.status = command.target;
  Stamp(updated, command.target);
  if (leaves) {
    updated.queue_position = 0;
  }

  store_->Update(scope, updated, from);
  if (leaves) {
    store_->Renumber(scope, vacated);
  }
  const auto pending = store_->PendingCount(scope);
  scope.Commit();

  Metrics::Instance().SetQueueDepth(updated.venue_id, pending);
  SONGQUEUE_LOG_INFO("request transitioned",
                     {StringField("request_id", updated.id), StringField("venue_id", updated.venue_id),
                      StringField("from", songqueue::model::ToString(from)), StringField("to", songqueue::model::ToString(command.target)),
                      StringField("actor", command.actor == Actor::kStaff ? "staff" : "patron"), UIntField("vacated_position", leaves ? vacated : 0)});
  return updated;
}

} // namespace songqueue::core
