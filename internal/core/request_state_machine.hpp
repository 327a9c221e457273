#pragma once

#include <memory>
#include <optional>
#include <string>

#include "internal/db/model/request_record.hpp"
#include "internal/queue/queue_store.hpp"

namespace songqueue::core {

enum class Actor {
  kStaff,
  kPatron,
};

struct TransitionCommand {
  std::string                     request_id;
  songqueue::model::RequestStatus target = songqueue::model::RequestStatus::kCancelled;
  Actor                           actor  = Actor::kStaff;

  // kStaff: the venue the staff member acts for.
  std::string staff_venue_id;
  // kPatron: the resolved patron of the caller.
  std::string patron_id;

  std::optional<songqueue::model::RequestStatus> expected_status;
};

/*
  Playback state machine.

    pending -> playing     staff            started_at, leaves queue
    pending -> cancelled   staff or owner   cancelled_at, leaves queue
    playing -> completed   staff            completed_at
    playing -> cancelled   staff            cancelled_at

  Anything else is InvalidTransition. When a request leaves the pending
  set its position is released and the queue renumbered in the same
  venue scope as the status write.

  The request is first read without the venue lock to learn its venue.
  The status is read again under the lock; if it moved in between the
  call fails with InvalidTransition instead of applying to a newer state.
*/
class RequestStateMachine {
 public:
  explicit RequestStateMachine(std::shared_ptr<queue::QueueStore> store);

  db::model::RequestRecord Transition(const TransitionCommand& command);

 private:
  db::model::RequestRecord ReadUnlocked(const std::string& request_id);
  static void              Authorize(const TransitionCommand& command, const db::model::RequestRecord& observed);

  std::shared_ptr<queue::QueueStore> store_;
};

} // namespace songqueue::core
