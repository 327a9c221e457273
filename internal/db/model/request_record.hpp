#pragma once

#include <cstdint>
#include <string>

#include "internal/model/request_status.hpp"

namespace songqueue::db::model {

/*
  Persistent song request row.

  IMPORTANT:
  - queue_position is only meaningful while status == kPending.
    It is 0 for every other status.
  - venue_id / patron_id / track_id never change after insert.
  - Timestamps are unix millis, 0 = not reached.
*/

struct RequestRecord {
  std::string id;
  std::string venue_id;
  std::string patron_id;
  std::string track_id;

  songqueue::model::RequestStatus status = songqueue::model::RequestStatus::kPending;

  uint32_t    queue_position = 0;
  std::string display_tag;

  uint64_t submitted_at_ms = 0;
  uint64_t started_at_ms   = 0;
  uint64_t completed_at_ms = 0;
  uint64_t cancelled_at_ms = 0;
};

} // namespace songqueue::db::model
