#pragma once

#include <cstdint>
#include <string>

namespace songqueue::db::model {

struct TrackRecord {
  std::string id;
  std::string venue_id;
  bool        active = true;

  // Display only; never consulted by admission.
  std::string title;
  std::string artist;
  uint32_t    duration_sec = 0;
};

} // namespace songqueue::db::model
