#pragma once

#include <cstdint>
#include <string>

namespace songqueue::db::model {

struct VenueRecord {
  std::string id;
  std::string name;
  bool        active = true;

  // Admission limits
  uint32_t max_requests_per_patron = 1;
  uint32_t queue_limit             = 1;
};

} // namespace songqueue::db::model
