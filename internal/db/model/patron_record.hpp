#pragma once

#include <cstdint>
#include <string>

namespace songqueue::db::model {

/*
  A patron is scoped to exactly one venue.

  Registered patrons carry account_id; anonymous patrons are matched by
  table_tag or client_address of their session.
*/

struct PatronRecord {
  std::string id;
  std::string venue_id;
  std::string account_id;
  std::string table_tag;
  std::string client_address;
  uint64_t    created_at_ms = 0;
  uint64_t    last_seen_ms  = 0;
};

} // namespace songqueue::db::model
