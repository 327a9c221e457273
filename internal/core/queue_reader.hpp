#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace songqueue::core {

struct QueueReaderOptions {
  uint32_t default_page_size    = 20;
  uint32_t max_page_size        = 100;
  uint32_t patron_history_limit = 50;
};

struct VenueRequestPage {
  std::vector<db::model::RequestRecord> requests;
  uint64_t                              total       = 0;
  uint32_t                              page        = 1;
  uint32_t                              page_size   = 0;
  uint32_t                              total_pages = 0;
};

/*
  Read-only projections for display. Each call runs in its own storage
  transaction and takes no venue lock, so results may trail a
  concurrent writer by one commit.
*/
class QueueReader {
 public:
  explicit QueueReader(std::shared_ptr<db::Repository> repository, QueueReaderOptions options = {});

  db::model::RequestRecord GetRequest(const std::string& request_id);

  std::vector<db::model::RequestRecord> ListPending(const std::string& venue_id);

  // Most recent first; limit 0 uses the configured history limit.
  std::vector<db::model::RequestRecord> ListByPatron(const std::string& patron_id, std::optional<songqueue::model::RequestStatus> status,
                                                     uint32_t limit);

  // page is 1-based; page_size 0 uses the default and is capped at the maximum.
  VenueRequestPage ListVenueRequests(const std::string& venue_id, std::optional<songqueue::model::RequestStatus> status, uint32_t page,
                                     uint32_t page_size);

  db::StatusCounts CountByStatus(const std::string& venue_id);
  db::StatusCounts CountByStatusForPatron(const std::string& patron_id);

 private:
  void RequireVenue(db::Transaction& tx, const std::string& venue_id);

  std::shared_ptr<db::Repository> repository_;
  QueueReaderOptions              options_;
};

} // namespace songqueue::core
