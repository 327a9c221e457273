#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/catalog/catalog_lookup.hpp"
#include "internal/db/model/request_record.hpp"
#include "internal/queue/queue_store.hpp"

namespace songqueue::core {

struct AdmissionOptions {
  // Display heuristic only.
  uint32_t average_track_minutes = 3;
};

struct Admission {
  db::model::RequestRecord request;
  uint32_t                 estimated_wait_minutes = 0;
};

/*
  Decides whether a new request may enter a venue queue.

  Checks run in this order inside one venue scope, first failure wins:
    1. venue exists and is active                  NotFound
    2. track exists, is active, belongs to venue   NotFound
    3. patron pending count < per-patron limit     LimitExceeded(patron)
    4. venue pending count < queue limit           LimitExceeded(queue)
    5. no pending/playing request for same track   Duplicate
*/
class AdmissionController {
 public:
  AdmissionController(std::shared_ptr<catalog::CatalogLookup> catalog, std::shared_ptr<queue::QueueStore> store,
                      AdmissionOptions options = {});

  Admission Submit(const std::string& venue_id, const std::string& patron_id, const std::string& track_id,
                   const std::string& display_tag);

 private:
  std::shared_ptr<catalog::CatalogLookup> catalog_;
  std::shared_ptr<queue::QueueStore>      store_;
  AdmissionOptions                        options_;
};

} // namespace songqueue::core
