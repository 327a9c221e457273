#include "queue_reader.hpp"

#include <algorithm>

#include "internal/db/api/error_translation.hpp"
#include "internal/util/errors.hpp"

namespace songqueue::core {

namespace {

uint64_t CountOf(const db::StatusCounts& counts, std::optional<songqueue::model::RequestStatus> status) {
  if (!status) {
    return counts.Total();
  }
  switch (*status) {
    case songqueue::model::RequestStatus::kPending:
      return counts.pending;
    case songqueue::model::RequestStatus::kPlaying:
      return counts.playing;
    case songqueue::model::RequestStatus::kCompleted:
      return counts.completed;
    case songqueue::model::RequestStatus::kCancelled:
      return counts.cancelled;
  }
  return 0;
}

} // namespace

QueueReader::QueueReader(std::shared_ptr<db::Repository> repository, QueueReaderOptions options)
    : repository_(std::move(repository)), options_(options) {
}

void QueueReader::RequireVenue(db::Transaction& tx, const std::string& venue_id) {
  if (venue_id.empty()) {
    throw util::InvalidArgument("venue id is required");
  }
  if (!repository_->GetVenue(tx, venue_id)) {
    throw util::NotFound("venue not found: " + venue_id);
  }
}

db::model::RequestRecord QueueReader::GetRequest(const std::string& request_id) {
  auto request = db::WithStorage("get request", [&] {
    auto tx = repository_->Begin();
    return repository_->GetRequest(*tx, request_id);
  });
  if (!request) {
    throw util::NotFound("request not found: " + request_id);
  }
  return *request;
}

std::vector<db::model::RequestRecord> QueueReader::ListPending(const std::string& venue_id) {
  return db::WithStorage("list pending", [&] {
    auto tx = repository_->Begin();
    RequireVenue(*tx, venue_id);
    return repository_->ListPending(*tx, venue_id);
  });
}

std::vector<db::model::RequestRecord> QueueReader::ListByPatron(const std::string& patron_id,
                                                                std::optional<songqueue::model::RequestStatus> status, uint32_t limit) {
  if (patron_id.empty()) {
    throw util::InvalidArgument("patron id is required");
  }
  const uint32_t effective = limit == 0 ? options_.patron_history_limit : std::min(limit, options_.patron_history_limit);

  return db::WithStorage("list patron requests", [&] {
    auto tx = repository_->Begin();
    return repository_->ListPatronRequests(*tx, patron_id, status, effective);
  });
}

VenueRequestPage QueueReader::ListVenueRequests(const std::string& venue_id, std::optional<songqueue::model::RequestStatus> status,
                                                uint32_t page, uint32_t page_size) {
  VenueRequestPage result;
  result.page      = std::max<uint32_t>(page, 1);
  result.page_size = page_size == 0 ? options_.default_page_size : std::min(page_size, options_.max_page_size);

  db::WithStorage("list venue requests", [&] {
    auto tx = repository_->Begin();
    RequireVenue(*tx, venue_id);

    result.total = CountOf(repository_->CountByStatus(*tx, venue_id), status);

    db::Pagination pagination;
    pagination.limit  = result.page_size;
    pagination.offset = static_cast<std::size_t>(result.page - 1) * result.page_size;
    result.requests   = repository_->ListVenueRequests(*tx, venue_id, status, pagination);
  });

  result.total_pages = static_cast<uint32_t>((result.total + result.page_size - 1) / result.page_size);
  return result;
}

db::StatusCounts QueueReader::CountByStatus(const std::string& venue_id) {
  return db::WithStorage("count by status", [&] {
    auto tx = repository_->Begin();
    RequireVenue(*tx, venue_id);
    return repository_->CountByStatus(*tx, venue_id);
  });
}

db::StatusCounts QueueReader::CountByStatusForPatron(const std::string& patron_id) {
  return db::WithStorage("count patron requests", [&] {
    auto tx = repository_->Begin();
    return repository_->CountByStatusForPatron(*tx, patron_id);
  });
}

} // namespace songqueue::core
