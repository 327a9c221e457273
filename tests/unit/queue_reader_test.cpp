#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"
#include "tests/support/fixtures.hpp"

namespace {

using songqueue::core::QueueReader;
using songqueue::core::QueueReaderOptions;
using songqueue::db::model::RequestRecord;
using songqueue::model::RequestStatus;
using songqueue::testing::Harness;
using songqueue::testing::Throws;

// Venue "V" with 7 requests from one patron: 2 completed, 1 cancelled, 4 pending.
std::vector<RequestRecord> Populate(Harness& h, std::string& patron) {
  h.AddVenue("V", 10, 100);
  patron = h.Patron("V", "A");

  std::vector<RequestRecord> out;
  for (int i = 1; i <= 7; ++i) {
    const auto track = "T" + std::to_string(i);
    h.AddTrack(track, "V");
    out.push_back(h.Submit("V", patron, track));
  }
  h.Staff(out[0].id, "V", RequestStatus::kPlaying);
  h.Staff(out[0].id, "V", RequestStatus::kCompleted);
  h.Staff(out[1].id, "V", RequestStatus::kPlaying);
  h.Staff(out[1].id, "V", RequestStatus::kCompleted);
  h.Staff(out[2].id, "V", RequestStatus::kCancelled);
  return out;
}

void TestCounts() {
  Harness     h;
  std::string patron;
  Populate(h, patron);

  const auto counts = h.reader->CountByStatus("V");
  assert(counts.pending == 4);
  assert(counts.playing == 0);
  assert(counts.completed == 2);
  assert(counts.cancelled == 1);
  assert(counts.Total() == 7);

  const auto mine = h.reader->CountByStatusForPatron(patron);
  assert(mine.Total() == 7);
  assert(h.reader->CountByStatusForPatron("nobody").Total() == 0);
}

void TestListByPatronMostRecentFirst() {
  Harness     h;
  std::string patron;
  const auto  requests = Populate(h, patron);

  const auto all = h.reader->ListByPatron(patron, std::nullopt, 0);
  assert(all.size() == 7);
  assert(all.front().id == requests.back().id);
  assert(all.back().id == requests.front().id);

  const auto completed = h.reader->ListByPatron(patron, RequestStatus::kCompleted, 0);
  assert(completed.size() == 2);
  for (const auto& r : completed) assert(r.status == RequestStatus::kCompleted);

  assert(h.reader->ListByPatron(patron, std::nullopt, 3).size() == 3);
  assert(Throws<songqueue::util::InvalidArgument>([&] { h.reader->ListByPatron("", std::nullopt, 0); }));
}

void TestPatronHistoryIsCapped() {
  Harness     h;
  std::string patron;
  Populate(h, patron);

  QueueReaderOptions options;
  options.patron_history_limit = 2;
  QueueReader reader(h.repository, options);
  assert(reader.ListByPatron(patron, std::nullopt, 0).size() == 2);
  assert(reader.ListByPatron(patron, std::nullopt, 50).size() == 2);
}

void TestVenuePagination() {
  Harness     h;
  std::string patron;
  Populate(h, patron);

  QueueReaderOptions options;
  options.default_page_size = 3;
  options.max_page_size     = 5;
  QueueReader reader(h.repository, options);

  const auto first = reader.ListVenueRequests("V", std::nullopt, 0, 0);
  assert(first.page == 1);
  assert(first.page_size == 3);
  assert(first.total == 7);
  assert(first.total_pages == 3);
  assert(first.requests.size() == 3);

  const auto last = reader.ListVenueRequests("V", std::nullopt, 3, 0);
  assert(last.requests.size() == 1);

  const auto beyond = reader.ListVenueRequests("V", std::nullopt, 9, 0);
  assert(beyond.requests.empty());
  assert(beyond.total == 7);

  const auto capped = reader.ListVenueRequests("V", std::nullopt, 1, 50);
  assert(capped.page_size == 5);
  assert(capped.requests.size() == 5);
}

void TestVenuePendingFilterUsesQueueOrder() {
  Harness     h;
  std::string patron;
  Populate(h, patron);

  const auto page = h.reader->ListVenueRequests("V", RequestStatus::kPending, 1, 10);
  assert(page.total == 4);
  assert(page.total_pages == 1);
  assert(page.requests.size() == 4);
  for (std::size_t i = 0; i < page.requests.size(); ++i) {
    assert(page.requests[i].queue_position == i + 1);
  }

  const auto cancelled = h.reader->ListVenueRequests("V", RequestStatus::kCancelled, 1, 10);
  assert(cancelled.total == 1);
  assert(cancelled.requests.front().status == RequestStatus::kCancelled);
}

void TestUnknownVenueAndRequest() {
  Harness h;
  assert(Throws<songqueue::util::NotFound>([&] { h.reader->ListPending("missing"); }));
  assert(Throws<songqueue::util::NotFound>([&] { h.reader->CountByStatus("missing"); }));
  assert(Throws<songqueue::util::NotFound>([&] { h.reader->ListVenueRequests("missing", std::nullopt, 1, 10); }));
  assert(Throws<songqueue::util::NotFound>([&] { h.reader->GetRequest("missing"); }));
}

void TestEmptyVenue() {
  Harness h;
  h.AddVenue("V", 1, 1);
  assert(h.reader->ListPending("V").empty());

  const auto page = h.reader->ListVenueRequests("V", std::nullopt, 1, 10);
  assert(page.total == 0);
  assert(page.total_pages == 0);
}

} // namespace

int main() {
  TestCounts();
  TestListByPatronMostRecentFirst();
  TestPatronHistoryIsCapped();
  TestVenuePagination();
  TestVenuePendingFilterUsesQueueOrder();
  TestUnknownVenueAndRequest();
  TestEmptyVenue();

  std::cout << "songqueue_unit_queue_reader: pass\n";
  return 0;
}
