#include <cassert>
#include <atomic>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/fixtures.hpp"

#if SONGQUEUE_DB_SQLITE
#include "internal/db/sql/schema.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace {

using songqueue::db::Repository;
using songqueue::model::RequestStatus;
using songqueue::testing::DensePositions;
using songqueue::testing::Harness;

constexpr int kPatrons          = 12;
constexpr int kTracksPerPatron  = 4;
constexpr uint32_t kPerPatron   = 2;
constexpr uint32_t kQueueLimit  = 15;

struct Outcome {
  std::atomic<int> admitted{0};
  std::atomic<int> patron_limited{0};
  std::atomic<int> queue_limited{0};
};

void SubmitStorm(Harness& h, const std::string& venue, Outcome& outcome) {
  h.AddVenue(venue, kPerPatron, kQueueLimit);
  for (int t = 0; t < kTracksPerPatron; ++t) h.AddTrack(venue + "-t" + std::to_string(t), venue);

  std::vector<std::string> patrons;
  for (int p = 0; p < kPatrons; ++p) patrons.push_back(h.Patron(venue, "table-" + std::to_string(p)));

  std::vector<std::thread> threads;
  for (int p = 0; p < kPatrons; ++p) {
    threads.emplace_back([&, p] {
      for (int t = 0; t < kTracksPerPatron; ++t) {
        try {
          h.Submit(venue, patrons[p], venue + "-t" + std::to_string(t));
          ++outcome.admitted;
        } catch (const songqueue::util::LimitExceeded& e) {
          if (e.Scope() == songqueue::util::LimitScope::kPatron) {
            ++outcome.patron_limited;
          } else {
            ++outcome.queue_limited;
          }
        }
      }
    });
  }
  for (auto& t : threads) t.join();
}

void VerifyVenue(Harness& h, const std::string& venue, const Outcome& outcome) {
  const auto pending = h.reader->ListPending(venue);
  assert(pending.size() <= kQueueLimit);
  assert(pending.size() == static_cast<std::size_t>(outcome.admitted.load()));
  assert(DensePositions(pending));

  std::map<std::string, uint32_t> per_patron;
  for (const auto& r : pending) ++per_patron[r.patron_id];
  for (const auto& [_, count] : per_patron) assert(count <= kPerPatron);

  assert(outcome.admitted + outcome.patron_limited + outcome.queue_limited == kPatrons * kTracksPerPatron);
}

void TestConcurrentSubmitsRespectLimits(std::shared_ptr<Repository> repository) {
  Harness h(std::move(repository));
  Outcome outcome;
  SubmitStorm(h, "V", outcome);

  VerifyVenue(h, "V", outcome);
  assert(outcome.admitted == static_cast<int>(kQueueLimit));
}

void TestVenuesProceedIndependently(std::shared_ptr<Repository> repository) {
  Harness h(std::move(repository));
  Outcome a;
  Outcome b;

  std::thread first([&] { SubmitStorm(h, "A", a); });
  std::thread second([&] { SubmitStorm(h, "B", b); });
  first.join();
  second.join();

  VerifyVenue(h, "A", a);
  VerifyVenue(h, "B", b);
}

void TestMixedTransitionsKeepPositionsDense(std::shared_ptr<Repository> repository) {
  Harness h(std::move(repository));
  h.AddVenue("V", 40, 200);

  std::vector<std::string> patrons;
  std::vector<std::string> ids;
  for (int p = 0; p < 6; ++p) {
    patrons.push_back(h.Patron("V", "table-" + std::to_string(p)));
    for (int t = 0; t < 5; ++t) {
      const auto track = "t" + std::to_string(p) + "-" + std::to_string(t);
      h.AddTrack(track, "V");
      ids.push_back(h.Submit("V", patrons.back(), track).id);
    }
  }

  std::atomic<int>         lost_races{0};
  std::vector<std::thread> threads;
  // Two workers race over every request. A cancel that lands first makes
  // the competing start fail; a start that lands first can still be cancelled.
  for (int worker = 0; worker < 2; ++worker) {
    threads.emplace_back([&, worker] {
      for (std::size_t i = 0; i < ids.size(); ++i) {
        const auto target = (i + worker) % 2 == 0 ? RequestStatus::kPlaying : RequestStatus::kCancelled;
        try {
          h.Staff(ids[i], "V", target);
        } catch (const songqueue::util::InvalidTransition&) {
          ++lost_races;
        }
      }
    });
  }
  // New submissions keep arriving meanwhile.
  threads.emplace_back([&] {
    for (int t = 0; t < 10; ++t) {
      const auto track = "late-" + std::to_string(t);
      h.AddTrack(track, "V");
      h.Submit("V", patrons[t % patrons.size()], track);
    }
  });
  for (auto& t : threads) t.join();

  const auto pending = h.reader->ListPending("V");
  assert(pending.size() == 10);
  assert(DensePositions(pending));
  assert(lost_races.load() <= static_cast<int>(ids.size()));

  const auto counts = h.reader->CountByStatus("V");
  assert(counts.playing + counts.cancelled == ids.size());
}

#if SONGQUEUE_DB_SQLITE
std::shared_ptr<Repository> MakeSqlite(const std::string& name) {
  const auto path = std::filesystem::temp_directory_path() / ("songqueue_concurrency_" + name + ".db");
  std::filesystem::remove(path);
  std::filesystem::remove(path.string() + "-wal");
  std::filesystem::remove(path.string() + "-shm");

  auto db = std::make_shared<songqueue::db::sqlite::SqliteDB>(path.string());
  for (const auto& sql : songqueue::db::sql::SqliteSchema()) db->Exec(sql);
  return std::make_shared<songqueue::db::sqlite::SqliteRepository>(std::move(db));
}
#endif

} // namespace

int main() {
  using songqueue::db::memory::MemoryRepository;

  TestConcurrentSubmitsRespectLimits(std::make_shared<MemoryRepository>());
  TestVenuesProceedIndependently(std::make_shared<MemoryRepository>());
  TestMixedTransitionsKeepPositionsDense(std::make_shared<MemoryRepository>());

#if SONGQUEUE_DB_SQLITE
  TestConcurrentSubmitsRespectLimits(MakeSqlite("limits"));
  TestVenuesProceedIndependently(MakeSqlite("venues"));
  TestMixedTransitionsKeepPositionsDense(MakeSqlite("mixed"));
#endif

  std::cout << "songqueue_unit_concurrency: pass\n";
  return 0;
}
