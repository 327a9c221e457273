#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"

#if SONGQUEUE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if SONGQUEUE_DB_POSTGRES
#include <pqxx/pqxx>

#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using songqueue::db::ErrorCode;
using songqueue::db::Pagination;
using songqueue::db::Repository;
using songqueue::db::memory::MemoryRepository;
using songqueue::db::model::PatronRecord;
using songqueue::db::model::RequestRecord;
using songqueue::db::model::TrackRecord;
using songqueue::db::model::VenueRecord;
using songqueue::model::RequestStatus;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

// Venue with three tracks and two patrons, committed.
void SeedVenue(Repository& repo, const std::string& venue_id) {
  auto tx = repo.Begin();

  VenueRecord venue{.id = venue_id, .name = "Main Room", .active = true, .max_requests_per_patron = 2, .queue_limit = 10};
  assert(repo.UpsertVenue(*tx, venue));

  for (const auto* suffix : {"-t1", "-t2", "-t3"}) {
    TrackRecord track{.id = venue_id + suffix, .venue_id = venue_id, .active = true, .title = "Song", .artist = "Band", .duration_sec = 200};
    assert(repo.UpsertTrack(*tx, track));
  }

  for (const auto* suffix : {"-p1", "-p2"}) {
    PatronRecord patron{.id = venue_id + suffix, .venue_id = venue_id, .table_tag = suffix, .created_at_ms = 1, .last_seen_ms = 1};
    assert(repo.InsertPatron(*tx, patron));
  }

  tx->Commit();
}

RequestRecord MakeRequest(const std::string& venue_id, const std::string& id, const std::string& patron, const std::string& track,
                          uint32_t position, uint64_t submitted_at) {
  return RequestRecord{.id              = id,
                       .venue_id        = venue_id,
                       .patron_id       = venue_id + patron,
                       .track_id        = venue_id + track,
                       .status          = RequestStatus::kPending,
                       .queue_position  = position,
                       .display_tag     = patron,
                       .submitted_at_ms = submitted_at};
}

void VerifyCatalogReadWrite(Repository& repo, const std::string& venue_id) {
  SeedVenue(repo, venue_id);

  {
    auto tx    = repo.Begin();
    auto venue = repo.GetVenue(*tx, venue_id);
    assert(venue.has_value());
    assert(venue->name == "Main Room");
    assert(venue->max_requests_per_patron == 2);
    assert(venue->queue_limit == 10);

    venue->active      = false;
    venue->queue_limit = 3;
    assert(repo.UpsertVenue(*tx, *venue));

    auto track = repo.GetTrack(*tx, venue_id + "-t2");
    assert(track.has_value());
    assert(track->venue_id == venue_id);
    track->active = false;
    assert(repo.UpsertTrack(*tx, *track));
    tx->Commit();
  }

  auto tx    = repo.Begin();
  auto venue = repo.GetVenue(*tx, venue_id);
  assert(venue.has_value());
  assert(!venue->active);
  assert(venue->queue_limit == 3);

  auto tracks = repo.ListTracks(*tx, venue_id);
  assert(tracks.size() == 3);
  assert(!repo.GetTrack(*tx, venue_id + "-t2")->active);

  assert(!repo.GetVenue(*tx, venue_id + "-missing").has_value());
  assert(!repo.GetTrack(*tx, venue_id + "-missing").has_value());
  tx->Commit();
}

void VerifyPatronLookup(Repository& repo, const std::string& venue_id) {
  SeedVenue(repo, venue_id);

  {
    auto tx = repo.Begin();

    PatronRecord registered{.id = venue_id + "-acct", .venue_id = venue_id, .account_id = "acct-7", .created_at_ms = 5, .last_seen_ms = 5};
    assert(repo.InsertPatron(*tx, registered));

    PatronRecord older{.id = venue_id + "-anon-a", .venue_id = venue_id, .table_tag = "T12", .client_address = "10.0.0.1",
                       .created_at_ms = 10, .last_seen_ms = 10};
    PatronRecord newer{.id = venue_id + "-anon-b", .venue_id = venue_id, .table_tag = "T12", .client_address = "10.0.0.2",
                       .created_at_ms = 20, .last_seen_ms = 20};
    assert(repo.InsertPatron(*tx, older));
    assert(repo.InsertPatron(*tx, newer));
    tx->Commit();
  }

  // A failed statement poisons a Postgres transaction; probe violations alone.
  {
    auto tx    = repo.Begin();
    auto again = repo.InsertPatron(*tx, PatronRecord{.id = venue_id + "-anon-a", .venue_id = venue_id});
    assert(!again);
    assert(again.code == ErrorCode::AlreadyExists || again.code == ErrorCode::ConstraintViolation);
    tx->Rollback();
  }

  {
    auto tx = repo.Begin();

    auto by_account = repo.FindPatronByAccount(*tx, venue_id, "acct-7");
    assert(by_account.has_value());
    assert(by_account->id == venue_id + "-acct");
    assert(!repo.FindPatronByAccount(*tx, venue_id, "").has_value());
    assert(!repo.FindPatronByAccount(*tx, venue_id + "-other", "acct-7").has_value());

    auto by_tag = repo.FindPatronBySession(*tx, venue_id, "T12", "");
    assert(by_tag.has_value());
    assert(by_tag->id == venue_id + "-anon-b");

    auto by_address = repo.FindPatronBySession(*tx, venue_id, "", "10.0.0.1");
    assert(by_address.has_value());
    assert(by_address->id == venue_id + "-anon-a");

    assert(!repo.FindPatronBySession(*tx, venue_id, "", "").has_value());

    auto patron         = *by_address;
    patron.last_seen_ms = 99;
    assert(repo.UpdatePatron(*tx, patron));

    PatronRecord ghost{.id = venue_id + "-ghost", .venue_id = venue_id};
    auto         missing = repo.UpdatePatron(*tx, ghost);
    assert(missing.code == ErrorCode::NotFound);
    tx->Commit();
  }

  auto tx     = repo.Begin();
  auto patron = repo.GetPatron(*tx, venue_id + "-anon-a");
  assert(patron.has_value());
  assert(patron->last_seen_ms == 99);
  tx->Commit();
}

void VerifyRequestLifecycle(Repository& repo, const std::string& venue_id) {
  SeedVenue(repo, venue_id);

  {
    auto tx = repo.Begin();
    assert(repo.LockVenue(*tx, venue_id));
    assert(repo.InsertRequest(*tx, MakeRequest(venue_id, venue_id + "-r1", "-p1", "-t1", 1, 100)));
    assert(repo.InsertRequest(*tx, MakeRequest(venue_id, venue_id + "-r2", "-p2", "-t1", 2, 200)));
    assert(repo.InsertRequest(*tx, MakeRequest(venue_id, venue_id + "-r3", "-p1", "-t2", 3, 300)));
    tx->Commit();
  }

  {
    auto tx      = repo.Begin();
    auto same_id = repo.InsertRequest(*tx, MakeRequest(venue_id, venue_id + "-r1", "-p2", "-t3", 4, 400));
    assert(same_id.code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }

  {
    auto tx          = repo.Begin();
    auto outstanding = repo.InsertRequest(*tx, MakeRequest(venue_id, venue_id + "-r4", "-p1", "-t1", 4, 400));
    assert(outstanding.code == ErrorCode::ConstraintViolation);
    tx->Rollback();
  }

  {
    auto tx = repo.Begin();
    assert(repo.CountPending(*tx, venue_id) == 3);
    assert(repo.CountPendingForPatron(*tx, venue_id, venue_id + "-p1") == 2);
    assert(repo.HasOutstanding(*tx, venue_id, venue_id + "-p1", venue_id + "-t1"));
    assert(!repo.HasOutstanding(*tx, venue_id, venue_id + "-p2", venue_id + "-t2"));
    tx->Commit();
  }

  // r1 starts playing; the queue behind it closes up.
  {
    auto tx = repo.Begin();
    auto r1 = repo.GetRequest(*tx, venue_id + "-r1");
    assert(r1.has_value());
    r1->status         = RequestStatus::kPlaying;
    r1->queue_position = 0;
    r1->started_at_ms  = 500;
    assert(repo.UpdateRequest(*tx, *r1, RequestStatus::kPending));
    assert(repo.ShiftPendingPositions(*tx, venue_id, 1));
    tx->Commit();
  }

  {
    auto tx    = repo.Begin();
    auto r1    = *repo.GetRequest(*tx, venue_id + "-r1");
    auto stale = repo.UpdateRequest(*tx, r1, RequestStatus::kPending);
    assert(stale.code == ErrorCode::Conflict);

    RequestRecord ghost = r1;
    ghost.id            = venue_id + "-ghost";
    auto missing        = repo.UpdateRequest(*tx, ghost, RequestStatus::kPending);
    assert(missing.code == ErrorCode::NotFound);
    tx->Rollback();
  }

  {
    auto tx      = repo.Begin();
    auto pending = repo.ListPending(*tx, venue_id);
    assert(pending.size() == 2);
    assert(pending[0].id == venue_id + "-r2" && pending[0].queue_position == 1);
    assert(pending[1].id == venue_id + "-r3" && pending[1].queue_position == 2);

    // Still outstanding while playing.
    assert(repo.HasOutstanding(*tx, venue_id, venue_id + "-p1", venue_id + "-t1"));

    auto r1            = *repo.GetRequest(*tx, venue_id + "-r1");
    r1.status          = RequestStatus::kCompleted;
    r1.completed_at_ms = 600;
    assert(repo.UpdateRequest(*tx, r1, RequestStatus::kPlaying));
    tx->Commit();
  }

  auto tx = repo.Begin();
  assert(!repo.HasOutstanding(*tx, venue_id, venue_id + "-p1", venue_id + "-t1"));

  // A completed request no longer blocks the same track.
  assert(repo.InsertRequest(*tx, MakeRequest(venue_id, venue_id + "-r5", "-p1", "-t1", 3, 700)));

  auto done = repo.GetRequest(*tx, venue_id + "-r1");
  assert(done.has_value());
  assert(done->status == RequestStatus::kCompleted);
  assert(done->queue_position == 0);
  assert(done->started_at_ms == 500 && done->completed_at_ms == 600);
  assert(done->display_tag == "-p1");
  tx->Commit();
}

void VerifyListingsAndCounts(Repository& repo, const std::string& venue_id) {
  SeedVenue(repo, venue_id);

  {
    auto tx = repo.Begin();
    assert(repo.InsertRequest(*tx, MakeRequest(venue_id, venue_id + "-a", "-p1", "-t1", 1, 100)));
    assert(repo.InsertRequest(*tx, MakeRequest(venue_id, venue_id + "-b", "-p2", "-t2", 2, 200)));
    assert(repo.InsertRequest(*tx, MakeRequest(venue_id, venue_id + "-c", "-p1", "-t3", 3, 300)));
    assert(repo.InsertRequest(*tx, MakeRequest(venue_id, venue_id + "-d", "-p2", "-t1", 4, 400)));

    auto b            = *repo.GetRequest(*tx, venue_id + "-b");
    b.status          = RequestStatus::kCancelled;
    b.queue_position  = 0;
    b.cancelled_at_ms = 450;
    assert(repo.UpdateRequest(*tx, b, RequestStatus::kPending));
    assert(repo.ShiftPendingPositions(*tx, venue_id, 2));
    tx->Commit();
  }

  auto tx = repo.Begin();

  auto pending = repo.ListVenueRequests(*tx, venue_id, RequestStatus::kPending, Pagination{.limit = 10, .offset = 0});
  assert(pending.size() == 3);
  assert(pending[0].id == venue_id + "-a");
  assert(pending[1].id == venue_id + "-c" && pending[1].queue_position == 2);
  assert(pending[2].id == venue_id + "-d" && pending[2].queue_position == 3);

  auto all = repo.ListVenueRequests(*tx, venue_id, std::nullopt, Pagination{.limit = 10, .offset = 0});
  assert(all.size() == 4);
  assert(all[0].id == venue_id + "-d");
  assert(all[3].id == venue_id + "-a");

  auto second_page = repo.ListVenueRequests(*tx, venue_id, std::nullopt, Pagination{.limit = 2, .offset = 2});
  assert(second_page.size() == 2);
  assert(second_page[0].id == venue_id + "-b");
  assert(second_page[1].id == venue_id + "-a");

  auto cancelled = repo.ListVenueRequests(*tx, venue_id, RequestStatus::kCancelled, Pagination{.limit = 10, .offset = 0});
  assert(cancelled.size() == 1 && cancelled[0].id == venue_id + "-b");

  auto mine = repo.ListPatronRequests(*tx, venue_id + "-p2", std::nullopt, 10);
  assert(mine.size() == 2);
  assert(mine[0].id == venue_id + "-d");
  assert(mine[1].id == venue_id + "-b");

  auto limited = repo.ListPatronRequests(*tx, venue_id + "-p2", std::nullopt, 1);
  assert(limited.size() == 1 && limited[0].id == venue_id + "-d");

  auto mine_pending = repo.ListPatronRequests(*tx, venue_id + "-p2", RequestStatus::kPending, 10);
  assert(mine_pending.size() == 1 && mine_pending[0].id == venue_id + "-d");

  auto counts = repo.CountByStatus(*tx, venue_id);
  assert(counts.pending == 3);
  assert(counts.cancelled == 1);
  assert(counts.playing == 0 && counts.completed == 0);
  assert(counts.Total() == 4);

  auto patron_counts = repo.CountByStatusForPatron(*tx, venue_id + "-p2");
  assert(patron_counts.pending == 1);
  assert(patron_counts.cancelled == 1);
  assert(patron_counts.Total() == 2);
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& venue_id) {
  SeedVenue(repo, venue_id);

  {
    auto tx = repo.Begin();
    assert(repo.InsertRequest(*tx, MakeRequest(venue_id, venue_id + "-kept", "-p1", "-t1", 1, 100)));
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    assert(repo.InsertRequest(*tx, MakeRequest(venue_id, venue_id + "-dropped", "-p2", "-t2", 2, 200)));
    assert(repo.GetRequest(*tx, venue_id + "-dropped").has_value());
    tx->Rollback();
  }

  {
    // Destroyed without Commit.
    auto tx   = repo.Begin();
    auto kept = *repo.GetRequest(*tx, venue_id + "-kept");
    kept.status         = RequestStatus::kCancelled;
    kept.queue_position = 0;
    assert(repo.UpdateRequest(*tx, kept, RequestStatus::kPending));
    assert(repo.ShiftPendingPositions(*tx, venue_id, 1));
  }

  auto tx = repo.Begin();
  assert(!repo.GetRequest(*tx, venue_id + "-dropped").has_value());

  auto kept = repo.GetRequest(*tx, venue_id + "-kept");
  assert(kept.has_value());
  assert(kept->status == RequestStatus::kPending);
  assert(kept->queue_position == 1);
  assert(repo.CountPending(*tx, venue_id) == 1);
  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& venue_id) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  SeedVenue(*repo, venue_id);
  {
    auto tx = repo->Begin();
    assert(repo->InsertRequest(*tx, MakeRequest(venue_id, venue_id + "-r1", "-p1", "-t1", 1, 100)));
    assert(repo->InsertRequest(*tx, MakeRequest(venue_id, venue_id + "-r2", "-p2", "-t2", 2, 200)));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  auto venue = repo->GetVenue(*tx, venue_id);
  assert(venue.has_value());
  assert(venue->queue_limit == 10);

  auto pending = repo->ListPending(*tx, venue_id);
  assert(pending.size() == 2);
  assert(pending[0].id == venue_id + "-r1");
  assert(pending[1].id == venue_id + "-r2");
  assert(pending[1].display_tag == "-p2");

  auto patron = repo->GetPatron(*tx, venue_id + "-p1");
  assert(patron.has_value());
  assert(patron->table_tag == "-p1");
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if SONGQUEUE_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("songqueue_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<songqueue::db::sqlite::SqliteDB>(db_path);
    for (const auto& sql : songqueue::db::sql::SqliteSchema()) {
      db->Exec(sql);
    }
    return std::make_shared<songqueue::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}
#endif

#if SONGQUEUE_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("SONGQUEUE_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("SONGQUEUE_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto       pool = std::make_shared<songqueue::db::postgres::PgPool>(conninfo);
    auto       conn = pool->Acquire();
    pqxx::work tx(*conn);
    for (const auto& sql : songqueue::db::sql::PostgresSchema()) {
      tx.exec(sql);
    }
    tx.commit();
    return std::make_shared<songqueue::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  // Shared databases keep rows between runs; keep ids unique per run.
  const auto prefix = backend.name + "-" + std::to_string(NowMs());

  VerifyCatalogReadWrite(*repo, prefix + "-catalog");
  VerifyPatronLookup(*repo, prefix + "-patrons");
  VerifyRequestLifecycle(*repo, prefix + "-lifecycle");
  VerifyListingsAndCounts(*repo, prefix + "-listing");
  VerifyRollbackBehavior(*repo, prefix + "-rollback");

  repo.reset();
  VerifyRestartDurability(backend, prefix + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if SONGQUEUE_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if SONGQUEUE_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "songqueue_integration_repository_parity: pass\n";
  return 0;
}
