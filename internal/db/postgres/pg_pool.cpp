#include "pg_pool.hpp"

namespace songqueue::db::postgres {

namespace {

constexpr const char* kRequestColumns =
    "id,venue_id,patron_id,track_id,status,queue_position,display_tag,"
    "submitted_at_ms,started_at_ms,completed_at_ms,cancelled_at_ms";

constexpr const char* kPatronColumns = "id,venue_id,account_id,table_tag,client_address,created_at_ms,last_seen_ms";

std::string SelectRequests(const std::string& tail) {
  return std::string("SELECT ") + kRequestColumns + " FROM song_request " + tail;
}

std::string SelectPatrons(const std::string& tail) {
  return std::string("SELECT ") + kPatronColumns + " FROM patron " + tail;
}

} // namespace

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn.release());
        } catch (const std::exception&) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  // venue
  conn.prepare("lock_venue", "SELECT id FROM venue WHERE id=$1 FOR UPDATE");
  conn.prepare("upsert_venue",
               "INSERT INTO venue(id,name,active,max_requests_per_patron,queue_limit) VALUES($1,$2,$3,$4,$5) "
               "ON CONFLICT(id) DO UPDATE SET name=EXCLUDED.name,active=EXCLUDED.active,"
               "max_requests_per_patron=EXCLUDED.max_requests_per_patron,queue_limit=EXCLUDED.queue_limit");
  conn.prepare("get_venue", "SELECT id,name,active,max_requests_per_patron,queue_limit FROM venue WHERE id=$1");

  // track
  conn.prepare("upsert_track",
               "INSERT INTO track(id,venue_id,active,title,artist,duration_sec) VALUES($1,$2,$3,$4,$5,$6) "
               "ON CONFLICT(id) DO UPDATE SET venue_id=EXCLUDED.venue_id,active=EXCLUDED.active,"
               "title=EXCLUDED.title,artist=EXCLUDED.artist,duration_sec=EXCLUDED.duration_sec");
  conn.prepare("get_track", "SELECT id,venue_id,active,title,artist,duration_sec FROM track WHERE id=$1");
  conn.prepare("list_tracks", "SELECT id,venue_id,active,title,artist,duration_sec FROM track WHERE venue_id=$1 ORDER BY id");

  // patron
  conn.prepare("insert_patron",
               "INSERT INTO patron(id,venue_id,account_id,table_tag,client_address,created_at_ms,last_seen_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7)");
  conn.prepare("update_patron", "UPDATE patron SET table_tag=$2,client_address=$3,last_seen_ms=$4 WHERE id=$1");
  conn.prepare("get_patron", SelectPatrons("WHERE id=$1"));
  conn.prepare("find_patron_by_account", SelectPatrons("WHERE venue_id=$1 AND account_id=$2 LIMIT 1"));
  conn.prepare("find_patron_by_session",
               SelectPatrons("WHERE venue_id=$1 AND account_id='' "
                             "AND (($2<>'' AND table_tag=$2) OR ($3<>'' AND client_address=$3)) "
                             "ORDER BY created_at_ms DESC, id DESC LIMIT 1"));

  // song_request
  conn.prepare("insert_request",
               "INSERT INTO song_request(id,venue_id,patron_id,track_id,status,queue_position,display_tag,"
               "submitted_at_ms,started_at_ms,completed_at_ms,cancelled_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11)");
  conn.prepare("get_request", SelectRequests("WHERE id=$1"));
  conn.prepare("get_request_status", "SELECT status FROM song_request WHERE id=$1");
  conn.prepare("update_request",
               "UPDATE song_request SET status=$2,queue_position=$3,display_tag=$4,"
               "started_at_ms=$5,completed_at_ms=$6,cancelled_at_ms=$7 WHERE id=$1 AND status=$8");
  conn.prepare("count_pending", "SELECT COUNT(*) FROM song_request WHERE venue_id=$1 AND status=1");
  conn.prepare("count_pending_for_patron", "SELECT COUNT(*) FROM song_request WHERE venue_id=$1 AND patron_id=$2 AND status=1");
  conn.prepare("has_outstanding",
               "SELECT 1 FROM song_request WHERE venue_id=$1 AND patron_id=$2 AND track_id=$3 AND status IN (1,2) LIMIT 1");
  conn.prepare("shift_pending_positions",
               "UPDATE song_request SET queue_position=queue_position-1 WHERE venue_id=$1 AND status=1 AND queue_position>$2");
  conn.prepare("list_pending", SelectRequests("WHERE venue_id=$1 AND status=1 ORDER BY queue_position ASC, submitted_at_ms ASC"));
  conn.prepare("list_venue_pending",
               SelectRequests("WHERE venue_id=$1 AND status=1 ORDER BY queue_position ASC, submitted_at_ms ASC LIMIT $2 OFFSET $3"));
  conn.prepare("list_venue_by_status",
               SelectRequests("WHERE venue_id=$1 AND status=$4 ORDER BY submitted_at_ms DESC, id DESC LIMIT $2 OFFSET $3"));
  conn.prepare("list_venue_all", SelectRequests("WHERE venue_id=$1 ORDER BY submitted_at_ms DESC, id DESC LIMIT $2 OFFSET $3"));
  conn.prepare("list_patron_by_status", SelectRequests("WHERE patron_id=$1 AND status=$3 ORDER BY submitted_at_ms DESC, id DESC LIMIT $2"));
  conn.prepare("list_patron_all", SelectRequests("WHERE patron_id=$1 ORDER BY submitted_at_ms DESC, id DESC LIMIT $2"));
  conn.prepare("count_by_status", "SELECT status, COUNT(*) FROM song_request WHERE venue_id=$1 GROUP BY status");
  conn.prepare("count_by_status_for_patron", "SELECT status, COUNT(*) FROM song_request WHERE patron_id=$1 GROUP BY status");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace songqueue::db::postgres
