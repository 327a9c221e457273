#pragma once

namespace songqueue::db::sql {

/*
  Canonical SQL for the embedded backend.

  Placeholders use SQLite's numbered form (?1 ?2 ...). The Postgres
  backend prepares the same statements with $1 $2 ... in PgPool.
*/

// venue

static constexpr const char* UPSERT_VENUE =
    "INSERT INTO venue(id,name,active,max_requests_per_patron,queue_limit)"
    " VALUES(?1,?2,?3,?4,?5)"
    " ON CONFLICT(id) DO UPDATE SET"
    " name=excluded.name,"
    " active=excluded.active,"
    " max_requests_per_patron=excluded.max_requests_per_patron,"
    " queue_limit=excluded.queue_limit;";

static constexpr const char* SELECT_VENUE =
    "SELECT id,name,active,max_requests_per_patron,queue_limit"
    " FROM venue WHERE id=?1;";

// track

static constexpr const char* UPSERT_TRACK =
    "INSERT INTO track(id,venue_id,active,title,artist,duration_sec)"
    " VALUES(?1,?2,?3,?4,?5,?6)"
    " ON CONFLICT(id) DO UPDATE SET"
    " venue_id=excluded.venue_id,"
    " active=excluded.active,"
    " title=excluded.title,"
    " artist=excluded.artist,"
    " duration_sec=excluded.duration_sec;";

static constexpr const char* SELECT_TRACK =
    "SELECT id,venue_id,active,title,artist,duration_sec"
    " FROM track WHERE id=?1;";

static constexpr const char* SELECT_TRACKS_BY_VENUE =
    "SELECT id,venue_id,active,title,artist,duration_sec"
    " FROM track WHERE venue_id=?1 ORDER BY id;";

// patron

static constexpr const char* INSERT_PATRON =
    "INSERT INTO patron(id,venue_id,account_id,table_tag,client_address,created_at_ms,last_seen_ms)"
    " VALUES(?1,?2,?3,?4,?5,?6,?7);";

static constexpr const char* UPDATE_PATRON =
    "UPDATE patron SET table_tag=?2,client_address=?3,last_seen_ms=?4"
    " WHERE id=?1;";

static constexpr const char* SELECT_PATRON =
    "SELECT id,venue_id,account_id,table_tag,client_address,created_at_ms,last_seen_ms"
    " FROM patron WHERE id=?1;";

static constexpr const char* SELECT_PATRON_BY_ACCOUNT =
    "SELECT id,venue_id,account_id,table_tag,client_address,created_at_ms,last_seen_ms"
    " FROM patron WHERE venue_id=?1 AND account_id=?2 LIMIT 1;";

static constexpr const char* SELECT_PATRON_BY_SESSION =
    "SELECT id,venue_id,account_id,table_tag,client_address,created_at_ms,last_seen_ms"
    " FROM patron WHERE venue_id=?1 AND account_id=''"
    " AND ((?2<>'' AND table_tag=?2) OR (?3<>'' AND client_address=?3))"
    " ORDER BY created_at_ms DESC, id DESC LIMIT 1;";

// song_request

static constexpr const char* INSERT_REQUEST =
    "INSERT INTO song_request(id,venue_id,patron_id,track_id,status,queue_position,display_tag,"
    "submitted_at_ms,started_at_ms,completed_at_ms,cancelled_at_ms)"
    " VALUES(?1,?2,?3,?4,?5,?6,?7,?8,?9,?10,?11);";

static constexpr const char* SELECT_REQUEST =
    "SELECT id,venue_id,patron_id,track_id,status,queue_position,display_tag,"
    "submitted_at_ms,started_at_ms,completed_at_ms,cancelled_at_ms"
    " FROM song_request WHERE id=?1;";

static constexpr const char* SELECT_REQUEST_STATUS =
    "SELECT status FROM song_request WHERE id=?1;";

// Guarded by the status the caller observed.
static constexpr const char* UPDATE_REQUEST =
    "UPDATE song_request SET status=?2,queue_position=?3,display_tag=?4,"
    "started_at_ms=?5,completed_at_ms=?6,cancelled_at_ms=?7"
    " WHERE id=?1 AND status=?8;";

static constexpr const char* COUNT_PENDING =
    "SELECT COUNT(*) FROM song_request WHERE venue_id=?1 AND status=1;";

static constexpr const char* COUNT_PENDING_FOR_PATRON =
    "SELECT COUNT(*) FROM song_request WHERE venue_id=?1 AND patron_id=?2 AND status=1;";

static constexpr const char* HAS_OUTSTANDING =
    "SELECT 1 FROM song_request"
    " WHERE venue_id=?1 AND patron_id=?2 AND track_id=?3 AND status IN (1,2) LIMIT 1;";

static constexpr const char* SHIFT_PENDING_POSITIONS =
    "UPDATE song_request SET queue_position=queue_position-1"
    " WHERE venue_id=?1 AND status=1 AND queue_position>?2;";

static constexpr const char* SELECT_PENDING =
    "SELECT id,venue_id,patron_id,track_id,status,queue_position,display_tag,"
    "submitted_at_ms,started_at_ms,completed_at_ms,cancelled_at_ms"
    " FROM song_request WHERE venue_id=?1 AND status=1"
    " ORDER BY queue_position ASC, submitted_at_ms ASC;";

static constexpr const char* SELECT_VENUE_REQUESTS_PENDING =
    "SELECT id,venue_id,patron_id,track_id,status,queue_position,display_tag,"
    "submitted_at_ms,started_at_ms,completed_at_ms,cancelled_at_ms"
    " FROM song_request WHERE venue_id=?1 AND status=1"
    " ORDER BY queue_position ASC, submitted_at_ms ASC LIMIT ?2 OFFSET ?3;";

static constexpr const char* SELECT_VENUE_REQUESTS_BY_STATUS =
    "SELECT id,venue_id,patron_id,track_id,status,queue_position,display_tag,"
    "submitted_at_ms,started_at_ms,completed_at_ms,cancelled_at_ms"
    " FROM song_request WHERE venue_id=?1 AND status=?4"
    " ORDER BY submitted_at_ms DESC, id DESC LIMIT ?2 OFFSET ?3;";

static constexpr const char* SELECT_VENUE_REQUESTS_ALL =
    "SELECT id,venue_id,patron_id,track_id,status,queue_position,display_tag,"
    "submitted_at_ms,started_at_ms,completed_at_ms,cancelled_at_ms"
    " FROM song_request WHERE venue_id=?1"
    " ORDER BY submitted_at_ms DESC, id DESC LIMIT ?2 OFFSET ?3;";

static constexpr const char* SELECT_PATRON_REQUESTS_BY_STATUS =
    "SELECT id,venue_id,patron_id,track_id,status,queue_position,display_tag,"
    "submitted_at_ms,started_at_ms,completed_at_ms,cancelled_at_ms"
    " FROM song_request WHERE patron_id=?1 AND status=?3"
    " ORDER BY submitted_at_ms DESC, id DESC LIMIT ?2;";

static constexpr const char* SELECT_PATRON_REQUESTS_ALL =
    "SELECT id,venue_id,patron_id,track_id,status,queue_position,display_tag,"
    "submitted_at_ms,started_at_ms,completed_at_ms,cancelled_at_ms"
    " FROM song_request WHERE patron_id=?1"
    " ORDER BY submitted_at_ms DESC, id DESC LIMIT ?2;";

static constexpr const char* COUNT_BY_STATUS =
    "SELECT status, COUNT(*) FROM song_request WHERE venue_id=?1 GROUP BY status;";

static constexpr const char* COUNT_BY_STATUS_FOR_PATRON =
    "SELECT status, COUNT(*) FROM song_request WHERE patron_id=?1 GROUP BY status;";

} // namespace songqueue::db::sql
