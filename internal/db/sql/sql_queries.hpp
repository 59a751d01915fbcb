#pragma once

namespace relay::db::sql {

/*
  Canonical SQL for the sqlite backend.

  payload_key is "<subsystem>/<filename>"; timestamps are unix milliseconds.
*/

static constexpr const char* CREATE_STAGED_PAYLOAD =
    "CREATE TABLE IF NOT EXISTS staged_payload ("
    " payload_key TEXT PRIMARY KEY,"
    " subsystem TEXT NOT NULL,"
    " filename TEXT NOT NULL,"
    " run_identifier TEXT NOT NULL,"
    " size_bytes INTEGER NOT NULL,"
    " received_at_ms INTEGER NOT NULL,"
    " location INTEGER NOT NULL,"
    " flagged INTEGER NOT NULL DEFAULT 0);";

static constexpr const char* CREATE_DELIVERY =
    "CREATE TABLE IF NOT EXISTS delivery ("
    " payload_key TEXT NOT NULL REFERENCES staged_payload(payload_key) ON DELETE CASCADE,"
    " destination TEXT NOT NULL,"
    " state INTEGER NOT NULL,"
    " attempt_count INTEGER NOT NULL,"
    " terminal INTEGER NOT NULL,"
    " last_error TEXT NOT NULL,"
    " updated_at_ms INTEGER NOT NULL,"
    " PRIMARY KEY (payload_key, destination));";

// staged payloads

static constexpr const char* UPSERT_PAYLOAD =
    "INSERT INTO staged_payload(payload_key,subsystem,filename,run_identifier,size_bytes,received_at_ms,location,flagged)"
    " VALUES(?,?,?,?,?,?,?,?)"
    " ON CONFLICT(payload_key) DO UPDATE SET"
    " subsystem=excluded.subsystem,"
    " filename=excluded.filename,"
    " run_identifier=excluded.run_identifier,"
    " size_bytes=excluded.size_bytes,"
    " received_at_ms=excluded.received_at_ms,"
    " location=excluded.location,"
    " flagged=excluded.flagged;";

static constexpr const char* SELECT_PAYLOAD =
    "SELECT payload_key,subsystem,filename,run_identifier,size_bytes,received_at_ms,location,flagged"
    " FROM staged_payload WHERE payload_key=?;";

static constexpr const char* SELECT_ALL_PAYLOADS =
    "SELECT payload_key,subsystem,filename,run_identifier,size_bytes,received_at_ms,location,flagged"
    " FROM staged_payload ORDER BY payload_key;";

static constexpr const char* DELETE_PAYLOAD =
    "DELETE FROM staged_payload WHERE payload_key=?;";

static constexpr const char* PAYLOAD_EXISTS =
    "SELECT 1 FROM staged_payload WHERE payload_key=?;";

// deliveries

static constexpr const char* UPSERT_DELIVERY =
    "INSERT INTO delivery(payload_key,destination,state,attempt_count,terminal,last_error,updated_at_ms)"
    " VALUES(?,?,?,?,?,?,?)"
    " ON CONFLICT(payload_key,destination) DO UPDATE SET"
    " state=excluded.state,"
    " attempt_count=excluded.attempt_count,"
    " terminal=excluded.terminal,"
    " last_error=excluded.last_error,"
    " updated_at_ms=excluded.updated_at_ms;";

static constexpr const char* SELECT_DELIVERY =
    "SELECT payload_key,destination,state,attempt_count,terminal,last_error,updated_at_ms"
    " FROM delivery WHERE payload_key=? AND destination=?;";

static constexpr const char* SELECT_DELIVERIES_FOR_PAYLOAD =
    "SELECT payload_key,destination,state,attempt_count,terminal,last_error,updated_at_ms"
    " FROM delivery WHERE payload_key=? ORDER BY destination;";

static constexpr const char* SELECT_ALL_DELIVERIES =
    "SELECT payload_key,destination,state,attempt_count,terminal,last_error,updated_at_ms"
    " FROM delivery ORDER BY payload_key, destination;";

}
