// File: src/store/sqlite_telemetry_store.cpp
#include "somni/store/sqlite_telemetry_store.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>
#include <sqlite3.h>

namespace somni {
namespace {

struct StmtDeleter {
  void operator()(sqlite3_stmt* st) const { sqlite3_finalize(st); }
};
using StmtPtr = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

Status sqlite_status(sqlite3* db, int rc, const std::string& what) {
  const std::string msg = what + ": " + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
  if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) return Status::unavailable(msg);
  if (rc == SQLITE_CORRUPT || rc == SQLITE_NOTADB) return Status::corrupt_data(msg);
  return Status::io_error(msg);
}

Status exec_sql(sqlite3* db, const char* sql) {
  char* err = nullptr;
  if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "unknown error";
    sqlite3_free(err);
    return Status::io_error("SQLite exec failed: " + msg);
  }
  return Status::ok_status();
}

Result<StmtPtr> prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* raw = nullptr;
  const int rc = sqlite3_prepare_v2(db, sql, -1, &raw, nullptr);
  if (rc != SQLITE_OK) {
    sqlite3_finalize(raw);
    return Result<StmtPtr>::err(sqlite_status(db, rc, "prepare failed"));
  }
  return Result<StmtPtr>::ok(StmtPtr(raw));
}

void bind_optional_ts(sqlite3_stmt* st, int idx, const std::optional<TimestampNs>& t) {
  if (t) sqlite3_bind_int64(st, idx, t->ns);
  else sqlite3_bind_null(st, idx);
}

std::optional<TimestampNs> column_optional_ts(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return TimestampNs{sqlite3_column_int64(st, col)};
}

std::string column_text(sqlite3_stmt* st, int col) {
  const auto* p = reinterpret_cast<const char*>(sqlite3_column_text(st, col));
  return p ? std::string(p) : std::string();
}

Result<PresenceEvent> read_presence_row(sqlite3_stmt* st) {
  PresenceEvent e;
  e.timestamp = TimestampNs{sqlite3_column_int64(st, 0)};
  auto kind = parse_presence_event_kind(column_text(st, 1));
  if (!kind.ok()) return Result<PresenceEvent>::err(Status::corrupt_data(kind.status().message()));
  e.kind = kind.take_value();
  e.idle_seconds = sqlite3_column_double(st, 2);
  e.duration_minutes = sqlite3_column_double(st, 3);
  return Result<PresenceEvent>::ok(e);
}

}  // namespace

void SqliteTelemetryStore::DbCloser::operator()(sqlite3* db) const {
  if (db) sqlite3_close(db);
}

SqliteTelemetryStore::SqliteTelemetryStore(std::string db_path) : db_path_(std::move(db_path)) {}

SqliteTelemetryStore::~SqliteTelemetryStore() { close(); }

Status SqliteTelemetryStore::open() {
  std::lock_guard<std::mutex> lock(mu_);
  db_.reset();

  const std::filesystem::path p(db_path_);
  if (p.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(p.parent_path(), ec);
    if (ec) {
      return Status::io_error("failed creating directory for '" + db_path_ + "': " + ec.message());
    }
  }

  sqlite3* raw = nullptr;
  const int rc = sqlite3_open(db_path_.c_str(), &raw);
  db_.reset(raw);
  if (rc != SQLITE_OK) {
    const Status st = sqlite_status(raw, rc, "cannot open SQLite DB at " + db_path_);
    db_.reset();
    return st;
  }
  sqlite3_busy_timeout(db_.get(), 2000);

  const Status st = init_schema_();
  if (!st.ok()) {
    db_.reset();
    return st;
  }
  spdlog::debug("telemetry store opened: {}", db_path_);
  return Status::ok_status();
}

void SqliteTelemetryStore::close() {
  std::lock_guard<std::mutex> lock(mu_);
  db_.reset();
}

Status SqliteTelemetryStore::check_open_() const {
  if (!db_) return Status::unavailable("telemetry store is not open: " + db_path_);
  return Status::ok_status();
}

Status SqliteTelemetryStore::init_schema_() {
  const char* schema = R"SQL(
    PRAGMA journal_mode=WAL;
    CREATE TABLE IF NOT EXISTS presence_events (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        ts_ns INTEGER NOT NULL,
        kind TEXT NOT NULL,
        idle_seconds REAL NOT NULL DEFAULT 0,
        duration_minutes REAL NOT NULL DEFAULT 0
    );
    CREATE INDEX IF NOT EXISTS idx_presence_ts ON presence_events(ts_ns);

    CREATE TABLE IF NOT EXISTS sleep_segments (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        start_ns INTEGER NOT NULL,
        end_ns INTEGER,
        duration_minutes REAL,
        source TEXT NOT NULL,
        raw_note TEXT NOT NULL DEFAULT ''
    );
    CREATE INDEX IF NOT EXISTS idx_sleep_start ON sleep_segments(start_ns);
    CREATE INDEX IF NOT EXISTS idx_sleep_end ON sleep_segments(end_ns);

    CREATE TABLE IF NOT EXISTS wake_segments (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        start_ns INTEGER NOT NULL,
        end_ns INTEGER,
        estimated_minutes REAL NOT NULL DEFAULT 0,
        source TEXT NOT NULL,
        notes TEXT NOT NULL DEFAULT ''
    );
    CREATE INDEX IF NOT EXISTS idx_wake_start ON wake_segments(start_ns);
    CREATE INDEX IF NOT EXISTS idx_wake_end ON wake_segments(end_ns);
  )SQL";
  return exec_sql(db_.get(), schema);
}

Status SqliteTelemetryStore::append_presence_event(const PresenceEvent& e) {
  std::lock_guard<std::mutex> lock(mu_);
  SOMNI_RETURN_IF_ERROR(check_open_());
  sqlite3* db = db_.get();

  auto last_r = prepare(db, "SELECT MAX(ts_ns) FROM presence_events;");
  if (!last_r.ok()) return last_r.status();
  StmtPtr last = last_r.take_value();
  const int rc_last = sqlite3_step(last.get());
  if (rc_last != SQLITE_ROW) return sqlite_status(db, rc_last, "reading newest presence event");
  if (sqlite3_column_type(last.get(), 0) != SQLITE_NULL &&
      e.timestamp.ns < sqlite3_column_int64(last.get(), 0)) {
    return Status::invalid_argument("presence event older than the newest stored event");
  }

  auto ins_r = prepare(db,
                       "INSERT INTO presence_events (ts_ns, kind, idle_seconds, duration_minutes) "
                       "VALUES (?, ?, ?, ?);");
  if (!ins_r.ok()) return ins_r.status();
  StmtPtr ins = ins_r.take_value();
  sqlite3_bind_int64(ins.get(), 1, e.timestamp.ns);
  sqlite3_bind_text(ins.get(), 2, to_string(e.kind), -1, SQLITE_STATIC);
  sqlite3_bind_double(ins.get(), 3, e.idle_seconds);
  sqlite3_bind_double(ins.get(), 4, e.duration_minutes);

  const int rc = sqlite3_step(ins.get());
  if (rc != SQLITE_DONE) return sqlite_status(db, rc, "failed to insert presence event");
  return Status::ok_status();
}

Result<std::vector<PresenceEvent>> SqliteTelemetryStore::presence_events_since(TimestampNs since) const {
  using R = Result<std::vector<PresenceEvent>>;
  std::lock_guard<std::mutex> lock(mu_);
  const Status open_st = check_open_();
  if (!open_st.ok()) return R::err(open_st);

  auto st_r = prepare(db_.get(),
                      "SELECT ts_ns, kind, idle_seconds, duration_minutes FROM presence_events "
                      "WHERE ts_ns >= ? ORDER BY ts_ns ASC, id ASC;");
  if (!st_r.ok()) return R::err(st_r.status());
  StmtPtr st = st_r.take_value();
  sqlite3_bind_int64(st.get(), 1, since.ns);

  std::vector<PresenceEvent> out;
  int rc = SQLITE_OK;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    auto e = read_presence_row(st.get());
    if (!e.ok()) return R::err(e.status());
    out.push_back(e.take_value());
  }
  if (rc != SQLITE_DONE) return R::err(sqlite_status(db_.get(), rc, "reading presence events"));
  return R::ok(std::move(out));
}

Result<std::optional<PresenceEvent>> SqliteTelemetryStore::latest_presence_event() const {
  using R = Result<std::optional<PresenceEvent>>;
  std::lock_guard<std::mutex> lock(mu_);
  const Status open_st = check_open_();
  if (!open_st.ok()) return R::err(open_st);

  auto st_r = prepare(db_.get(),
                      "SELECT ts_ns, kind, idle_seconds, duration_minutes FROM presence_events "
                      "ORDER BY ts_ns DESC, id DESC LIMIT 1;");
  if (!st_r.ok()) return R::err(st_r.status());
  StmtPtr st = st_r.take_value();

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return R::ok(std::nullopt);
  if (rc != SQLITE_ROW) return R::err(sqlite_status(db_.get(), rc, "reading latest presence event"));

  auto e = read_presence_row(st.get());
  if (!e.ok()) return R::err(e.status());
  return R::ok(e.take_value());
}

Result<std::size_t> SqliteTelemetryStore::prune_presence_events_before(TimestampNs cutoff) {
  using R = Result<std::size_t>;
  std::lock_guard<std::mutex> lock(mu_);
  const Status open_st = check_open_();
  if (!open_st.ok()) return R::err(open_st);

  auto st_r = prepare(db_.get(), "DELETE FROM presence_events WHERE ts_ns < ?;");
  if (!st_r.ok()) return R::err(st_r.status());
  StmtPtr st = st_r.take_value();
  sqlite3_bind_int64(st.get(), 1, cutoff.ns);

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return R::err(sqlite_status(db_.get(), rc, "pruning presence events"));
  return R::ok(static_cast<std::size_t>(sqlite3_changes(db_.get())));
}

Result<std::int64_t> SqliteTelemetryStore::append_sleep_segment(const SleepSegment& s) {
  using R = Result<std::int64_t>;
  if (s.end && *s.end < s.start) return R::err(Status::invalid_argument("sleep segment ends before it starts"));

  std::lock_guard<std::mutex> lock(mu_);
  const Status open_st = check_open_();
  if (!open_st.ok()) return R::err(open_st);

  auto st_r = prepare(db_.get(),
                      "INSERT INTO sleep_segments (start_ns, end_ns, duration_minutes, source, raw_note) "
                      "VALUES (?, ?, ?, ?, ?);");
  if (!st_r.ok()) return R::err(st_r.status());
  StmtPtr st = st_r.take_value();
  sqlite3_bind_int64(st.get(), 1, s.start.ns);
  bind_optional_ts(st.get(), 2, s.end);
  if (s.end) sqlite3_bind_double(st.get(), 3, s.duration_minutes());
  else sqlite3_bind_null(st.get(), 3);
  sqlite3_bind_text(st.get(), 4, to_string(s.source), -1, SQLITE_STATIC);
  sqlite3_bind_text(st.get(), 5, s.raw_note.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return R::err(sqlite_status(db_.get(), rc, "failed to insert sleep segment"));
  return R::ok(sqlite3_last_insert_rowid(db_.get()));
}

Result<std::int64_t> SqliteTelemetryStore::append_wake_segment(const WakeSegment& w) {
  using R = Result<std::int64_t>;
  if (w.end && *w.end < w.start) return R::err(Status::invalid_argument("wake segment ends before it starts"));

  std::lock_guard<std::mutex> lock(mu_);
  const Status open_st = check_open_();
  if (!open_st.ok()) return R::err(open_st);

  auto st_r = prepare(db_.get(),
                      "INSERT INTO wake_segments (start_ns, end_ns, estimated_minutes, source, notes) "
                      "VALUES (?, ?, ?, ?, ?);");
  if (!st_r.ok()) return R::err(st_r.status());
  StmtPtr st = st_r.take_value();
  sqlite3_bind_int64(st.get(), 1, w.start.ns);
  bind_optional_ts(st.get(), 2, w.end);
  sqlite3_bind_double(st.get(), 3, w.estimated_minutes);
  sqlite3_bind_text(st.get(), 4, to_string(w.source), -1, SQLITE_STATIC);
  sqlite3_bind_text(st.get(), 5, w.notes.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return R::err(sqlite_status(db_.get(), rc, "failed to insert wake segment"));
  return R::ok(sqlite3_last_insert_rowid(db_.get()));
}

Result<std::vector<SleepSegment>> SqliteTelemetryStore::sleep_segments_overlapping(TimestampNs from,
                                                                                   TimestampNs to) const {
  using R = Result<std::vector<SleepSegment>>;
  std::lock_guard<std::mutex> lock(mu_);
  const Status open_st = check_open_();
  if (!open_st.ok()) return R::err(open_st);

  auto st_r = prepare(db_.get(),
                      "SELECT id, start_ns, end_ns, source, raw_note FROM sleep_segments "
                      "WHERE start_ns < ?1 AND (end_ns IS NULL OR end_ns >= ?2) "
                      "ORDER BY start_ns ASC, id ASC;");
  if (!st_r.ok()) return R::err(st_r.status());
  StmtPtr st = st_r.take_value();
  sqlite3_bind_int64(st.get(), 1, to.ns);
  sqlite3_bind_int64(st.get(), 2, from.ns);

  std::vector<SleepSegment> out;
  int rc = SQLITE_OK;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    SleepSegment s;
    s.id = sqlite3_column_int64(st.get(), 0);
    s.start = TimestampNs{sqlite3_column_int64(st.get(), 1)};
    s.end = column_optional_ts(st.get(), 2);
    auto src = parse_segment_source(column_text(st.get(), 3));
    if (!src.ok()) return R::err(Status::corrupt_data("sleep segment " + std::to_string(s.id) + ": " +
                                                      src.status().message()));
    s.source = src.take_value();
    s.raw_note = column_text(st.get(), 4);
    out.push_back(std::move(s));
  }
  if (rc != SQLITE_DONE) return R::err(sqlite_status(db_.get(), rc, "reading sleep segments"));
  return R::ok(std::move(out));
}

Result<std::vector<WakeSegment>> SqliteTelemetryStore::wake_segments_overlapping(TimestampNs from,
                                                                                 TimestampNs to) const {
  using R = Result<std::vector<WakeSegment>>;
  std::lock_guard<std::mutex> lock(mu_);
  const Status open_st = check_open_();
  if (!open_st.ok()) return R::err(open_st);

  // Estimated segments end at start + estimated_minutes; no end and no estimate is open-ended.
  auto st_r = prepare(db_.get(),
                      "SELECT id, start_ns, end_ns, estimated_minutes, source, notes FROM wake_segments "
                      "WHERE start_ns < ?1 AND ("
                      "  (end_ns IS NULL AND estimated_minutes <= 0) OR "
                      "  COALESCE(end_ns, start_ns + CAST(estimated_minutes * 60000000000.0 AS INTEGER)) >= ?2) "
                      "ORDER BY start_ns ASC, id ASC;");
  if (!st_r.ok()) return R::err(st_r.status());
  StmtPtr st = st_r.take_value();
  sqlite3_bind_int64(st.get(), 1, to.ns);
  sqlite3_bind_int64(st.get(), 2, from.ns);

  std::vector<WakeSegment> out;
  int rc = SQLITE_OK;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    WakeSegment w;
    w.id = sqlite3_column_int64(st.get(), 0);
    w.start = TimestampNs{sqlite3_column_int64(st.get(), 1)};
    w.end = column_optional_ts(st.get(), 2);
    w.estimated_minutes = sqlite3_column_double(st.get(), 3);
    auto src = parse_segment_source(column_text(st.get(), 4));
    if (!src.ok()) return R::err(Status::corrupt_data("wake segment " + std::to_string(w.id) + ": " +
                                                      src.status().message()));
    w.source = src.take_value();
    w.notes = column_text(st.get(), 5);
    out.push_back(std::move(w));
  }
  if (rc != SQLITE_DONE) return R::err(sqlite_status(db_.get(), rc, "reading wake segments"));
  return R::ok(std::move(out));
}

}  // namespace somni
