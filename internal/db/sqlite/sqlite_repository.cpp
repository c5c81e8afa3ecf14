#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace commute::db::sqlite {

using commute::db::ErrorCode;
using commute::db::Result;

namespace {

using Statement = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

constexpr const char* kSampleColumns =
    "id,created_at,batch_id,batch_ts,origin_label,dest_label,description,"
    "meters,miles,duration_seconds,duration_static_minutes,duration_minutes";

Statement Prepare(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
        return Statement(nullptr, &sqlite3_finalize);
    }
    return Statement(st, &sqlite3_finalize);
}

// Reads have no Result channel; a broken statement is a storage failure.
Statement PrepareOrThrow(sqlite3* db, const std::string& sql) {
    auto st = Prepare(db, sql);
    if (!st) throw util::StorageError(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    return st;
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindDouble(sqlite3_stmt* st, int idx, const std::optional<double>& v) {
    if (v) {
        sqlite3_bind_double(st, idx, *v);
    } else {
        sqlite3_bind_null(st, idx);
    }
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<double> ColOptDouble(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return sqlite3_column_double(st, col);
}

model::SampleRecord ReadSample(sqlite3_stmt* st) {
    model::SampleRecord r;
    r.id                      = sqlite3_column_int64(st, 0);
    r.created_at              = ColText(st, 1);
    r.batch_id                = ColText(st, 2);
    r.batch_ts                = ColText(st, 3);
    r.origin_label            = ColText(st, 4);
    r.dest_label              = ColText(st, 5);
    r.description             = ColText(st, 6);
    r.meters                  = sqlite3_column_int64(st, 7);
    r.miles                   = sqlite3_column_double(st, 8);
    r.duration_seconds        = sqlite3_column_int64(st, 9);
    r.duration_static_minutes = sqlite3_column_int(st, 10);
    r.duration_minutes        = sqlite3_column_int(st, 11);
    return r;
}

std::vector<model::SampleRecord> CollectSamples(sqlite3* db, sqlite3_stmt* st) {
    std::vector<model::SampleRecord> out;
    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        out.push_back(ReadSample(st));
    }
    if (rc != SQLITE_DONE) throw util::StorageError(std::string("sqlite step: ") + sqlite3_errmsg(db));
    return out;
}

} // namespace

SqliteRepository::SqliteRepository(std::string path)
    : path_(std::move(path)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(std::make_shared<SqliteDB>(path_));
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Locations
// ------------------------------------------------------------------

std::optional<model::LocationRecord>
SqliteRepository::GetLocation(Transaction& t, const std::string& label) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db, "SELECT label,address,lat,lon,created_at FROM locations WHERE label=?;");
    BindText(st.get(), 1, label);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) throw util::StorageError(std::string("sqlite step: ") + sqlite3_errmsg(db));

    model::LocationRecord r;
    r.label      = ColText(st.get(), 0);
    r.address    = ColText(st.get(), 1);
    r.lat        = ColOptDouble(st.get(), 2);
    r.lon        = ColOptDouble(st.get(), 3);
    r.created_at = ColText(st.get(), 4);
    return r;
}

Result SqliteRepository::UpsertLocation(Transaction& t, const model::LocationRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO locations(label,address,lat,lon,created_at) VALUES(?,?,?,?,?) "
        "ON CONFLICT(label) DO UPDATE SET address=excluded.address, lat=excluded.lat, lon=excluded.lon;";

    auto st = Prepare(db, sql);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.label);
    BindText(st.get(), 2, r.address);
    BindDouble(st.get(), 3, r.lat);
    BindDouble(st.get(), 4, r.lon);
    BindText(st.get(), 5, r.created_at.empty() ? util::FormatUtcTimestamp(util::Now()) : r.created_at);

    return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Samples
// ------------------------------------------------------------------

Result SqliteRepository::InsertSample(Transaction& t, model::SampleRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO samples(created_at,batch_id,batch_ts,origin_label,dest_label,description,"
        "meters,miles,duration_seconds,duration_static_minutes,duration_minutes) "
        "VALUES(?,?,?,?,?,?,?,?,?,?,?);";

    auto st = Prepare(db, sql);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    if (r.created_at.empty()) r.created_at = util::FormatUtcTimestamp(util::Now());

    BindText(st.get(), 1, r.created_at);
    BindText(st.get(), 2, r.batch_id);
    BindText(st.get(), 3, r.batch_ts);
    BindText(st.get(), 4, r.origin_label);
    BindText(st.get(), 5, r.dest_label);
    BindText(st.get(), 6, r.description);
    BindI64(st.get(), 7, r.meters);
    sqlite3_bind_double(st.get(), 8, r.miles);
    BindI64(st.get(), 9, r.duration_seconds);
    BindI64(st.get(), 10, r.duration_static_minutes);
    BindI64(st.get(), 11, r.duration_minutes);

    auto result = Translate(db, sqlite3_step(st.get()));
    if (result) r.id = sqlite3_last_insert_rowid(db);
    return result;
}

std::vector<model::SampleRecord>
SqliteRepository::ListSamplesByBatch(Transaction& t, const std::string& batch_id) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db, std::string("SELECT ") + kSampleColumns + " FROM samples WHERE batch_id=? ORDER BY id;");
    BindText(st.get(), 1, batch_id);
    return CollectSamples(db, st.get());
}

std::vector<model::SampleRecord>
SqliteRepository::ListSamples(Transaction& t, const SampleQuery& q) {
    auto* db = TX(t).Handle();

    std::string sql = std::string("SELECT ") + kSampleColumns +
                      " FROM samples WHERE origin_label=? AND dest_label=? AND created_at>=?";
    if (q.time_of_day_start) sql += " AND time(created_at)>=?";
    if (q.time_of_day_end) sql += " AND time(created_at)<=?";

    if (q.limit) {
        // newest N, then back to chronological order
        sql = "SELECT * FROM (" + sql + " ORDER BY created_at DESC, id DESC LIMIT ?) ORDER BY created_at ASC, id ASC;";
    } else {
        sql += " ORDER BY created_at ASC, id ASC;";
    }

    auto st  = PrepareOrThrow(db, sql);
    int  idx = 1;
    BindText(st.get(), idx++, q.origin_label);
    BindText(st.get(), idx++, q.dest_label);
    BindText(st.get(), idx++, q.since);
    if (q.time_of_day_start) BindText(st.get(), idx++, *q.time_of_day_start);
    if (q.time_of_day_end) BindText(st.get(), idx++, *q.time_of_day_end);
    if (q.limit) BindI64(st.get(), idx++, static_cast<int64_t>(*q.limit));

    return CollectSamples(db, st.get());
}

} // namespace commute::db::sqlite
