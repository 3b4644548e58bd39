#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace netorch::db::sqlite {

using netorch::db::ErrorCode;
using netorch::db::Result;

namespace {

using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

StmtPtr Prepare(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
        throw std::runtime_error("sqlite prepare: " + std::string(sqlite3_errmsg(db)));
    }
    return StmtPtr(st, &sqlite3_finalize);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
    sqlite3_bind_double(st, idx, v);
}

// 0 means "let sqlite assign the rowid"
void BindId(sqlite3_stmt* st, int idx, int64_t id) {
    if (id == 0) sqlite3_bind_null(st, idx);
    else BindI64(st, idx, id);
}

template <typename T>
void BindOptional(sqlite3_stmt* st, int idx, const std::optional<T>& v) {
    if (!v) {
        sqlite3_bind_null(st, idx);
    } else if constexpr (std::is_same_v<T, std::string>) {
        BindText(st, idx, *v);
    } else {
        BindI64(st, idx, *v);
    }
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

double ColDouble(sqlite3_stmt* st, int col) {
    return sqlite3_column_double(st, col);
}

bool ColIsNull(sqlite3_stmt* st, int col) {
    return sqlite3_column_type(st, col) == SQLITE_NULL;
}

netorch::model::NodeState ColState(sqlite3_stmt* st, int col) {
    auto text  = ColText(st, col);
    auto state = netorch::model::ParseNodeState(text);
    if (!state) throw std::runtime_error("unknown node state in store: " + text);
    return *state;
}

constexpr const char* kDeploymentColumns = "id,name,description,target_node_count,created_at,updated_at";
constexpr const char* kNodeColumns       = "id,deployment_id,node_id,hostname,state,ip_address,created_at,updated_at,state_changed_at";
constexpr const char* kSampleColumns     = "id,node_id,deployment_id,sampled_at,latency_ms,throughput_gbps,error_rate";
constexpr const char* kEventColumns      = "id,deployment_id,node_id,event_type,message,metadata,created_at";

model::DeploymentRecord ReadDeployment(sqlite3_stmt* st) {
    model::DeploymentRecord r;
    r.id                = ColI64(st, 0);
    r.name              = ColText(st, 1);
    r.description       = ColText(st, 2);
    r.target_node_count = static_cast<uint32_t>(ColI64(st, 3));
    r.created_at_ms     = ColI64(st, 4);
    r.updated_at_ms     = ColI64(st, 5);
    return r;
}

model::NodeRecord ReadNode(sqlite3_stmt* st) {
    model::NodeRecord r;
    r.id            = ColI64(st, 0);
    r.deployment_id = ColI64(st, 1);
    r.node_id       = ColText(st, 2);
    r.hostname      = ColText(st, 3);
    r.state         = ColState(st, 4);
    if (!ColIsNull(st, 5)) r.ip_address = ColText(st, 5);
    r.created_at_ms       = ColI64(st, 6);
    r.updated_at_ms       = ColI64(st, 7);
    r.state_changed_at_ms = ColI64(st, 8);
    return r;
}

model::TelemetrySampleRecord ReadSample(sqlite3_stmt* st) {
    model::TelemetrySampleRecord r;
    r.id              = ColI64(st, 0);
    r.node_id         = ColI64(st, 1);
    r.deployment_id   = ColI64(st, 2);
    r.timestamp_ms    = ColI64(st, 3);
    r.latency_ms      = ColDouble(st, 4);
    r.throughput_gbps = ColDouble(st, 5);
    r.error_rate      = ColDouble(st, 6);
    return r;
}

model::EventRecord ReadEvent(sqlite3_stmt* st) {
    model::EventRecord r;
    r.id = ColI64(st, 0);
    if (!ColIsNull(st, 1)) r.deployment_id = ColI64(st, 1);
    if (!ColIsNull(st, 2)) r.node_id = ColI64(st, 2);
    r.event_type    = ColText(st, 3);
    r.message       = ColText(st, 4);
    r.metadata      = ColText(st, 5);
    r.created_at_ms = ColI64(st, 6);
    return r;
}

template <typename Row, typename Reader>
std::vector<Row> ReadAll(sqlite3_stmt* st, Reader reader) {
    std::vector<Row> out;
    while (sqlite3_step(st) == SQLITE_ROW) {
        out.push_back(reader(st));
    }
    return out;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            if (sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_UNIQUE ||
                sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_PRIMARYKEY)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
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
// Deployments
// ------------------------------------------------------------------

Result SqliteRepository::InsertDeployment(Transaction& t, model::DeploymentRecord& r) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db,
        "INSERT INTO deployments(id,name,description,target_node_count,created_at,updated_at) "
        "VALUES(?,?,?,?,?,?);");

    BindId(st.get(), 1, r.id);
    BindText(st.get(), 2, r.name);
    BindText(st.get(), 3, r.description);
    BindI64(st.get(), 4, r.target_node_count);
    BindI64(st.get(), 5, r.created_at_ms);
    BindI64(st.get(), 6, r.updated_at_ms);

    auto result = Translate(db, sqlite3_step(st.get()));
    if (result) r.id = sqlite3_last_insert_rowid(db);
    return result;
}

std::optional<model::DeploymentRecord>
SqliteRepository::GetDeployment(Transaction& t, int64_t id) {
    auto st = Prepare(TX(t).Handle(), std::string("SELECT ") + kDeploymentColumns + " FROM deployments WHERE id=?;");
    BindI64(st.get(), 1, id);

    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ReadDeployment(st.get());
}

std::vector<model::DeploymentRecord>
SqliteRepository::ListDeployments(Transaction& t, const Pagination& page) {
    auto st = Prepare(TX(t).Handle(),
        std::string("SELECT ") + kDeploymentColumns + " FROM deployments ORDER BY id DESC LIMIT ? OFFSET ?;");
    BindI64(st.get(), 1, static_cast<int64_t>(page.limit));
    BindI64(st.get(), 2, static_cast<int64_t>(page.offset));

    return ReadAll<model::DeploymentRecord>(st.get(), ReadDeployment);
}

uint64_t SqliteRepository::CountDeployments(Transaction& t) {
    auto st = Prepare(TX(t).Handle(), "SELECT COUNT(*) FROM deployments;");
    if (sqlite3_step(st.get()) != SQLITE_ROW) return 0;
    return static_cast<uint64_t>(ColI64(st.get(), 0));
}

Result SqliteRepository::DeleteDeployment(Transaction& t, int64_t id) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, "DELETE FROM deployments WHERE id=?;");
    BindI64(st.get(), 1, id);

    auto result = Translate(db, sqlite3_step(st.get()));
    if (result && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "deployment " + std::to_string(id));
    return result;
}

// ------------------------------------------------------------------
// Nodes
// ------------------------------------------------------------------

Result SqliteRepository::InsertNode(Transaction& t, model::NodeRecord& r) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db,
        "INSERT INTO nodes(id,deployment_id,node_id,hostname,state,ip_address,created_at,updated_at,state_changed_at) "
        "VALUES(?,?,?,?,?,?,?,?,?);");

    BindId(st.get(), 1, r.id);
    BindI64(st.get(), 2, r.deployment_id);
    BindText(st.get(), 3, r.node_id);
    BindText(st.get(), 4, r.hostname);
    BindText(st.get(), 5, std::string(netorch::model::ToString(r.state)));
    BindOptional(st.get(), 6, r.ip_address);
    BindI64(st.get(), 7, r.created_at_ms);
    BindI64(st.get(), 8, r.updated_at_ms);
    BindI64(st.get(), 9, r.state_changed_at_ms);

    auto result = Translate(db, sqlite3_step(st.get()));
    if (result) r.id = sqlite3_last_insert_rowid(db);
    return result;
}

std::optional<model::NodeRecord> SqliteRepository::GetNode(Transaction& t, int64_t id) {
    auto st = Prepare(TX(t).Handle(), std::string("SELECT ") + kNodeColumns + " FROM nodes WHERE id=?;");
    BindI64(st.get(), 1, id);

    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ReadNode(st.get());
}

std::vector<model::NodeRecord>
SqliteRepository::ListNodesByDeployment(Transaction& t, int64_t deployment_id) {
    auto st = Prepare(TX(t).Handle(),
        std::string("SELECT ") + kNodeColumns + " FROM nodes WHERE deployment_id=? ORDER BY id ASC;");
    BindI64(st.get(), 1, deployment_id);

    return ReadAll<model::NodeRecord>(st.get(), ReadNode);
}

std::vector<model::NodeRecord>
SqliteRepository::ListNodesByState(Transaction& t, const std::vector<netorch::model::NodeState>& states) {
    if (states.empty()) return {};

    std::string sql = std::string("SELECT ") + kNodeColumns + " FROM nodes WHERE state IN (";
    for (std::size_t i = 0; i < states.size(); ++i) {
        sql += i == 0 ? "?" : ",?";
    }
    sql += ") ORDER BY id ASC;";

    auto st = Prepare(TX(t).Handle(), sql);
    int  bind_idx = 1;
    for (auto state : states) {
        BindText(st.get(), bind_idx++, std::string(netorch::model::ToString(state)));
    }

    return ReadAll<model::NodeRecord>(st.get(), ReadNode);
}

uint64_t SqliteRepository::CountNodes(Transaction& t, int64_t deployment_id) {
    auto st = Prepare(TX(t).Handle(), "SELECT COUNT(*) FROM nodes WHERE deployment_id=?;");
    BindI64(st.get(), 1, deployment_id);
    if (sqlite3_step(st.get()) != SQLITE_ROW) return 0;
    return static_cast<uint64_t>(ColI64(st.get(), 0));
}

Result SqliteRepository::UpdateNode(Transaction& t, const model::NodeRecord& r) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db,
        "UPDATE nodes SET hostname=?,state=?,ip_address=?,updated_at=?,state_changed_at=? WHERE id=?;");

    BindText(st.get(), 1, r.hostname);
    BindText(st.get(), 2, std::string(netorch::model::ToString(r.state)));
    BindOptional(st.get(), 3, r.ip_address);
    BindI64(st.get(), 4, r.updated_at_ms);
    BindI64(st.get(), 5, r.state_changed_at_ms);
    BindI64(st.get(), 6, r.id);

    auto result = Translate(db, sqlite3_step(st.get()));
    if (result && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "node " + std::to_string(r.id));
    return result;
}

// ------------------------------------------------------------------
// Telemetry
// ------------------------------------------------------------------

Result SqliteRepository::InsertTelemetrySample(Transaction& t, model::TelemetrySampleRecord& r) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db,
        "INSERT INTO telemetry_samples(id,node_id,deployment_id,sampled_at,latency_ms,throughput_gbps,error_rate) "
        "VALUES(?,?,?,?,?,?,?);");

    BindId(st.get(), 1, r.id);
    BindI64(st.get(), 2, r.node_id);
    BindI64(st.get(), 3, r.deployment_id);
    BindI64(st.get(), 4, r.timestamp_ms);
    BindDouble(st.get(), 5, r.latency_ms);
    BindDouble(st.get(), 6, r.throughput_gbps);
    BindDouble(st.get(), 7, r.error_rate);

    auto result = Translate(db, sqlite3_step(st.get()));
    if (result) r.id = sqlite3_last_insert_rowid(db);
    return result;
}

std::vector<model::TelemetrySampleRecord>
SqliteRepository::ListTelemetry(Transaction& t, const TelemetryQuery& q) {
    std::string sql = std::string("SELECT ") + kSampleColumns + " FROM telemetry_samples WHERE deployment_id=?";
    if (q.node_id) sql += " AND node_id=?";
    if (q.start_ms) sql += " AND sampled_at>=?";
    if (q.end_ms) sql += " AND sampled_at<=?";
    sql += " ORDER BY sampled_at DESC, id DESC";
    if (q.limit) sql += " LIMIT ?";
    sql += ";";

    auto st       = Prepare(TX(t).Handle(), sql);
    int  bind_idx = 1;
    BindI64(st.get(), bind_idx++, q.deployment_id);
    if (q.node_id) BindI64(st.get(), bind_idx++, *q.node_id);
    if (q.start_ms) BindI64(st.get(), bind_idx++, *q.start_ms);
    if (q.end_ms) BindI64(st.get(), bind_idx++, *q.end_ms);
    if (q.limit) BindI64(st.get(), bind_idx++, static_cast<int64_t>(*q.limit));

    return ReadAll<model::TelemetrySampleRecord>(st.get(), ReadSample);
}

// ------------------------------------------------------------------
// Events
// ------------------------------------------------------------------

Result SqliteRepository::InsertEvent(Transaction& t, model::EventRecord& r) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db,
        "INSERT INTO events(id,deployment_id,node_id,event_type,message,metadata,created_at) "
        "VALUES(?,?,?,?,?,?,?);");

    BindId(st.get(), 1, r.id);
    BindOptional(st.get(), 2, r.deployment_id);
    BindOptional(st.get(), 3, r.node_id);
    BindText(st.get(), 4, r.event_type);
    BindText(st.get(), 5, r.message);
    BindText(st.get(), 6, r.metadata);
    BindI64(st.get(), 7, r.created_at_ms);

    auto result = Translate(db, sqlite3_step(st.get()));
    if (result) r.id = sqlite3_last_insert_rowid(db);
    return result;
}

std::vector<model::EventRecord> SqliteRepository::ListEvents(Transaction& t, const EventQuery& q) {
    std::string sql = std::string("SELECT ") + kEventColumns + " FROM events WHERE 1=1";
    if (q.deployment_id) sql += " AND deployment_id=?";
    if (q.node_id) sql += " AND node_id=?";
    sql += " ORDER BY id ASC";
    if (q.limit) sql += " LIMIT ?";
    sql += ";";

    auto st       = Prepare(TX(t).Handle(), sql);
    int  bind_idx = 1;
    if (q.deployment_id) BindI64(st.get(), bind_idx++, *q.deployment_id);
    if (q.node_id) BindI64(st.get(), bind_idx++, *q.node_id);
    if (q.limit) BindI64(st.get(), bind_idx++, static_cast<int64_t>(*q.limit));

    return ReadAll<model::EventRecord>(st.get(), ReadEvent);
}

// ------------------------------------------------------------------
// Health
// ------------------------------------------------------------------

bool SqliteRepository::Ping() {
    std::scoped_lock lock(db_->TxMutex());
    sqlite3_stmt*    st = nullptr;
    if (sqlite3_prepare_v2(db_->Handle(), "SELECT 1;", -1, &st, nullptr) != SQLITE_OK) return false;
    const bool ok = sqlite3_step(st) == SQLITE_ROW;
    sqlite3_finalize(st);
    return ok;
}

} // namespace netorch::db::sqlite
