/*
 * sqlgate - Sandbox Executor Implementation
 *
 * Engine hardening follows https://www.sqlite.org/security.html: defensive
 * mode, reduced limits, no attached databases, and an authorizer that turns
 * the connection read-only once the seed has been applied.
 */
#include <sqlgate/validator/sandbox.hpp>
#include <sqlgate/core/logger.hpp>
#include <sqlgate/core/utils.hpp>

#include <string>
#include <string_view>

namespace sqlgate {

namespace {

// VM instructions between deadline checks
const int PROGRESS_INTERVAL = 1000;

// Finalizes on scope exit so close() never sees a live statement.
class Statement {
public:
    Statement() : stmt_(nullptr) {}
    ~Statement() {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
    }

    sqlite3_stmt** out() { return &stmt_; }
    sqlite3_stmt* get() const { return stmt_; }

private:
    Statement(const Statement&);
    Statement& operator=(const Statement&);

    sqlite3_stmt* stmt_;
};

} // namespace

std::atomic<int> SandboxInstance::live_(0);

int SandboxInstance::live_count() {
    return live_.load();
}

SandboxInstance::SandboxInstance(const SandboxLimits& limits)
    : limits_(limits)
    , db_(nullptr)
    , deadline_ms_(0)
    , armed_timeout_ms_(0)
    , deadline_hit_(false)
    , query_phase_(false)
{}

SandboxInstance::~SandboxInstance() {
    close();
}

StepResult SandboxInstance::open() {
    if (db_) {
        return StepResult::fail(ErrorKind::InternalFault, "sandbox already open");
    }

    // Plain ":memory:" without SQLITE_OPEN_URI is always a new private database
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_MEMORY |
                      SQLITE_OPEN_NOMUTEX | SQLITE_OPEN_PRIVATECACHE;
    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(":memory:", &db, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        if (db) {
            sqlite3_close(db);
        }
        LOG_ERROR("[Sandbox] Failed to open in-memory database: %s", msg.c_str());
        return StepResult::fail(ErrorKind::InternalFault, "failed to create sandbox: " + msg);
    }

    db_ = db;
    live_.fetch_add(1);
    harden();

    // Issued by us before the authorizer exists; callers cannot reach PRAGMA
    std::string page_cap = "PRAGMA max_page_count = " + std::to_string(limits_.max_page_count);
    char* err_msg = nullptr;
    rc = sqlite3_exec(db_, page_cap.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::string msg = err_msg ? err_msg : sqlite3_errstr(rc);
        sqlite3_free(err_msg);
        LOG_ERROR("[Sandbox] Failed to cap database size: %s", msg.c_str());
        close();
        return StepResult::fail(ErrorKind::InternalFault, "failed to create sandbox: " + msg);
    }

    LOG_DEBUG("[Sandbox] Opened (live=%d)", live_.load());
    return StepResult::ok();
}

void SandboxInstance::harden() {
    sqlite3_db_config(db_, SQLITE_DBCONFIG_DEFENSIVE, 1, nullptr);
    sqlite3_db_config(db_, SQLITE_DBCONFIG_TRUSTED_SCHEMA, 0, nullptr);
    sqlite3_db_config(db_, SQLITE_DBCONFIG_ENABLE_LOAD_EXTENSION, 0, nullptr);

    // sqlite3_limit() returns the previous value, not an error code
    sqlite3_limit(db_, SQLITE_LIMIT_LENGTH, limits_.max_value_length);
    sqlite3_limit(db_, SQLITE_LIMIT_COLUMN, 100);
    sqlite3_limit(db_, SQLITE_LIMIT_EXPR_DEPTH, 100);
    sqlite3_limit(db_, SQLITE_LIMIT_ATTACHED, 0);
    sqlite3_limit(db_, SQLITE_LIMIT_LIKE_PATTERN_LENGTH, 50);
    sqlite3_limit(db_, SQLITE_LIMIT_TRIGGER_DEPTH, 10);
    sqlite3_limit(db_, SQLITE_LIMIT_WORKER_THREADS, 0);

    sqlite3_progress_handler(db_, PROGRESS_INTERVAL, &SandboxInstance::on_progress, this);
    sqlite3_set_authorizer(db_, &SandboxInstance::on_authorize, this);
}

void SandboxInstance::close() {
    if (!db_) return;

    int rc = sqlite3_close_v2(db_);
    if (rc != SQLITE_OK) {
        LOG_ERROR("[Sandbox] sqlite3_close_v2 returned %d (%s)", rc, sqlite3_errstr(rc));
    }
    db_ = nullptr;
    live_.fetch_sub(1);
    LOG_DEBUG("[Sandbox] Released (live=%d)", live_.load());
}

void SandboxInstance::arm_deadline(int timeout_ms) {
    deadline_hit_ = false;
    armed_timeout_ms_ = timeout_ms;
    deadline_ms_ = timeout_ms > 0 ? monotonic_ms() + timeout_ms : 0;
}

void SandboxInstance::disarm_deadline() {
    deadline_ms_ = 0;
}

int SandboxInstance::on_progress(void* self) {
    SandboxInstance* sandbox = static_cast<SandboxInstance*>(self);
    if (sandbox->deadline_ms_ != 0 && monotonic_ms() >= sandbox->deadline_ms_) {
        sandbox->deadline_hit_ = true;
        return 1;  // interrupts the running statement
    }
    return 0;
}

int SandboxInstance::on_authorize(void* self, int action, const char* arg1, const char* arg2,
                                  const char* db_name, const char* trigger) {
    (void)arg1;
    (void)arg2;
    (void)db_name;
    (void)trigger;

    const SandboxInstance* sandbox = static_cast<const SandboxInstance*>(self);
    if (!sandbox->query_phase_) {
        return SQLITE_OK;  // the seed defines the instance
    }

    switch (action) {
        case SQLITE_INSERT:
        case SQLITE_UPDATE:
        case SQLITE_DELETE:
        case SQLITE_CREATE_INDEX:
        case SQLITE_CREATE_TABLE:
        case SQLITE_CREATE_TEMP_INDEX:
        case SQLITE_CREATE_TEMP_TABLE:
        case SQLITE_CREATE_TEMP_TRIGGER:
        case SQLITE_CREATE_TEMP_VIEW:
        case SQLITE_CREATE_TRIGGER:
        case SQLITE_CREATE_VIEW:
        case SQLITE_CREATE_VTABLE:
        case SQLITE_DROP_INDEX:
        case SQLITE_DROP_TABLE:
        case SQLITE_DROP_TEMP_INDEX:
        case SQLITE_DROP_TEMP_TABLE:
        case SQLITE_DROP_TEMP_TRIGGER:
        case SQLITE_DROP_TEMP_VIEW:
        case SQLITE_DROP_TRIGGER:
        case SQLITE_DROP_VIEW:
        case SQLITE_DROP_VTABLE:
        case SQLITE_ALTER_TABLE:
        case SQLITE_REINDEX:
        case SQLITE_ANALYZE:
        case SQLITE_ATTACH:
        case SQLITE_DETACH:
        case SQLITE_PRAGMA:
        case SQLITE_TRANSACTION:
        case SQLITE_SAVEPOINT:
            return SQLITE_DENY;
        default:
            return SQLITE_OK;
    }
}

StepResult SandboxInstance::engine_failure(ErrorKind kind, int rc) {
    if (rc == SQLITE_INTERRUPT && deadline_hit_) {
        if (kind == ErrorKind::SeedFailure) {
            return StepResult::fail(kind, "seed timed out after " +
                                    std::to_string(armed_timeout_ms_) + " ms");
        }
        return StepResult::fail(ErrorKind::TimeoutExceeded, "query timed out after " +
                                std::to_string(armed_timeout_ms_) + " ms");
    }
    return StepResult::fail(kind, sqlite3_errmsg(db_));
}

StepResult SandboxInstance::seed(const std::string& statements) {
    if (!db_) {
        return StepResult::fail(ErrorKind::InternalFault, "sandbox is not open");
    }

    arm_deadline(limits_.seed_timeout_ms);
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, statements.c_str(), nullptr, nullptr, &err_msg);
    disarm_deadline();

    if (rc != SQLITE_OK) {
        StepResult result = engine_failure(ErrorKind::SeedFailure, rc);
        if (err_msg && !(rc == SQLITE_INTERRUPT && deadline_hit_)) {
            result.error = err_msg;
        }
        sqlite3_free(err_msg);
        LOG_DEBUG("[Sandbox] Seed failed: %s", result.error.c_str());
        return result;
    }
    return StepResult::ok();
}

Value SandboxInstance::read_column(sqlite3_stmt* stmt, int col) {
    switch (sqlite3_column_type(stmt, col)) {
        case SQLITE_INTEGER:
            return Value(static_cast<int64_t>(sqlite3_column_int64(stmt, col)));
        case SQLITE_FLOAT:
            return Value(sqlite3_column_double(stmt, col));
        case SQLITE_TEXT: {
            const unsigned char* text = sqlite3_column_text(stmt, col);
            int bytes = sqlite3_column_bytes(stmt, col);
            return Value(std::string(reinterpret_cast<const char*>(text), text ? bytes : 0));
        }
        case SQLITE_BLOB: {
            const uint8_t* data = static_cast<const uint8_t*>(sqlite3_column_blob(stmt, col));
            int bytes = sqlite3_column_bytes(stmt, col);
            return data ? Value(Blob(data, data + bytes)) : Value(Blob());
        }
        default:
            return Value(std::monostate());
    }
}

StepResult SandboxInstance::run(const std::string& query, std::vector<Row>& rows, bool& truncated) {
    rows.clear();
    truncated = false;
    if (!db_) {
        return StepResult::fail(ErrorKind::InternalFault, "sandbox is not open");
    }

    query_phase_ = true;
    sqlite3_limit(db_, SQLITE_LIMIT_SQL_LENGTH, limits_.max_sql_length);

    arm_deadline(limits_.timeout_ms);

    Statement stmt;
    const char* tail = nullptr;
    int rc = sqlite3_prepare_v2(db_, query.data(), static_cast<int>(query.size()),
                                stmt.out(), &tail);
    if (rc != SQLITE_OK) {
        disarm_deadline();
        return engine_failure(ErrorKind::ExecutionFailure, rc);
    }

    const char* end = query.data() + query.size();
    if (tail && tail < end &&
        std::string_view(tail, static_cast<size_t>(end - tail)).find_first_not_of(" \t\n\r\v\f") !=
            std::string_view::npos) {
        disarm_deadline();
        return StepResult::fail(ErrorKind::ExecutionFailure,
                                "You can only execute one statement at a time.");
    }

    // Whitespace or comments only: nothing to run
    if (!stmt.get()) {
        disarm_deadline();
        return StepResult::ok();
    }

    if (!sqlite3_stmt_readonly(stmt.get())) {
        disarm_deadline();
        return StepResult::fail(ErrorKind::ExecutionFailure, "only read-only queries are allowed");
    }

    const int columns = sqlite3_column_count(stmt.get());
    while (rows.size() < limits_.max_rows) {
        rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_DONE) {
            disarm_deadline();
            return StepResult::ok();
        }
        if (rc != SQLITE_ROW) {
            disarm_deadline();
            rows.clear();
            return engine_failure(ErrorKind::ExecutionFailure, rc);
        }

        Row row;
        row.reserve(static_cast<size_t>(columns));
        for (int col = 0; col < columns; ++col) {
            row.push_back(read_column(stmt.get(), col));
        }
        rows.push_back(std::move(row));
    }

    // Cap reached: only a further row proves the result was cut short.
    // The extra step is still under the deadline and can still fail.
    rc = sqlite3_step(stmt.get());
    disarm_deadline();
    if (rc == SQLITE_ROW) {
        truncated = true;
        LOG_DEBUG("[Sandbox] Result capped at %zu rows", rows.size());
        return StepResult::ok();
    }
    if (rc != SQLITE_DONE) {
        rows.clear();
        return engine_failure(ErrorKind::ExecutionFailure, rc);
    }
    return StepResult::ok();
}

// ============================================================================
// SandboxExecutor
// ============================================================================

SandboxExecutor::SandboxExecutor(const SandboxLimits& limits) : limits_(limits) {}

Verdict SandboxExecutor::execute(const std::string& admitted_query,
                                 const std::string& seed_statements) const {
    SandboxInstance sandbox(limits_);

    StepResult step = sandbox.open();
    if (!step.success) {
        return Verdict::failure(step.kind, step.error);
    }

    if (!trim(seed_statements).empty()) {
        step = sandbox.seed(seed_statements);
        if (!step.success) {
            return Verdict::failure(step.kind, step.error);
        }
    }

    std::vector<Row> rows;
    bool truncated = false;
    step = sandbox.run(admitted_query, rows, truncated);
    if (!step.success) {
        return Verdict::failure(step.kind, step.error);
    }

    return Verdict::success(std::move(rows), truncated);
}

} // namespace sqlgate
