/*
 * sqlgate - Sandbox Executor
 *
 * One SandboxInstance is one private in-memory SQLite connection, owned by
 * exactly one validation call:
 *
 *   open()  - acquire and harden a fresh :memory: connection
 *   seed()  - apply the trusted seed batch
 *   run()   - run the admitted query read-only under a deadline and
 *             capture at most max_rows rows
 *   close() - release; also done by the destructor on every exit path
 *
 * SandboxExecutor strings these steps together per call and holds no state
 * besides its limits, so one executor may serve any number of threads.
 */
#ifndef sqlgate_VALIDATOR_SANDBOX_HPP
#define sqlgate_VALIDATOR_SANDBOX_HPP

#include "types.hpp"
#include <atomic>
#include <cstdint>
#include <string>
#include <vector>
#include <sqlite3.h>

namespace sqlgate {

struct SandboxLimits {
    size_t max_rows;            // rows captured before the result is flagged truncated
    int timeout_ms;             // wall-clock bound on the query, <= 0 disables
    int seed_timeout_ms;        // wall-clock bound on the seed batch, <= 0 disables
    int max_value_length;       // SQLITE_LIMIT_LENGTH
    int max_sql_length;         // SQLITE_LIMIT_SQL_LENGTH, applied to the query only
    int max_page_count;         // caps total database size

    SandboxLimits()
        : max_rows(200)
        , timeout_ms(1000)
        , seed_timeout_ms(0)
        , max_value_length(1000000)
        , max_sql_length(100000)
        , max_page_count(4096) {}
};

// Outcome of a single lifecycle step
struct StepResult {
    bool success;
    ErrorKind kind;
    std::string error;

    StepResult() : success(true), kind(ErrorKind::InternalFault) {}

    static StepResult ok() {
        return StepResult();
    }

    static StepResult fail(ErrorKind k, const std::string& err) {
        StepResult r;
        r.success = false;
        r.kind = k;
        r.error = err;
        return r;
    }
};

class SandboxInstance {
public:
    explicit SandboxInstance(const SandboxLimits& limits);
    ~SandboxInstance();

    StepResult open();
    StepResult seed(const std::string& statements);
    StepResult run(const std::string& query, std::vector<Row>& rows, bool& truncated);
    void close();

    bool is_open() const { return db_ != nullptr; }

    // Connections currently open across the process
    static int live_count();

private:
    SandboxInstance(const SandboxInstance&);
    SandboxInstance& operator=(const SandboxInstance&);

    void harden();
    void arm_deadline(int timeout_ms);
    void disarm_deadline();
    StepResult engine_failure(ErrorKind kind, int rc);

    static int on_progress(void* self);
    static int on_authorize(void* self, int action, const char* arg1, const char* arg2,
                            const char* db_name, const char* trigger);
    static Value read_column(sqlite3_stmt* stmt, int col);

    SandboxLimits limits_;
    sqlite3* db_;
    int64_t deadline_ms_;       // monotonic; 0 when no deadline is armed
    int armed_timeout_ms_;
    bool deadline_hit_;
    bool query_phase_;          // authorizer restricts once seeding is done

    static std::atomic<int> live_;
};

// Seam for the validator; tests substitute a counting executor.
class QueryExecutor {
public:
    virtual ~QueryExecutor() {}
    virtual Verdict execute(const std::string& admitted_query,
                            const std::string& seed_statements) const = 0;
};

class SandboxExecutor : public QueryExecutor {
public:
    explicit SandboxExecutor(const SandboxLimits& limits = SandboxLimits());

    Verdict execute(const std::string& admitted_query,
                    const std::string& seed_statements) const override;

    const SandboxLimits& limits() const { return limits_; }

private:
    const SandboxLimits limits_;
};

} // namespace sqlgate

#endif // sqlgate_VALIDATOR_SANDBOX_HPP
