// ---------------------------------------------------------------------------
// validator_test.cpp
//
// Validator: admission short-circuits before any sandbox work, admitted
// queries reach the executor normalized, executor faults are contained,
// and concurrent calls are independent.
// ---------------------------------------------------------------------------

#include <sqlgate/validator/validator.hpp>

#include <gtest/gtest.h>
#include <atomic>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using sqlgate::ErrorKind;
using sqlgate::QueryExecutor;
using sqlgate::Row;
using sqlgate::SandboxExecutor;
using sqlgate::SandboxInstance;
using sqlgate::ValidationRequest;
using sqlgate::Validator;
using sqlgate::Value;
using sqlgate::Verdict;

namespace {

// Records every call and answers with a single-cell row
class CountingExecutor : public QueryExecutor {
public:
    CountingExecutor() : calls_(0) {}

    Verdict execute(const std::string& admitted_query,
                    const std::string& seed_statements) const override {
        ++calls_;
        std::lock_guard<std::mutex> lock(mutex_);
        last_query_ = admitted_query;
        last_seed_ = seed_statements;
        std::vector<Row> rows;
        rows.push_back(Row{Value(static_cast<int64_t>(1))});
        return Verdict::success(std::move(rows), false);
    }

    int calls() const { return calls_.load(); }
    std::string last_query() const { std::lock_guard<std::mutex> lock(mutex_); return last_query_; }
    std::string last_seed() const { std::lock_guard<std::mutex> lock(mutex_); return last_seed_; }

private:
    mutable std::atomic<int> calls_;
    mutable std::mutex mutex_;
    mutable std::string last_query_;
    mutable std::string last_seed_;
};

class ThrowingExecutor : public QueryExecutor {
public:
    Verdict execute(const std::string&, const std::string&) const override {
        throw std::runtime_error("boom");
    }
};

} // namespace

// ---------------------------------------------------------------------------
// Admission gate
// ---------------------------------------------------------------------------

TEST(Validator, RejectedQueryNeverReachesExecutor) {
    CountingExecutor executor;
    Validator validator(executor);

    const char* rejected[] = {
        "DROP TABLE t;",
        "delete from t",
        "SELECT 1; SELECT 2",
        "SELECT 1;;",
        "PRAGMA table_info(t)",
        "ATTACH DATABASE 'x' AS y",
    };
    for (const char* sql : rejected) {
        Verdict v = validator.validate(ValidationRequest(sql, "CREATE TABLE t(x INT);"));
        EXPECT_FALSE(v.ok) << sql;
        EXPECT_EQ(v.kind, ErrorKind::AdmissionRejected) << sql;
        EXPECT_EQ(v.message, "forbidden keywords") << sql;
    }
    EXPECT_EQ(executor.calls(), 0);
}

TEST(Validator, AdmittedQueryReachesExecutorNormalized) {
    CountingExecutor executor;
    Validator validator(executor);

    Verdict v = validator.validate(ValidationRequest("  SELECT x FROM t ;\n", "CREATE TABLE t(x INT);"));
    ASSERT_TRUE(v.ok) << v.message;
    EXPECT_EQ(executor.calls(), 1);
    EXPECT_EQ(executor.last_query(), "SELECT x FROM t");
    EXPECT_EQ(executor.last_seed(), "CREATE TABLE t(x INT);");
}

TEST(Validator, ExecutorExceptionBecomesInternalFault) {
    ThrowingExecutor executor;
    Validator validator(executor);

    Verdict v = validator.validate(ValidationRequest("SELECT 1", ""));
    ASSERT_FALSE(v.ok);
    EXPECT_EQ(v.kind, ErrorKind::InternalFault);
    EXPECT_EQ(v.message, "internal error: boom");
}

TEST(Validator, ErrorKindNamesAreStable) {
    EXPECT_STREQ(sqlgate::error_kind_name(ErrorKind::AdmissionRejected), "AdmissionRejected");
    EXPECT_STREQ(sqlgate::error_kind_name(ErrorKind::TimeoutExceeded), "TimeoutExceeded");
}

// ---------------------------------------------------------------------------
// End to end with the real sandbox
// ---------------------------------------------------------------------------

TEST(Validator, SeededSelectEndToEnd) {
    SandboxExecutor executor;
    Validator validator(executor);

    Verdict v = validator.validate(ValidationRequest(
        "SELECT x FROM t ORDER BY x;", "CREATE TABLE t(x INT); INSERT INTO t VALUES (1),(2),(3);"));
    ASSERT_TRUE(v.ok) << v.message;
    ASSERT_EQ(v.rows.size(), 3u);
    EXPECT_EQ(v.rows[2][0], Value(static_cast<int64_t>(3)));
}

TEST(Validator, DeniedKeywordLeavesSeedUntouched) {
    SandboxExecutor executor;
    Validator validator(executor);

    Verdict v = validator.validate(ValidationRequest(
        "DROP TABLE t;", "CREATE TABLE t(x INT); INSERT INTO t VALUES (1),(2),(3);"));
    ASSERT_FALSE(v.ok);
    EXPECT_EQ(v.message, "forbidden keywords");
    EXPECT_EQ(SandboxInstance::live_count(), 0);
}

TEST(Validator, ConcurrentCallsAreIndependent) {
    SandboxExecutor executor;
    Validator validator(executor);
    const ValidationRequest request(
        "SELECT x, x * 2 FROM t ORDER BY x",
        "CREATE TABLE t(x INT); INSERT INTO t VALUES (1),(2),(3),(4),(5);");

    const Verdict expected = validator.validate(request);
    ASSERT_TRUE(expected.ok) << expected.message;

    const int THREADS = 8;
    const int CALLS_PER_THREAD = 25;
    std::atomic<int> mismatches(0);
    std::vector<std::thread> threads;
    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < CALLS_PER_THREAD; ++i) {
                Verdict v = validator.validate(request);
                if (!v.ok || v.truncated || v.rows != expected.rows) {
                    ++mismatches;
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(mismatches.load(), 0);
    EXPECT_EQ(SandboxInstance::live_count(), 0);
}
