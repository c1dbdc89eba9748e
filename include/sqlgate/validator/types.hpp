/*
 * sqlgate - Validation data model
 *
 *   ValidationRequest  - query text plus the seed batch it runs against
 *   Value / Row        - tagged scalar cells as produced by the engine
 *   Verdict            - exactly one of Ok{rows, truncated} or Error{kind, message}
 */
#ifndef sqlgate_VALIDATOR_TYPES_HPP
#define sqlgate_VALIDATOR_TYPES_HPP

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace sqlgate {

typedef std::vector<uint8_t> Blob;

// Index order matters: Value::index() is used as a type tag.
typedef std::variant<std::monostate, int64_t, double, std::string, Blob> Value;

typedef std::vector<Value> Row;

struct ValidationRequest {
    std::string query;              // untrusted, from the end user
    std::string seed_statements;    // trusted batch from the question bank

    ValidationRequest() {}
    ValidationRequest(const std::string& q, const std::string& seed)
        : query(q), seed_statements(seed) {}
};

enum class ErrorKind {
    AdmissionRejected,  // forbidden keyword, nothing executed
    SeedFailure,        // seed batch failed to apply
    ExecutionFailure,   // engine rejected or failed the query
    TimeoutExceeded,    // query ran past its wall-clock bound
    InternalFault       // sandbox lifecycle failure
};

const char* error_kind_name(ErrorKind kind);

struct Verdict {
    bool ok;
    std::vector<Row> rows;      // only meaningful when ok
    bool truncated;             // row cap was hit
    ErrorKind kind;             // only meaningful when !ok
    std::string message;        // only meaningful when !ok

    Verdict() : ok(false), truncated(false), kind(ErrorKind::InternalFault) {}

    static Verdict success(std::vector<Row> rows, bool truncated) {
        Verdict v;
        v.ok = true;
        v.rows = std::move(rows);
        v.truncated = truncated;
        return v;
    }

    static Verdict failure(ErrorKind kind, const std::string& message) {
        Verdict v;
        v.ok = false;
        v.kind = kind;
        v.message = message;
        return v;
    }
};

} // namespace sqlgate

#endif // sqlgate_VALIDATOR_TYPES_HPP
