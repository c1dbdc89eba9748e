/*
 * sqlgate - Line protocol
 *
 * One JSON object per line in, one per line out.
 *
 * Request:
 *   {"sql": "SELECT ...", "seed_sql": "CREATE TABLE ...", "id": 7}
 *   {"type": "ping"}
 *
 * Response:
 *   {"verdict": "ok", "rows": [[1], [2]]}
 *   {"verdict": "ok", "rows": [...], "truncated": true}
 *   {"verdict": "error", "message": "forbidden keywords"}
 *   {"type": "pong"}
 *
 * "type" defaults to "validate" ("submit_sql" is accepted as an alias).
 * A present "id" is echoed on the response. Missing or null "sql" /
 * "seed_sql" are empty strings.
 */
#ifndef sqlgate_SERVER_PROTOCOL_HPP
#define sqlgate_SERVER_PROTOCOL_HPP

#include <sqlgate/core/json.hpp>
#include <sqlgate/validator/types.hpp>
#include <string>

namespace sqlgate {

class Validator;

namespace protocol {

enum class RequestType {
    Validate,
    Ping,
    Invalid
};

struct ParsedRequest {
    RequestType type;
    ValidationRequest request;
    OrderedJson id;             // null when absent
    std::string error;          // set when type == Invalid

    ParsedRequest() : type(RequestType::Invalid) {}
};

ParsedRequest parse_request(const std::string& line);

// integer/real -> number, text -> string, null -> null, blob -> base64 string.
// Non-finite reals have no JSON form and become null.
OrderedJson value_to_json(const Value& value);

OrderedJson verdict_to_json(const Verdict& verdict);

// Serialize one response line (no trailing newline). Invalid UTF-8 in
// engine text is replaced rather than failing the response.
std::string dump_line(const OrderedJson& response);

// Response line for input refused before parsing (e.g. over-long lines)
std::string invalid_request_line(const std::string& detail);

// Parse, dispatch, and serialize. Never throws.
std::string handle_line(const std::string& line, const Validator& validator);

} // namespace protocol
} // namespace sqlgate

#endif // sqlgate_SERVER_PROTOCOL_HPP
