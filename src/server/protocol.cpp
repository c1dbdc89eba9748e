/*
 * sqlgate - Line protocol implementation
 */
#include <sqlgate/server/protocol.hpp>
#include <sqlgate/validator/validator.hpp>
#include <sqlgate/core/logger.hpp>
#include <sqlgate/core/utils.hpp>

#include <cmath>
#include <exception>

namespace sqlgate {
namespace protocol {

namespace {

ParsedRequest invalid(const std::string& detail) {
    ParsedRequest parsed;
    parsed.type = RequestType::Invalid;
    parsed.error = "invalid request: " + detail;
    return parsed;
}

// Missing or null is "", anything but a string is an error
bool read_text_field(const OrderedJson& obj, const char* name, std::string& out, std::string& error) {
    auto it = obj.find(name);
    if (it == obj.end() || it->is_null()) {
        out.clear();
        return true;
    }
    if (!it->is_string()) {
        error = std::string("'") + name + "' must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

OrderedJson error_response(const std::string& message) {
    OrderedJson response = OrderedJson::object();
    response["verdict"] = "error";
    response["message"] = message;
    return response;
}

} // namespace

ParsedRequest parse_request(const std::string& line) {
    OrderedJson obj;
    try {
        obj = OrderedJson::parse(line);
    } catch (const OrderedJson::parse_error& e) {
        return invalid(std::string("malformed JSON (") + e.what() + ")");
    }

    if (!obj.is_object()) {
        return invalid("expected a JSON object");
    }

    ParsedRequest parsed;
    auto id = obj.find("id");
    if (id != obj.end()) {
        parsed.id = *id;
    }

    std::string type = "validate";
    auto type_it = obj.find("type");
    if (type_it != obj.end() && !type_it->is_null()) {
        if (!type_it->is_string()) {
            ParsedRequest bad = invalid("'type' must be a string");
            bad.id = parsed.id;
            return bad;
        }
        type = type_it->get<std::string>();
    }

    if (type == "ping") {
        parsed.type = RequestType::Ping;
        return parsed;
    }
    if (type != "validate" && type != "submit_sql") {
        ParsedRequest bad = invalid("unknown type '" + type + "'");
        bad.id = parsed.id;
        return bad;
    }

    std::string error;
    if (!read_text_field(obj, "sql", parsed.request.query, error) ||
        !read_text_field(obj, "seed_sql", parsed.request.seed_statements, error)) {
        ParsedRequest bad = invalid(error);
        bad.id = parsed.id;
        return bad;
    }

    parsed.type = RequestType::Validate;
    return parsed;
}

OrderedJson value_to_json(const Value& value) {
    switch (value.index()) {
        case 1:
            return OrderedJson(std::get<int64_t>(value));
        case 2: {
            double d = std::get<double>(value);
            if (!std::isfinite(d)) return OrderedJson(nullptr);
            return OrderedJson(d);
        }
        case 3:
            return OrderedJson(std::get<std::string>(value));
        case 4:
            return OrderedJson(base64_encode(std::get<Blob>(value)));
        default:
            return OrderedJson(nullptr);
    }
}

OrderedJson verdict_to_json(const Verdict& verdict) {
    if (!verdict.ok) {
        return error_response(verdict.message);
    }

    OrderedJson rows = OrderedJson::array();
    for (size_t i = 0; i < verdict.rows.size(); ++i) {
        OrderedJson cells = OrderedJson::array();
        const Row& row = verdict.rows[i];
        for (size_t c = 0; c < row.size(); ++c) {
            cells.push_back(value_to_json(row[c]));
        }
        rows.push_back(std::move(cells));
    }

    OrderedJson response = OrderedJson::object();
    response["verdict"] = "ok";
    response["rows"] = std::move(rows);
    if (verdict.truncated) {
        response["truncated"] = true;
    }
    return response;
}

std::string dump_line(const OrderedJson& response) {
    return response.dump(-1, ' ', false, OrderedJson::error_handler_t::replace);
}

std::string invalid_request_line(const std::string& detail) {
    return dump_line(error_response("invalid request: " + detail));
}

std::string handle_line(const std::string& line, const Validator& validator) {
    try {
        ParsedRequest parsed = parse_request(line);

        OrderedJson response;
        switch (parsed.type) {
            case RequestType::Ping:
                response = OrderedJson::object();
                response["type"] = "pong";
                break;
            case RequestType::Validate:
                response = verdict_to_json(validator.validate(parsed.request));
                break;
            default:
                LOG_WARN("[Protocol] %s", parsed.error.c_str());
                response = error_response(parsed.error);
                break;
        }

        if (!parsed.id.is_null()) {
            response["id"] = parsed.id;
        }
        return dump_line(response);
    } catch (const std::exception& e) {
        LOG_ERROR("[Protocol] Failed to handle request: %s", e.what());
        return dump_line(error_response(std::string("internal error: ") + e.what()));
    }
}

} // namespace protocol
} // namespace sqlgate
