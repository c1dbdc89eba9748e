/*
 * sqlgate - Configuration Implementation
 */
#include <sqlgate/core/config.hpp>
#include <sqlgate/core/logger.hpp>
#include <sqlgate/core/utils.hpp>

#include <cstdint>
#include <fstream>
#include <sstream>

namespace sqlgate {

Config::Config() : root_(Json::object()) {}

bool Config::load_file(const std::string& path) {
    std::ifstream file(path.c_str());
    if (!file.is_open()) {
        last_error_ = "cannot open config file '" + path + "'";
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_string(buffer.str());
}

bool Config::load_string(const std::string& text) {
    Json parsed;
    try {
        parsed = Json::parse(text);
    } catch (const Json::parse_error& e) {
        last_error_ = std::string("invalid JSON: ") + e.what();
        return false;
    }

    if (!parsed.is_object()) {
        last_error_ = "config root must be a JSON object";
        return false;
    }

    root_ = std::move(parsed);
    last_error_.clear();
    return true;
}

const Json* Config::find(const std::string& key) const {
    auto it = root_.find(key);
    if (it != root_.end()) {
        return &(*it);
    }

    // Walk the nested path one segment at a time
    const Json* node = &root_;
    size_t start = 0;
    while (start <= key.size()) {
        size_t dot = key.find('.', start);
        std::string part = key.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (!node->is_object()) return nullptr;
        auto child = node->find(part);
        if (child == node->end()) return nullptr;
        node = &(*child);
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return node;
}

std::string Config::get_string(const std::string& key, const std::string& default_val) const {
    const Json* value = find(key);
    if (!value) return default_val;
    if (value->is_string()) return value->get<std::string>();
    if (value->is_number() || value->is_boolean()) return value->dump();

    LOG_WARN("[Config] '%s' is not a string, using default", key.c_str());
    return default_val;
}

int64_t Config::get_int(const std::string& key, int64_t default_val) const {
    const Json* value = find(key);
    if (!value) return default_val;
    if (value->is_number_unsigned()) {
        uint64_t u = value->get<uint64_t>();
        if (u <= static_cast<uint64_t>(INT64_MAX)) return static_cast<int64_t>(u);
    } else if (value->is_number_integer()) {
        return value->get<int64_t>();
    } else if (value->is_number_float()) {
        // [-2^63, 2^63) converts without overflow; NaN fails both tests
        double d = value->get<double>();
        if (d >= -9223372036854775808.0 && d < 9223372036854775808.0) {
            return static_cast<int64_t>(d);
        }
    }
    if (value->is_string()) {
        const std::string s = trim(value->get<std::string>());
        try {
            size_t used = 0;
            long long parsed = std::stoll(s, &used);
            if (used == s.size()) return static_cast<int64_t>(parsed);
        } catch (const std::exception&) {
            // fall through to the warning below
        }
    }

    LOG_WARN("[Config] '%s' is not an integer, using default %lld",
             key.c_str(), static_cast<long long>(default_val));
    return default_val;
}

bool Config::get_bool(const std::string& key, bool default_val) const {
    const Json* value = find(key);
    if (!value) return default_val;
    if (value->is_boolean()) return value->get<bool>();
    if (value->is_number_integer()) return value->get<int64_t>() != 0;
    if (value->is_string()) {
        const std::string s = to_lower(trim(value->get<std::string>()));
        if (s == "true" || s == "1" || s == "yes" || s == "on") return true;
        if (s == "false" || s == "0" || s == "no" || s == "off") return false;
    }

    LOG_WARN("[Config] '%s' is not a boolean, using default %s",
             key.c_str(), default_val ? "true" : "false");
    return default_val;
}

} // namespace sqlgate
