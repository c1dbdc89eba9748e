/*
 * sqlgate - Configuration
 *
 * JSON configuration file read through dotted-key getters:
 *
 *   {
 *     "log_level": "info",
 *     "validator": { "max_rows": 200, "timeout_ms": 1000 },
 *     "server": { "workers": 4 },
 *     "jail": { "enabled": true }
 *   }
 *
 *   config.get_int("validator.max_rows", 200)
 *
 * A literal top-level key containing dots ("validator.max_rows": 200) is
 * also accepted and takes precedence over the nested form.
 */
#ifndef sqlgate_CORE_CONFIG_HPP
#define sqlgate_CORE_CONFIG_HPP

#include "json.hpp"
#include <string>
#include <cstdint>

namespace sqlgate {

class Config {
public:
    Config();

    // Load from a file. On failure the previous contents are kept and
    // last_error() describes the problem.
    bool load_file(const std::string& path);

    // Load from JSON text; the root must be an object.
    bool load_string(const std::string& text);

    std::string get_string(const std::string& key, const std::string& default_val = "") const;
    int64_t get_int(const std::string& key, int64_t default_val = 0) const;
    bool get_bool(const std::string& key, bool default_val = false) const;

    const Json& raw() const { return root_; }
    const std::string& last_error() const { return last_error_; }

private:
    const Json* find(const std::string& key) const;

    Json root_;
    std::string last_error_;
};

} // namespace sqlgate

#endif // sqlgate_CORE_CONFIG_HPP
