/*
 * sqlgate - Application
 *
 * Hosts the validator as a line-oriented JSON service: requests are read
 * from stdin one per line, validated on a worker pool, and each response is
 * written to stdout as a single line. EOF on stdin or SIGINT/SIGTERM ends the
 * run after in-flight requests have been answered.
 *
 * Usage:
 *   sqlgate [--config config.json]
 */
#ifndef sqlgate_CORE_APPLICATION_HPP
#define sqlgate_CORE_APPLICATION_HPP

#include "config.hpp"
#include "thread_pool.hpp"
#include <sqlgate/validator/sandbox.hpp>
#include <sqlgate/validator/validator.hpp>

#include <atomic>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>

namespace sqlgate {

struct AppInfo {
    static const char* NAME;
    static const char* VERSION;
};

class Application {
public:
    static Application& instance();

    // Returns false for --help/--version (is_running() false afterwards)
    // and for fatal setup errors (is_running() still true).
    bool init(int argc, char* argv[]);

    // Serve requests from `in` until EOF or stop(); responses go to `out`.
    int run(std::istream& in, std::ostream& out);
    int run();

    void shutdown();
    void stop() { running_.store(false); }
    bool is_running() const { return running_.load(); }

    const Config& config() const { return config_; }

    // Limits derived from a config, defaults for missing keys
    static SandboxLimits limits_from_config(const Config& config);

    // Read one '\n'-terminated line, keeping at most max_bytes of it. The
    // rest of an over-long line is consumed and dropped, and `overflow` is
    // set. Returns false at end of input with nothing read.
    static bool read_line(std::istream& in, size_t max_bytes, std::string& line, bool& overflow);

private:
    Application();
    Application(const Application&);
    Application& operator=(const Application&);

    bool parse_args(int argc, char* argv[]);
    void setup_logging();
    void setup_validator();
    void activate_jail();

    void write_line(std::ostream& out, const std::string& line);

    std::atomic<bool> running_;
    Config config_;
    std::string config_file_;
    std::unique_ptr<ThreadPool> thread_pool_;
    std::unique_ptr<SandboxExecutor> executor_;
    std::unique_ptr<Validator> validator_;
    size_t max_line_bytes_;
    std::mutex output_mutex_;
};

} // namespace sqlgate

#endif // sqlgate_CORE_APPLICATION_HPP
