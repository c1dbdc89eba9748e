/*
 * sqlgate - Application Implementation
 */
#include <sqlgate/core/application.hpp>
#include <sqlgate/core/jail.hpp>
#include <sqlgate/core/logger.hpp>
#include <sqlgate/core/utils.hpp>
#include <sqlgate/server/protocol.hpp>

#include <climits>
#include <csignal>
#include <cstring>
#include <iostream>
#include <streambuf>
#include <string>

namespace sqlgate {

const char* AppInfo::NAME = "sqlgate";
const char* AppInfo::VERSION = "1.0.0";

static const int64_t DEFAULT_MAX_LINE_BYTES = 4 * 1024 * 1024;
static const int64_t DEFAULT_MAX_PENDING = 64;

// ============================================================================
// Utility Functions
// ============================================================================

static void print_usage(const char* prog) {
    std::cerr << AppInfo::NAME << " - sandboxed SQL query validator\n\n"
              << "Usage: " << prog << " [options]\n\n"
              << "Reads one JSON request per line on stdin and writes one JSON\n"
              << "verdict per line on stdout.\n\n"
              << "Options:\n"
              << "  -h, --help           Show this help message\n"
              << "  -v, --version        Show version\n"
              << "  --config <file>      Load settings from a JSON config file\n\n"
              << "Example:\n"
              << "  echo '{\"sql\":\"SELECT 1\",\"seed_sql\":\"\"}' | " << prog << "\n";
}

static void print_version() {
    std::cerr << AppInfo::NAME << " v" << AppInfo::VERSION
              << " (SQLite " << sqlite3_libversion() << ")\n";
}

// ============================================================================
// Signal Handler
// ============================================================================

namespace {
    void signal_handler(int sig) {
        (void)sig;
        Application::instance().stop();
    }

    // No SA_RESTART: a blocked read on stdin returns so the loop can exit
    void install_signal_handlers() {
        struct sigaction sa;
        memset(&sa, 0, sizeof(sa));
        sa.sa_handler = signal_handler;
        sigemptyset(&sa.sa_mask);
        sa.sa_flags = 0;
        sigaction(SIGINT, &sa, nullptr);
        sigaction(SIGTERM, &sa, nullptr);
    }
}

// ============================================================================
// Application Implementation
// ============================================================================

Application& Application::instance() {
    static Application app;
    return app;
}

Application::Application()
    : running_(true)
    , max_line_bytes_(DEFAULT_MAX_LINE_BYTES)
{}

SandboxLimits Application::limits_from_config(const Config& config) {
    SandboxLimits defaults;
    SandboxLimits limits;

    limits.max_rows = static_cast<size_t>(clamp<int64_t>(
        config.get_int("validator.max_rows", static_cast<int64_t>(defaults.max_rows)), 0, 1000000));
    limits.timeout_ms = static_cast<int>(clamp<int64_t>(
        config.get_int("validator.timeout_ms", defaults.timeout_ms), 0, INT_MAX));
    limits.seed_timeout_ms = static_cast<int>(clamp<int64_t>(
        config.get_int("validator.seed_timeout_ms", defaults.seed_timeout_ms), 0, INT_MAX));
    limits.max_value_length = static_cast<int>(clamp<int64_t>(
        config.get_int("validator.max_value_length", defaults.max_value_length), 1, 1000000000));
    limits.max_sql_length = static_cast<int>(clamp<int64_t>(
        config.get_int("validator.max_sql_length", defaults.max_sql_length), 1, 1000000000));
    limits.max_page_count = static_cast<int>(clamp<int64_t>(
        config.get_int("validator.max_page_count", defaults.max_page_count), 1, INT_MAX));
    return limits;
}

bool Application::parse_args(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            running_.store(false);
            return false;
        }
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            print_version();
            running_.store(false);
            return false;
        }
        if (strcmp(argv[i], "--config") == 0) {
            if (i + 1 >= argc) {
                LOG_ERROR("--config requires a file argument");
                return false;
            }
            config_file_ = std::string(argv[++i]);
            continue;
        }
        LOG_ERROR("Unknown argument: %s", argv[i]);
        print_usage(argv[0]);
        return false;
    }
    return true;
}

void Application::setup_logging() {
    auto log_level = config_.get_string("log_level", "info");

    LogLevel level;
    if (Logger::parse_level(log_level, level)) {
        Logger::instance().set_level(level);
    } else {
        LOG_WARN("Unknown log_level '%s', keeping info", log_level.c_str());
    }
}

void Application::setup_validator() {
    SandboxLimits limits = limits_from_config(config_);
    executor_.reset(new SandboxExecutor(limits));
    validator_.reset(new Validator(*executor_));

    size_t workers = static_cast<size_t>(clamp<int64_t>(config_.get_int("server.workers", 4), 1, 256));
    size_t max_pending = static_cast<size_t>(clamp<int64_t>(
        config_.get_int("server.max_pending", DEFAULT_MAX_PENDING), 1, 100000));
    max_line_bytes_ = static_cast<size_t>(clamp<int64_t>(
        config_.get_int("server.max_line_bytes", DEFAULT_MAX_LINE_BYTES), 1024, INT64_C(1) << 30));
    thread_pool_.reset(new ThreadPool(workers, max_pending));

    LOG_INFO("Validator config: max_rows=%zu, timeout_ms=%d, seed_timeout_ms=%d, "
             "max_value_length=%d, max_sql_length=%d, max_page_count=%d",
             limits.max_rows, limits.timeout_ms, limits.seed_timeout_ms,
             limits.max_value_length, limits.max_sql_length, limits.max_page_count);
    LOG_INFO("Server config: workers=%zu, max_pending=%zu, max_line_bytes=%zu",
             workers, max_pending, max_line_bytes_);
}

void Application::activate_jail() {
    if (!config_.get_bool("jail.enabled", true)) {
        LOG_WARN("[Jail] Disabled by config (jail.enabled=false)");
        return;
    }

    if (!ProcessJail::instance().activate()) {
        LOG_WARN("[Jail] The process is NOT jailed. Consider Linux >= 5.13.");
    }
}

bool Application::init(int argc, char* argv[]) {
    if (!parse_args(argc, argv)) {
        return false;
    }

    install_signal_handlers();

    LOG_INFO("%s v%s starting (SQLite %s)...", AppInfo::NAME, AppInfo::VERSION, sqlite3_libversion());

    if (!sqlite3_threadsafe()) {
        LOG_ERROR("SQLite was built without thread support; refusing to serve concurrently");
        return false;
    }

    if (!config_file_.empty()) {
        if (!config_.load_file(config_file_)) {
            LOG_ERROR("Failed to load config from %s: %s", config_file_.c_str(),
                      config_.last_error().c_str());
            return false;
        }
        LOG_INFO("Loaded config from %s", config_file_.c_str());
    } else {
        LOG_INFO("No config file given, using defaults");
    }

    setup_logging();
    setup_validator();

    // Everything that touches the filesystem is done by now
    activate_jail();

    return true;
}

void Application::write_line(std::ostream& out, const std::string& line) {
    std::lock_guard<std::mutex> lock(output_mutex_);
    out << line << '\n';
    out.flush();
}

int Application::run(std::istream& in, std::ostream& out) {
    if (!validator_ || !thread_pool_) {
        LOG_ERROR("run() called before init()");
        return 1;
    }

    LOG_INFO("Serving requests on stdin (%zu workers)", thread_pool_->size());

    const Validator* validator = validator_.get();
    std::string line;
    bool overflow = false;
    size_t received = 0;
    while (running_.load() && read_line(in, max_line_bytes_, line, overflow)) {
        if (overflow) {
            ++received;
            LOG_WARN("[App] Dropping request line longer than %zu bytes", max_line_bytes_);
            write_line(out, protocol::invalid_request_line(
                "line exceeds " + std::to_string(max_line_bytes_) + " bytes"));
            continue;
        }
        if (trim(line).empty()) continue;
        ++received;

        // Blocks while the worker queue is full
        bool queued = thread_pool_->enqueue([this, validator, line, &out]() {
            write_line(out, protocol::handle_line(line, *validator));
        });
        if (!queued) {
            LOG_ERROR("Worker pool is shutting down, dropping remaining input");
            break;
        }
    }

    // Answer everything already accepted before returning
    LOG_DEBUG("[App] Draining worker pool (pending: %zu)", thread_pool_->pending());
    thread_pool_->shutdown();

    LOG_INFO("Input closed after %zu request(s)", received);
    return 0;
}

bool Application::read_line(std::istream& in, size_t max_bytes, std::string& line, bool& overflow) {
    line.clear();
    overflow = false;

    std::streambuf* buf = in.rdbuf();
    if (!buf || !in.good()) {
        return false;
    }

    bool any = false;
    for (;;) {
        int c = buf->sbumpc();
        if (c == std::char_traits<char>::eof()) {
            in.setstate(std::ios::eofbit);
            return any;
        }
        any = true;
        if (c == '\n') {
            return true;
        }
        if (line.size() < max_bytes) {
            line += static_cast<char>(c);
        } else {
            overflow = true;
        }
    }
}

int Application::run() {
    return run(std::cin, std::cout);
}

void Application::shutdown() {
    LOG_INFO("Shutting down...");

    if (thread_pool_) {
        thread_pool_->shutdown();
        thread_pool_.reset();
    }
    validator_.reset();
    executor_.reset();

    if (SandboxInstance::live_count() != 0) {
        LOG_ERROR("%d sandbox instance(s) still open at shutdown", SandboxInstance::live_count());
    }

    LOG_INFO("Goodbye!");
}

} // namespace sqlgate
