#include <sqlgate/core/logger.hpp>

#include <chrono>
#include <cstring>
#include <unistd.h>

namespace sqlgate {

namespace {

struct LevelStyle {
    const char* tag;
    const char* color;
};

LevelStyle style_for(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return {"DEBUG", "\033[34m"};
        case LogLevel::INFO:  return {"INFO",  "\033[32m"};
        case LogLevel::WARN:  return {"WARN",  "\033[33m"};
        case LogLevel::ERROR: return {"ERROR", "\033[31m"};
        default:              return {"?",     "\033[0m"};
    }
}

// "/home/x/sqlgate/src/validator/sandbox.cpp" -> "sandbox.cpp"
const char* base_name(const char* path) {
    const char* slash = strrchr(path, '/');
    return slash ? slash + 1 : path;
}

// Reduce __PRETTY_FUNCTION__ to "Class::method" or "function".
// "sqlgate::Verdict sqlgate::Validator::validate(const ...) const"
//   -> "Validator::validate"
std::string short_function(const char* pretty) {
    std::string sig(pretty);

    size_t paren = sig.find('(');
    if (paren != std::string::npos) {
        sig.erase(paren);
    }

    // Return type and qualifiers end at the last space outside template args
    int depth = 0;
    size_t name_start = 0;
    for (size_t i = 0; i < sig.size(); ++i) {
        if (sig[i] == '<') ++depth;
        else if (sig[i] == '>') --depth;
        else if (sig[i] == ' ' && depth == 0) name_start = i + 1;
    }
    sig.erase(0, name_start);

    if (!sig.empty() && (sig[0] == '*' || sig[0] == '&')) {
        sig.erase(0, 1);
    }

    static const char PREFIX[] = "sqlgate::";
    while (sig.compare(0, sizeof(PREFIX) - 1, PREFIX) == 0) {
        sig.erase(0, sizeof(PREFIX) - 1);
    }
    // Keep only the innermost Class::method pair
    size_t last = sig.rfind("::");
    if (last != std::string::npos && last > 0) {
        size_t prev = sig.rfind("::", last - 1);
        if (prev != std::string::npos) {
            sig.erase(0, prev + 2);
        }
    }
    return sig;
}

std::string timestamp_now() {
    std::chrono::system_clock::time_point now = std::chrono::system_clock::now();
    time_t secs = std::chrono::system_clock::to_time_t(now);
    long ms = static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000);

    struct tm t;
    localtime_r(&secs, &t);
    char date[32];
    strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &t);

    char out[48];
    snprintf(out, sizeof(out), "%s.%03ld", date, ms);
    return out;
}

} // namespace

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger()
    : level_(LogLevel::INFO)
    , color_(isatty(STDERR_FILENO) != 0)
{}

void Logger::set_level(LogLevel level) { level_ = level; }

LogLevel Logger::level() const { return level_; }

bool Logger::parse_level(const std::string& name, LogLevel& out) {
    static const struct {
        const char* name;
        LogLevel level;
    } LEVELS[] = {
        {"debug", LogLevel::DEBUG},
        {"info", LogLevel::INFO},
        {"warn", LogLevel::WARN},
        {"warning", LogLevel::WARN},
        {"error", LogLevel::ERROR},
    };

    for (size_t i = 0; i < sizeof(LEVELS) / sizeof(LEVELS[0]); ++i) {
        if (name == LEVELS[i].name) {
            out = LEVELS[i].level;
            return true;
        }
    }
    return false;
}

void Logger::debug(const char* file, int line, const char* func, const char* fmt, ...) {
    if (level_ > LogLevel::DEBUG) return;
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::DEBUG, file, line, func, fmt, args);
    va_end(args);
}

void Logger::info(const char* file, int line, const char* func, const char* fmt, ...) {
    if (level_ > LogLevel::INFO) return;
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::INFO, file, line, func, fmt, args);
    va_end(args);
}

void Logger::warn(const char* file, int line, const char* func, const char* fmt, ...) {
    if (level_ > LogLevel::WARN) return;
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::WARN, file, line, func, fmt, args);
    va_end(args);
}

void Logger::error(const char* file, int line, const char* func, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::ERROR, file, line, func, fmt, args);
    va_end(args);
}

void Logger::log_impl(LogLevel level, const char* file, int line, const char* func, const char* fmt, va_list args) {
    // Format the message first so each record is a single write
    char stack_buf[512];
    va_list copy;
    va_copy(copy, args);
    int needed = vsnprintf(stack_buf, sizeof(stack_buf), fmt, copy);
    va_end(copy);

    std::string message;
    if (needed < 0) {
        message = fmt;
    } else if (static_cast<size_t>(needed) < sizeof(stack_buf)) {
        message.assign(stack_buf, static_cast<size_t>(needed));
    } else {
        message.resize(static_cast<size_t>(needed) + 1);
        vsnprintf(&message[0], message.size(), fmt, args);
        message.resize(static_cast<size_t>(needed));
    }

    LevelStyle style = style_for(level);
    const char* on = color_ ? style.color : "";
    const char* off = color_ ? "\033[0m" : "";

    std::string record = "[" + timestamp_now() + "] " + on + "[" + style.tag + "]" + off + " ";
    if (level_ == LogLevel::DEBUG) {
        record += std::string(color_ ? "\033[36m" : "") + "(" + short_function(func) + ")" + off +
                  " at " + base_name(file) + ":" + std::to_string(line) + " ";
    }
    record += message;
    record += '\n';

    std::lock_guard<std::mutex> lock(write_mutex_);
    fputs(record.c_str(), stderr);
    fflush(stderr);
}

} // namespace sqlgate
