#include <vista/log.hpp>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace vista::log {

// Worker threads log concurrently; one lock keeps lines whole.
static std::mutex s_mutex;
static Level s_level = Info;
static bool s_color_initialized = false;
static bool s_color_enabled = false;
static Sink s_sink;

static void init_color() {
    if (!s_color_initialized) {
        s_color_enabled = isatty(fileno(stderr));
        s_color_initialized = true;
    }
}

void set_level(Level lvl) {
    std::lock_guard<std::mutex> lock(s_mutex);
    s_level = lvl;
}

Level get_level() {
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_level;
}

void set_color_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(s_mutex);
    s_color_enabled = enabled;
    s_color_initialized = true;
}

bool is_color_enabled() {
    std::lock_guard<std::mutex> lock(s_mutex);
    init_color();
    return s_color_enabled;
}

void set_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(s_mutex);
    s_sink = std::move(sink);
}

const char* level_name(Level lvl) {
    switch (lvl) {
        case Trace: return "trace";
        case Debug: return "debug";
        case Info:  return "info";
        case Warn:  return "warn";
        case Error: return "error";
    }
    return "unknown";
}

std::optional<Level> parse_level(const std::string& name) {
    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        if (name == level_name(lvl)) return lvl;
    }
    return std::nullopt;
}

static const char* level_color(Level lvl) {
    switch (lvl) {
        case Trace: return "\033[90m";   // gray
        case Debug: return "\033[36m";   // cyan
        case Info:  return "\033[32m";   // green
        case Warn:  return "\033[33m";   // yellow
        case Error: return "\033[31m";   // red
    }
    return "";
}

static const char* reset_color() {
    return "\033[0m";
}

static std::string format_message(const char* fmt, va_list args) {
    va_list copy;
    va_copy(copy, args);
    int len = std::vsnprintf(nullptr, 0, fmt, copy);
    va_end(copy);
    if (len <= 0) return std::string();

    std::vector<char> buf(static_cast<size_t>(len) + 1);
    std::vsnprintf(buf.data(), buf.size(), fmt, args);
    return std::string(buf.data(), static_cast<size_t>(len));
}

static void log_message(Level lvl, const char* fmt, va_list args) {
    std::lock_guard<std::mutex> lock(s_mutex);
    if (lvl < s_level) return;

    std::string msg = format_message(fmt, args);
    if (s_sink) {
        s_sink(lvl, msg);
        return;
    }

    init_color();
    if (s_color_enabled) {
        std::fprintf(stderr, "%s%s%s: %s\n",
                     level_color(lvl), level_name(lvl), reset_color(), msg.c_str());
    } else {
        std::fprintf(stderr, "%s: %s\n", level_name(lvl), msg.c_str());
    }
}

void trace(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Trace, fmt, args);
    va_end(args);
}

void debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Debug, fmt, args);
    va_end(args);
}

void info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Info, fmt, args);
    va_end(args);
}

void warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Warn, fmt, args);
    va_end(args);
}

void error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Error, fmt, args);
    va_end(args);
}

} // namespace vista::log
