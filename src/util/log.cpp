#include <gapline/log.hpp>
#include <atomic>
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

namespace gapline::log {

// Level and colour may be read from several analysis threads at once.
// The sink is only swapped while no other thread is logging.
static std::atomic<Level> s_level{Warn};
static std::once_flag s_color_once;
static std::atomic<bool> s_color_enabled{false};
static Sink s_sink;

static void init_color() {
    std::call_once(s_color_once, [] {
        s_color_enabled.store(isatty(fileno(stderr)) != 0);
    });
}

void set_level(Level lvl) {
    s_level.store(lvl);
}

Level get_level() {
    return s_level.load();
}

void set_color_enabled(bool enabled) {
    init_color();
    s_color_enabled.store(enabled);
}

bool is_color_enabled() {
    init_color();
    return s_color_enabled.load();
}

void set_sink(Sink sink) {
    s_sink = std::move(sink);
}

void reset_sink() {
    s_sink = nullptr;
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

std::optional<Level> level_from_name(const std::string& name) {
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
    int needed = std::vsnprintf(nullptr, 0, fmt, copy);
    va_end(copy);
    if (needed <= 0) return std::string();

    std::vector<char> buf(static_cast<size_t>(needed) + 1);
    std::vsnprintf(buf.data(), buf.size(), fmt, args);
    return std::string(buf.data(), static_cast<size_t>(needed));
}

static void log_message(Level lvl, const char* fmt, va_list args) {
    if (lvl < s_level.load()) return;

    std::string msg = format_message(fmt, args);
    if (s_sink) {
        s_sink(lvl, msg);
        return;
    }

    init_color();
    if (s_color_enabled.load()) {
        std::fprintf(stderr, "%s%s%s: %s\n", level_color(lvl), level_name(lvl),
                     reset_color(), msg.c_str());
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

} // namespace gapline::log
