#include "core/log.hpp"
#include <atomic>
#include <iostream>
#include <memory>
#include <mutex>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

namespace mrc::log {

static SinkFn g_sink;
static std::mutex g_mutex;
static std::atomic<bool> g_json{false};
static std::atomic<int> g_level{static_cast<int>(Level::Info)};

const char* level_name(Level lvl) noexcept {
    switch(lvl) {
        case Level::Trace: return "trace";
        case Level::Debug: return "debug";
        case Level::Info: return "info";
        case Level::Warn: return "warn";
        case Level::Error: return "error";
        case Level::Critical: return "critical";
    }
    return "unknown";
}

void set_sink(SinkFn sink) noexcept {
    std::scoped_lock lock(g_mutex);
    g_sink = std::move(sink);
}

void set_level(Level lvl) noexcept {
    g_level.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

Level level() noexcept { return static_cast<Level>(g_level.load(std::memory_order_relaxed)); }

void set_json_mode(bool enabled) noexcept { g_json.store(enabled, std::memory_order_relaxed); }
bool json_mode() noexcept { return g_json.load(std::memory_order_relaxed); }

static spdlog::level::level_enum to_spdlog(Level lvl) {
    switch(lvl) {
        case Level::Trace: return spdlog::level::trace;
        case Level::Debug: return spdlog::level::debug;
        case Level::Info: return spdlog::level::info;
        case Level::Warn: return spdlog::level::warn;
        case Level::Error: return spdlog::level::err;
        case Level::Critical: return spdlog::level::critical;
    }
    return spdlog::level::info;
}

// Both loggers stay fully open; g_level is the only threshold.
static spdlog::logger& text_logger() {
    static std::shared_ptr<spdlog::logger> logger = [] {
        if(auto existing = spdlog::get("mrc")) return existing;
        auto created = spdlog::stderr_color_mt("mrc");
        created->set_pattern("%H:%M:%S.%e %^%l%$ %v");
        created->set_level(spdlog::level::trace);
        return created;
    }();
    return *logger;
}

// {"ts":"ISO8601","level":"info","msg":"..."}, message escaped by the caller.
static spdlog::logger& json_logger() {
    static std::shared_ptr<spdlog::logger> logger = [] {
        if(auto existing = spdlog::get("mrc.json")) return existing;
        auto created = spdlog::stderr_logger_mt("mrc.json");
        created->set_pattern(R"({"ts":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","msg":"%v"})");
        created->set_level(spdlog::level::trace);
        return created;
    }();
    return *logger;
}

static std::string json_escape(const std::string& msg) {
    std::string out;
    out.reserve(msg.size());
    for(char c : msg) {
        switch(c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            default: out += c;
        }
    }
    return out;
}

static void default_emit(Level lvl, const std::string& msg) {
    if(json_mode()) json_logger().log(to_spdlog(lvl), json_escape(msg));
    else text_logger().log(to_spdlog(lvl), msg);
}

void write(Level lvl, const std::string& msg) noexcept {
    if(static_cast<int>(lvl) < g_level.load(std::memory_order_relaxed)) return;
    std::scoped_lock lock(g_mutex);
    try {
        if(g_sink) { g_sink(lvl, msg); return; }
        default_emit(lvl, msg);
    } catch(const std::exception& e) {
        std::cerr << "[log] sink failure: " << e.what() << '\n';
    }
}

void trace(const std::string& msg) noexcept { write(Level::Trace, msg); }
void debug(const std::string& msg) noexcept { write(Level::Debug, msg); }
void info(const std::string& msg) noexcept { write(Level::Info, msg); }
void warn(const std::string& msg) noexcept { write(Level::Warn, msg); }
void error(const std::string& msg) noexcept { write(Level::Error, msg); }
void critical(const std::string& msg) noexcept { write(Level::Critical, msg); }

} // namespace mrc::log
