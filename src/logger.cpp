#include "logger.hpp"
#include <zlib.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include "time_utils.hpp"
#ifdef __linux__
#include <syslog.h>
#endif

namespace fs = std::filesystem;

static std::mutex g_log_mtx;
static std::ofstream g_log_ofs;
static std::string g_log_path; // NOLINT(runtime/string)
static std::atomic<LogLevel> g_min_level{LogLevel::INFO};
static size_t g_max_size = 0;
static size_t g_max_files = 1;
static std::atomic<bool> g_json_log{false};
static std::atomic<bool> g_compress_logs{false};
#ifdef __linux__
static std::atomic<bool> g_syslog{false};
#endif

static const char* level_label(LogLevel level) {
    switch (level) {
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::WARNING:
        return "WARNING";
    case LogLevel::ERR:
        return "ERROR";
    }
    return "INFO";
}

bool init_logger(const std::string& path, LogLevel level, size_t max_size, size_t max_files) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (g_log_ofs.is_open())
        g_log_ofs.close();
    g_log_ofs.clear();
    std::error_code ec;
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty())
        fs::create_directories(parent, ec);
    g_log_ofs.open(path, std::ios::app);
    if (!g_log_ofs.is_open()) {
        std::cerr << "Failed to open log file: " << path << std::endl;
        g_log_path.clear();
        return false;
    }
    g_log_path = path;
    g_max_size = max_size;
    g_max_files = max_files;
    g_min_level.store(level);
    return true;
}

#ifdef __linux__
void init_syslog(int facility) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    openlog("hazelnutd", LOG_PID | LOG_CONS, facility == 0 ? LOG_USER : facility);
    g_syslog.store(true);
}
#else
void init_syslog(int) {}
#endif

void set_log_level(LogLevel level) { g_min_level.store(level); }

void set_json_logging(bool enable) { g_json_log.store(enable); }

void set_log_compression(bool enable) { g_compress_logs.store(enable); }

bool logger_initialized() {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    return g_log_ofs.is_open();
}

std::optional<LogLevel> parse_log_level(const std::string& name) {
    std::string v = name;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "debug" || v == "trace")
        return LogLevel::DEBUG;
    if (v == "info")
        return LogLevel::INFO;
    if (v == "warning" || v == "warn")
        return LogLevel::WARNING;
    if (v == "error" || v == "err")
        return LogLevel::ERR;
    return std::nullopt;
}

static bool gzip_file(const std::string& src, const std::string& dst) {
    std::ifstream in(src, std::ios::binary);
    gzFile out = gzopen(dst.c_str(), "wb");
    if (!in.is_open() || out == nullptr) {
        if (out)
            gzclose(out);
        return false;
    }
    char buf[8192];
    bool ok = true;
    while (in && ok) {
        in.read(buf, sizeof(buf));
        std::streamsize n = in.gcount();
        if (n > 0)
            ok = gzwrite(out, buf, static_cast<unsigned int>(n)) == static_cast<int>(n);
    }
    return gzclose(out) == Z_OK && ok;
}

// Shift name.N -> name.N+1, dropping the oldest, then move the live file to
// name.1. Caller holds g_log_mtx with the stream closed.
static void rotate_files() {
    std::error_code ec;
    const std::string suffix = g_compress_logs.load() ? ".gz" : "";
    for (size_t i = g_max_files; i > 0; --i) {
        fs::path src = g_log_path + "." + std::to_string(i) + suffix;
        if (i == g_max_files)
            fs::remove(src, ec);
        else
            fs::rename(src, g_log_path + "." + std::to_string(i + 1) + suffix, ec);
    }
    fs::path first = g_log_path + ".1";
    fs::rename(g_log_path, first, ec);
    if (g_compress_logs.load() && !ec) {
        if (gzip_file(first.string(), first.string() + ".gz"))
            fs::remove(first, ec);
    }
}

static std::string format_entry(LogLevel level, const std::string& msg, const LogFields& fields) {
    std::string ts = timestamp();
    if (g_json_log.load()) {
        nlohmann::json j{{"timestamp", ts}, {"level", level_label(level)}, {"msg", msg}};
        for (const auto& [k, v] : fields)
            j[k] = v;
        return j.dump();
    }
    std::string line = "[" + ts + "] [" + level_label(level) + "] " + msg;
    for (const auto& [k, v] : fields)
        line += " " + k + "=" + v;
    return line;
}

void log_event(LogLevel level, const std::string& message, const LogFields& fields) {
    if (level < g_min_level.load())
        return;
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (!g_log_ofs.is_open())
        return;
    std::string line = format_entry(level, message, fields);
    g_log_ofs << line << '\n';
    g_log_ofs.flush();
    if (g_max_size > 0) {
        std::error_code ec;
        auto size = fs::file_size(g_log_path, ec);
        if (!ec && size > g_max_size) {
            g_log_ofs.close();
            if (g_max_files > 0)
                rotate_files();
            g_log_ofs.open(g_log_path, std::ios::trunc);
        }
    }
#ifdef __linux__
    if (g_syslog.load()) {
        int pri = LOG_INFO;
        switch (level) {
        case LogLevel::DEBUG:
            pri = LOG_DEBUG;
            break;
        case LogLevel::INFO:
            pri = LOG_INFO;
            break;
        case LogLevel::WARNING:
            pri = LOG_WARNING;
            break;
        case LogLevel::ERR:
            pri = LOG_ERR;
            break;
        }
        syslog(pri, "%s", line.c_str());
    }
#endif
}

void log_debug(const std::string& msg) { log_event(LogLevel::DEBUG, msg); }
void log_debug(const std::string& msg, const LogFields& fields) {
    log_event(LogLevel::DEBUG, msg, fields);
}
void log_info(const std::string& msg) { log_event(LogLevel::INFO, msg); }
void log_info(const std::string& msg, const LogFields& fields) {
    log_event(LogLevel::INFO, msg, fields);
}
void log_warning(const std::string& msg) { log_event(LogLevel::WARNING, msg); }
void log_warning(const std::string& msg, const LogFields& fields) {
    log_event(LogLevel::WARNING, msg, fields);
}
void log_error(const std::string& msg) { log_event(LogLevel::ERR, msg); }
void log_error(const std::string& msg, const LogFields& fields) {
    log_event(LogLevel::ERR, msg, fields);
}

void shutdown_logger() {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (g_log_ofs.is_open()) {
        g_log_ofs.flush();
        g_log_ofs.close();
    }
    g_log_path.clear();
#ifdef __linux__
    if (g_syslog.load()) {
        closelog();
        g_syslog.store(false);
    }
#endif
}
