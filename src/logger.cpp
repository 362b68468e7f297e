#include "logger.hpp"
#include <zlib.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "time_utils.hpp"
#ifdef __linux__
#include <syslog.h>
#endif

namespace fs = std::filesystem;

static std::ofstream g_log_ofs;
static std::string g_log_path; // NOLINT(runtime/string)
static std::atomic<LogLevel> g_min_level{LogLevel::INFO};
static std::atomic<size_t> g_max_size{0};
static std::atomic<size_t> g_max_files{1};
static std::atomic<bool> g_json_log{false};
static std::atomic<bool> g_compress_logs{false};
#ifdef __linux__
static std::atomic<bool> g_syslog{false};
#endif

struct LogMessage {
    LogLevel level;
    std::string msg;
    std::map<std::string, std::string> fields;
};

static std::deque<LogMessage> g_log_queue;
static std::mutex g_queue_mtx;
static std::condition_variable g_queue_cv;
static std::condition_variable g_drained_cv;
static bool g_writing = false;
static std::atomic<bool> g_running{false};
// Mirrors whether a log file is configured; g_log_ofs itself is reopened by
// the writer thread during rotation.
static std::atomic<bool> g_initialized{false};
static std::thread g_log_thread;
static std::mutex g_init_mtx;

static void log_worker();

static void stop_log_thread() {
    {
        std::lock_guard<std::mutex> lk(g_queue_mtx);
        g_running.store(false);
    }
    g_queue_cv.notify_all();
    if (g_log_thread.joinable())
        g_log_thread.join();
}

void init_logger(const std::string& path, LogLevel level, size_t max_size, size_t max_files) {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    std::string prev_path = g_log_path;
    stop_log_thread();
    if (g_log_ofs.is_open())
        g_log_ofs.close();
    g_log_ofs.clear();
    g_max_size.store(max_size);
    g_max_files.store(max_files);
    std::string target = path;
    g_log_ofs.open(target, std::ios::app);
    if (!g_log_ofs.is_open()) {
        std::cerr << "Failed to open log file: " << path << std::endl;
        target = prev_path;
        if (!target.empty())
            g_log_ofs.open(target, std::ios::app);
    }
    g_log_path = target;
    g_initialized.store(g_log_ofs.is_open());
    g_min_level.store(level);
    g_running.store(true);
    g_log_thread = std::thread(log_worker);
}

#ifdef __linux__
void init_syslog(int facility) {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    openlog("ghbackup", LOG_PID | LOG_CONS, facility == 0 ? LOG_USER : facility);
    g_syslog.store(true);
}
#else
void init_syslog(int) {}
#endif

void set_log_level(LogLevel level) { g_min_level.store(level); }

void set_json_logging(bool enable) { g_json_log.store(enable); }

void set_log_compression(bool enable) { g_compress_logs.store(enable); }

bool logger_initialized() { return g_initialized.load(); }

std::optional<LogLevel> parse_log_level(const std::string& name) {
    std::string up = name;
    std::transform(up.begin(), up.end(), up.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (up == "DEBUG")
        return LogLevel::DEBUG;
    if (up == "INFO")
        return LogLevel::INFO;
    if (up == "WARNING" || up == "WARN")
        return LogLevel::WARNING;
    if (up == "ERROR" || up == "ERR")
        return LogLevel::ERR;
    return std::nullopt;
}

const char* log_level_name(LogLevel level) {
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

void flush_logger() {
    std::unique_lock<std::mutex> lk(g_queue_mtx);
    g_drained_cv.wait(lk, [] { return (g_log_queue.empty() && !g_writing) || !g_running.load(); });
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
    while (in) {
        in.read(buf, sizeof(buf));
        std::streamsize n = in.gcount();
        if (n > 0 && gzwrite(out, buf, static_cast<unsigned int>(n)) == 0) {
            gzclose(out);
            return false;
        }
    }
    return gzclose(out) == Z_OK;
}

// Shift <log>.1 .. <log>.N up by one, dropping the oldest, then move the
// active file into slot 1.
static void rotate_logs() {
    const size_t keep = g_max_files.load();
    const std::string ext = g_compress_logs.load() ? ".gz" : "";
    std::error_code ec;
    if (keep > 0) {
        for (size_t i = keep; i > 0; --i) {
            fs::path src = g_log_path + "." + std::to_string(i) + ext;
            if (i == keep)
                fs::remove(src, ec);
            else
                fs::rename(src, g_log_path + "." + std::to_string(i + 1) + ext, ec);
        }
        fs::path first = g_log_path + ".1";
        fs::rename(g_log_path, first, ec);
        if (!ext.empty() && !ec) {
            fs::path gz = first;
            gz += ext;
            if (gzip_file(first.string(), gz.string()))
                fs::remove(first, ec);
        }
    }
    g_log_ofs.open(g_log_path, std::ios::trunc);
}

static std::string format_entry(const LogMessage& m) {
    const std::string ts = timestamp();
    if (g_json_log.load()) {
        nlohmann::json j;
        j["timestamp"] = ts;
        j["level"] = log_level_name(m.level);
        j["msg"] = m.msg;
        for (const auto& [k, v] : m.fields)
            j[k] = v;
        return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
    std::string line = "[" + ts + "] [" + log_level_name(m.level) + "] " + m.msg;
    for (const auto& [k, v] : m.fields)
        line += " " + k + "=" + v;
    return line;
}

static void write_log_entry(const LogMessage& m) {
    if (!g_log_ofs.is_open() || m.level < g_min_level.load())
        return;
    std::string line = format_entry(m);
    g_log_ofs << line << '\n';
    if (g_max_size.load() > 0) {
        g_log_ofs.flush();
        std::error_code ec;
        auto size = fs::file_size(g_log_path, ec);
        if (!ec && size > g_max_size.load()) {
            g_log_ofs.close();
            rotate_logs();
        }
    }
#ifdef __linux__
    if (g_syslog.load()) {
        int pri = LOG_INFO;
        switch (m.level) {
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

static void enqueue_message(LogLevel level, const std::string& msg,
                            const std::map<std::string, std::string>& fields) {
    if (level < g_min_level.load() || !g_running.load())
        return;
    {
        std::lock_guard<std::mutex> lk(g_queue_mtx);
        g_log_queue.push_back(LogMessage{level, msg, fields});
    }
    g_queue_cv.notify_one();
}

void log_debug(const std::string& msg) { enqueue_message(LogLevel::DEBUG, msg, {}); }
void log_debug(const std::string& msg, const std::map<std::string, std::string>& fields) {
    enqueue_message(LogLevel::DEBUG, msg, fields);
}
void log_info(const std::string& msg) { enqueue_message(LogLevel::INFO, msg, {}); }
void log_info(const std::string& msg, const std::map<std::string, std::string>& fields) {
    enqueue_message(LogLevel::INFO, msg, fields);
}
void log_warning(const std::string& msg) { enqueue_message(LogLevel::WARNING, msg, {}); }
void log_warning(const std::string& msg, const std::map<std::string, std::string>& fields) {
    enqueue_message(LogLevel::WARNING, msg, fields);
}
void log_error(const std::string& msg) { enqueue_message(LogLevel::ERR, msg, {}); }
void log_error(const std::string& msg, const std::map<std::string, std::string>& fields) {
    enqueue_message(LogLevel::ERR, msg, fields);
}

static void log_worker() {
    std::vector<LogMessage> batch;
    batch.reserve(16);
    while (true) {
        std::unique_lock<std::mutex> lk(g_queue_mtx);
        g_queue_cv.wait(lk, [] { return !g_log_queue.empty() || !g_running.load(); });
        if (!g_running.load() && g_log_queue.empty())
            break;
        while (!g_log_queue.empty() && batch.size() < 16) {
            batch.push_back(std::move(g_log_queue.front()));
            g_log_queue.pop_front();
        }
        g_writing = true;
        lk.unlock();
        for (const LogMessage& m : batch)
            write_log_entry(m);
        batch.clear();
        g_log_ofs.flush();
        lk.lock();
        g_writing = false;
        if (g_log_queue.empty())
            g_drained_cv.notify_all();
    }
    g_log_ofs.flush();
    g_drained_cv.notify_all();
}

void shutdown_logger() {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    g_initialized.store(false);
    stop_log_thread();
    if (g_log_ofs.is_open()) {
        g_log_ofs.flush();
        g_log_ofs.close();
    }
#ifdef __linux__
    if (g_syslog.load()) {
        closelog();
        g_syslog.store(false);
    }
#endif
    std::lock_guard<std::mutex> qlk(g_queue_mtx);
    g_log_queue.clear();
}
