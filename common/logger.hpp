#pragma once

// ============================================================
// logger.hpp -- Thread-safe logger
//
// Lines go to stdout (stderr for WARN and up) and, optionally, to a
// file. A Writer sink -- normally a GelfClient -- receives the same
// events as newline-terminated GELF 1.1 JSON records:
//
//   {"version":"1.1","host":"web-1","short_message":"...",
//    "timestamp":1700000000.123,"level":4}
// ============================================================

#include "platform.hpp"
#include "writer.hpp"
#include "json.hpp"
#include <string>
#include <mutex>
#include <atomic>
#include <fstream>
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <exception>
#include <ctime>

enum class LogLevel {
    DEBUG = 0,
    INFO  = 1,
    WARN  = 2,
    ERR   = 3,
};

// Syslog severity carried in the GELF "level" field
inline int syslog_severity(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::DEBUG: return 7;
        case LogLevel::INFO:  return 6;
        case LogLevel::WARN:  return 4;
        case LogLevel::ERR:   return 3;
    }
    return 6;
}

class Logger {
public:
    static Logger& get() {
        static Logger instance;
        return instance;
    }

    void set_level(LogLevel lvl) { level_.store(lvl); }
    LogLevel level() const { return level_.load(); }

    void set_log_file(const std::string& path) {
        std::lock_guard<std::mutex> lk(mutex_);
        file_.open(path, std::ios::app);
    }

    // Also ship every event to `sink`; nullptr detaches and waits for any
    // write in flight. The sink must outlive its registration. Events the
    // sink logs from inside its own write() reach the console and file only.
    void set_sink(Writer* sink) {
        std::lock_guard<std::mutex> lk(sink_mutex_);
        sink_ = sink;
    }

    // GELF "host" field; defaults to gethostname()
    void set_host(const std::string& host) {
        std::lock_guard<std::mutex> lk(mutex_);
        host_ = host;
    }

    void log(LogLevel lvl, const std::string& msg) {
        if (lvl < level_.load()) return;
        auto now = std::chrono::system_clock::now();
        std::string line = console_line(now, lvl, msg);

        std::string host;
        {
            std::lock_guard<std::mutex> lk(mutex_);
            std::ostream& out = (lvl >= LogLevel::WARN) ? std::cerr : std::cout;
            out << line << "\n";
            if (file_.is_open()) {
                file_ << line << "\n";
                file_.flush();
            }
            host = host_;
        }

        // The sink runs without mutex_ so it may log; nesting stops here
        bool& nested = in_sink();
        if (nested) return;
        std::lock_guard<std::mutex> sk(sink_mutex_);
        if (!sink_) return;
        nested = true;
        try {
            sink_->write(gelf_record(now, lvl, host, msg));
        } catch (const std::exception& e) {
            // Reported locally only; the sink is what failed
            std::lock_guard<std::mutex> lk(mutex_);
            std::cerr << console_line(now, LogLevel::ERR,
                                      std::string("log sink: ") + e.what()) << "\n";
        }
        nested = false;
    }

    void info(const std::string& msg)  { log(LogLevel::INFO, msg); }
    void warn(const std::string& msg)  { log(LogLevel::WARN, msg); }
    void error(const std::string& msg) { log(LogLevel::ERR,  msg); }
    void debug(const std::string& msg) { log(LogLevel::DEBUG, msg); }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    using time_point = std::chrono::system_clock::time_point;

    Logger() : level_(LogLevel::INFO), host_(local_host_name()) {}

    static std::string console_line(time_point now, LogLevel lvl, const std::string& msg) {
        auto t  = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &t);
#else
        localtime_r(&t, &tm_buf);
#endif
        std::ostringstream ss;
        ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
        ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        ss << " [" << level_str(lvl) << "] " << msg;
        return ss.str();
    }

    static std::string gelf_record(time_point now, LogLevel lvl,
                                   const std::string& host, const std::string& msg) {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()).count();
        std::ostringstream ts;
        ts << (ms / 1000) << '.' << std::setfill('0') << std::setw(3) << (ms % 1000);

        std::string rec;
        rec.reserve(msg.size() + 128);
        rec += '{';
        json::field(rec, "version", "1.1");
        json::field(rec, "host", host);
        json::field(rec, "short_message", msg);
        json::raw_field(rec, "timestamp", ts.str());
        rec += "\"level\":";
        rec += std::to_string(syslog_severity(lvl));
        rec += "}\n";
        return rec;
    }

    // Set while this thread is inside sink_->write()
    static bool& in_sink() {
        thread_local bool flag = false;
        return flag;
    }

    static std::string local_host_name() {
        char buf[256] = {0};
        if (gethostname(buf, sizeof(buf) - 1) != 0 || buf[0] == '\0') {
            return "localhost";
        }
        return buf;
    }

    static const char* level_str(LogLevel lvl) {
        switch (lvl) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO ";
            case LogLevel::WARN:  return "WARN ";
            case LogLevel::ERR:   return "ERROR";
        }
        return "?????";
    }

    std::mutex            mutex_;        // console, file, host_
    std::mutex            sink_mutex_;   // sink_ and writes through it
    std::atomic<LogLevel> level_;
    std::ofstream         file_;
    Writer*               sink_ = nullptr;
    std::string           host_;
};

// Convenience macros
#define LOG_INFO(msg)  Logger::get().info(msg)
#define LOG_WARN(msg)  Logger::get().warn(msg)
#define LOG_ERROR(msg) Logger::get().error(msg)
#define LOG_DEBUG(msg) Logger::get().debug(msg)
