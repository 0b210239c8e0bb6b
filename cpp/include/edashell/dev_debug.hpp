#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

// Auto-enable via env var:
// EDASHELL_DEBUG=1
// EDASHELL_DEBUG_PATH=/tmp/edashell.log
// EDASHELL_DEBUG_EXCLUDE=IO,PARSE

namespace edashell {
namespace dev {

// Thread-safe file logger for tool traffic (lazy-open).
class Logger {
public:
    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    // Enable/disable at runtime. If path empty, keeps the current path
    // (default "edashell_debug.log").
    void enable(bool on, std::string path = {}) {
        std::lock_guard<std::mutex> lk(mx_);
        enabled_.store(on, std::memory_order_relaxed);
        if (!path.empty() && path != path_) {
            close_nolock_();
            path_ = std::move(path);
        }
        if (on) {
            open_nolock_();
        } else {
            close_nolock_();
        }
    }

    bool enabled() const { return enabled_.load(std::memory_order_relaxed); }

    void exclude(std::string tag) {
        std::lock_guard<std::mutex> lk(mx_);
        excluded_.push_back(std::move(tag));
    }

    // printf-style logging with timestamp and thread id.
    void logf(const char* tag, const char* fmt, ...) {
        if (!enabled()) return;

        char buf[2048];
        va_list ap;
        va_start(ap, fmt);
        std::vsnprintf(buf, sizeof(buf), fmt, ap);
        va_end(ap);

        std::lock_guard<std::mutex> lk(mx_);
        if (is_excluded_(tag)) return;
        if (!fh_) open_nolock_();
        if (!fh_) return; // give up if open failed
        write_line_nolock_(tag, buf);
    }

    // Multi-line payloads (captured tool output, rendered scripts), one
    // prefixed record per line so the log stays greppable.
    void log_block(const char* tag, std::string_view title, std::string_view text) {
        if (!enabled()) return;
        std::lock_guard<std::mutex> lk(mx_);
        if (is_excluded_(tag)) return;
        if (!fh_) open_nolock_();
        if (!fh_) return;

        std::string line(title);
        line += " (";
        line += std::to_string(text.size());
        line += " bytes)";
        write_line_nolock_(tag, line.c_str());

        size_t pos = 0;
        while (pos < text.size()) {
            size_t nl = text.find('\n', pos);
            if (nl == std::string_view::npos) nl = text.size();
            line.assign("  | ");
            line.append(text.substr(pos, nl - pos));
            write_line_nolock_(tag, line.c_str());
            pos = nl + 1;
        }
    }

private:
    Logger() {
        const char* env_on   = std::getenv("EDASHELL_DEBUG");
        const char* env_path = std::getenv("EDASHELL_DEBUG_PATH");
        const char* env_excl = std::getenv("EDASHELL_DEBUG_EXCLUDE");
        if (env_excl) parse_excluded_(env_excl);
        if (env_path && *env_path) path_ = env_path;
        if (env_on && *env_on == '1') {
            enabled_.store(true);
            open_nolock_();
            logf("LOGGER", "EDASHELL_DEBUG_PATH=%s", path_.c_str());
            logf("LOGGER", "EDASHELL_DEBUG_EXCLUDE=%s", env_excl ? env_excl : "(none)");
        }
    }
    ~Logger() { close_nolock_(); }
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void parse_excluded_(std::string_view list) {
        size_t start = 0;
        while (start <= list.size()) {
            size_t comma = list.find(',', start);
            if (comma == std::string_view::npos) comma = list.size();
            if (comma > start) excluded_.emplace_back(list.substr(start, comma - start));
            start = comma + 1;
        }
    }

    bool is_excluded_(const char* tag) const {
        if (!tag) return false;
        return std::find(excluded_.begin(), excluded_.end(), tag) != excluded_.end();
    }

    void write_line_nolock_(const char* tag, const char* msg) {
        // Timestamp (UTC), thread id
        auto now    = std::chrono::system_clock::now();
        auto secs   = std::chrono::time_point_cast<std::chrono::seconds>(now);
        auto micros = std::chrono::duration_cast<std::chrono::microseconds>(now - secs).count();
        std::time_t t = std::chrono::system_clock::to_time_t(secs);
        std::tm tm{};
        gmtime_r(&t, &tm);
        char ts[64];
        std::snprintf(ts, sizeof(ts), "%04d-%02d-%02dT%02d:%02d:%02d.%06lldZ",
                      tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                      tm.tm_hour, tm.tm_min, tm.tm_sec,
                      static_cast<long long>(micros));

        auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id());
        std::fprintf(fh_, "[%s] [%s] [tid=%llu] %s\n",
                     ts, tag ? tag : "-", static_cast<unsigned long long>(tid), msg);
        std::fflush(fh_);
    }

    void open_nolock_() {
        if (fh_) return;
        if (path_.empty()) path_ = "edashell_debug.log";
        fh_ = std::fopen(path_.c_str(), "ab");
        if (fh_) {
            std::fprintf(fh_, "----- edashell debug start -----\n");
            std::fflush(fh_);
        }
    }

    void close_nolock_() {
        if (fh_) {
            std::fprintf(fh_, "----- edashell debug stop ------\n");
            std::fclose(fh_);
            fh_ = nullptr;
        }
    }

    std::atomic<bool> enabled_{false};
    std::string path_;
    std::vector<std::string> excluded_;
    std::mutex mx_;
    std::FILE* fh_{nullptr};
};

}} // namespace edashell::dev

// Convenience macros (keep callsites short)
#define EDASHELL_DBG(TAG, FMT, ...) \
    do { if (::edashell::dev::Logger::instance().enabled()) \
        ::edashell::dev::Logger::instance().logf(TAG, FMT, ##__VA_ARGS__); } while(0)

#define EDASHELL_DBG_BLOCK(TAG, TITLE, TEXT) \
    do { if (::edashell::dev::Logger::instance().enabled()) \
        ::edashell::dev::Logger::instance().log_block(TAG, TITLE, TEXT); } while(0)
