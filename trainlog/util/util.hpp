#pragma once

#include <stdint.h>
#include <unistd.h>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace trainlog {

//----------------------------------------------------------------------------
// compiler-specific

#ifdef __GNUG__
#define likely(x) __builtin_expect(bool(x), true)
#define unlikely(x) __builtin_expect(bool(x), false)
#else  // __GNUG__
#warning "ignoring likely(-), unlikely(-)"
#define likely(x) (x)
#define unlikely(x) (x)
#endif  // __GNUG__

//----------------------------------------------------------------------------
// debugging

#ifndef TRAINLOG_DEBUG_LEVEL
#define TRAINLOG_DEBUG_LEVEL 0
#endif  // TRAINLOG_DEBUG_LEVEL

//----------------------------------------------------------------------------
// convenience

template <class T>
inline T min(T x, T y) {
    return (x < y) ? x : y;
}

class noncopyable {
    noncopyable(const noncopyable&) = delete;
    void operator=(const noncopyable&) = delete;

   public:
    noncopyable() {}
};

//----------------------------------------------------------------------------
// time

float get_elapsed_time();
std::string get_date(bool hour = true);

class Timer {
    typedef std::chrono::high_resolution_clock Clock;
    typedef std::chrono::time_point<Clock> Time;
    Time m_start;

   public:
    Timer() : m_start(Clock::now()) {}
    double elapsed() const {
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
            Clock::now() - m_start);
        return duration.count() * 1e-6;
    }
};

//----------------------------------------------------------------------------
// environment variables

inline const char* getenv_default(const char* key, const char* default_val) {
    const char* val = getenv(key);
    return val ? val : default_val;
}

inline size_t getenv_default(const char* key, size_t default_val) {
    const char* val = getenv(key);
    return val ? atoi(val) : default_val;
}

//----------------------------------------------------------------------------
// logging

const char* const DEFAULT_LOG_FILE = "trainlog.log";
const size_t DEFAULT_LOG_LEVEL = 1;

static const char* g_log_level_name[4] = {"ERROR   ", "WARNING ", "INFO    ",
                                          "DEBUG   "};

class Log {
    struct GlobalState {
        const char* log_filename;
        std::ofstream log_stream;
        const size_t log_level;
        std::mutex mutex;

        GlobalState();

        void write(const std::string& message) {
            std::unique_lock<std::mutex> lock(mutex);
            log_stream << message << std::flush;
        }
    };

    static GlobalState s_state;

    std::ostringstream m_message;

   public:
    static size_t level() { return s_state.log_level; }

    explicit Log(size_t level) {
        m_message << std::left << std::setw(8) << getpid();
        m_message << std::left << std::setw(12) << get_elapsed_time();
        m_message << g_log_level_name[min<size_t>(3, level)];
    }

    ~Log() {
        m_message << '\n';
        s_state.write(m_message.str());
    }

    template <class T>
    Log& operator<<(const T& t) {
        m_message << t;
        return *this;
    }

    struct Context {
        explicit Context(std::string name);
        Context(int argc, char** argv);
        ~Context();
    };

    static int init();
};

#define TRAINLOG_WARN(message) \
    { if (trainlog::Log::level() >= 1) { trainlog::Log(1) << message; } }
#define TRAINLOG_INFO(message) \
    { if (trainlog::Log::level() >= 2) { trainlog::Log(2) << message; } }
#define TRAINLOG_DEBUG(message) \
    { if (trainlog::Log::level() >= 3) { trainlog::Log(3) << message; } }

#define TRAINLOG_PRINT(variable) TRAINLOG_INFO(#variable " = " << (variable))

#define TRAINLOG_ERROR(message) { trainlog::Log(0) \
    << message << "\n\t" \
    << __FILE__ << " : " << __LINE__ << "\n\t" \
    << __PRETTY_FUNCTION__ << "\n"; \
    std::cerr << "ERROR " << message << std::endl; \
    abort(); }

#define TRAINLOG_ASSERT(cond, mess) { if (not (cond)) TRAINLOG_ERROR(mess) }

#define TRAINLOG_ASSERT_(level, cond, mess) \
    { if (TRAINLOG_DEBUG_LEVEL >= (level)) TRAINLOG_ASSERT(cond, mess) }

#define TRAINLOG_ASSERT1(cond, mess) TRAINLOG_ASSERT_(1, cond, mess)
#define TRAINLOG_ASSERT2(cond, mess) TRAINLOG_ASSERT_(2, cond, mess)
#define TRAINLOG_ASSERT3(cond, mess) TRAINLOG_ASSERT_(3, cond, mess)

#define TRAINLOG_ASSERT_EQ(x, y) \
    TRAINLOG_ASSERT((x) == (y), \
            "expected " #x " == " #y "; actual " << (x) << " vs " << (y))

//----------------------------------------------------------------------------
// vector operations

template <class T>
inline std::ostream& operator<<(std::ostream& o, const std::vector<T>& x) {
    o << "[";
    if (not x.empty()) {
        o << x[0];
        for (size_t i = 1; i < x.size(); ++i) {
            o << ", " << x[i];
        }
    }
    return o << "]";
}

//----------------------------------------------------------------------------
// string operations

inline bool is_space(char c) {
    return c == ' ' or c == '\t' or c == '\r' or c == '\n' or c == '\v' or
           c == '\f';
}

// Trims surrounding whitespace and collapses inner runs to a single space.
std::string collapse_whitespace(const std::string& text);

inline std::string trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end and is_space(text[begin])) ++begin;
    while (end > begin and is_space(text[end - 1])) --end;
    return text.substr(begin, end - begin);
}

//----------------------------------------------------------------------------
// file system

std::vector<std::string> read_lines(const std::string& filename);
void in_temp_dir(std::function<void()> body);

}  // namespace trainlog
