#include "awsid/Copyright.hpp"
#pragma once

#include "awsid/time/Time.hpp"
#include "awsid/pattern/GuardedSingleton.hpp"
#include  <ostream>
#include  <mutex>

#define AWSID_LOG_D(...)   if (awsid::app::SyncLogger::initialized()) awsid::app::SyncLogger::instance().LOG_D(awsid::time::SysTime::now(), awsid::app::g_SyncLogLevelStr[0], __VA_ARGS__, awsid::app::LogTrailer(__FILE__, __LINE__))
#define AWSID_LOG_N(...)   if (awsid::app::SyncLogger::initialized()) awsid::app::SyncLogger::instance().LOG_N(awsid::time::SysTime::now(), awsid::app::g_SyncLogLevelStr[2], __VA_ARGS__, awsid::app::LogTrailer(__FILE__, __LINE__))
#define AWSID_LOG_W(...)   if (awsid::app::SyncLogger::initialized()) awsid::app::SyncLogger::instance().LOG_W(awsid::time::SysTime::now(), awsid::app::g_SyncLogLevelStr[3], __VA_ARGS__, awsid::app::LogTrailer(__FILE__, __LINE__))
#define AWSID_LOG_C(...)   if (awsid::app::SyncLogger::initialized()) awsid::app::SyncLogger::instance().LOG_C(awsid::time::SysTime::now(), awsid::app::g_SyncLogLevelStr[4], __VA_ARGS__, awsid::app::LogTrailer(__FILE__, __LINE__))
#define AWSID_LOG_d(...)   if (awsid::app::SyncLogger::initialized()) awsid::app::SyncLogger::instance().LOG_D(awsid::time::SysTime::now(), awsid::app::g_SyncLogLevelStr[0], __VA_ARGS__, '\n')
#define AWSID_LOG_n(...)   if (awsid::app::SyncLogger::initialized()) awsid::app::SyncLogger::instance().LOG_N(awsid::time::SysTime::now(), awsid::app::g_SyncLogLevelStr[2], __VA_ARGS__, '\n')
#define AWSID_LOG_w(...)   if (awsid::app::SyncLogger::initialized()) awsid::app::SyncLogger::instance().LOG_W(awsid::time::SysTime::now(), awsid::app::g_SyncLogLevelStr[3], __VA_ARGS__, '\n')
#define AWSID_LOG_c(...)   if (awsid::app::SyncLogger::initialized()) awsid::app::SyncLogger::instance().LOG_C(awsid::time::SysTime::now(), awsid::app::g_SyncLogLevelStr[4], __VA_ARGS__, '\n')

namespace awsid { namespace app {

char const g_SyncLogLevelStr[][12 + 1] = {
    " DEBUG   :  ",
    " RDEBUG  :  ",
    " NOTICE  :  ",
    " WARNING :  ",
    " CRITICAL:  "
};

struct LogTrailer {
    LogTrailer(char const* const file,  int line)
    : f(file)
    , l(line) {
    }
    char const* const f;
    int l;

    friend std::ostream& operator << (std::ostream& os, LogTrailer const& t) {
        os << ' ' << t.f << ':' << t.l << std::endl;
        return os;
    }
};

/**
 * @brief a very straightforward logger that works synchronously.
 * @details Only use the macros defined above. The id library itself never logs,
 * this is for the programs built on it
 */
struct SyncLogger
: pattern::GuardedSingleton<SyncLogger> {
    friend struct pattern::SingletonGuardian<SyncLogger>;

    enum Level {
        L_DEBUG = 0,
        L_RDEBUG,
        L_NOTICE,
        L_WARNING,
        L_CRITICAL,
        L_OFF
    };

    void setMinLogLevel(Level minLevel) {
        minLevel_ = minLevel;
    }

    Level minLogLevel() const {
        return minLevel_;
    }

    template <typename ...Args>
    void LOG_D(Args&&... args) {
#ifndef NDEBUG
        if (minLevel_ <= L_DEBUG) {
            std::lock_guard<std::recursive_mutex> g(mutex_);
            log(std::forward<Args>(args)...);
        }
#endif
    }

    template <typename ...Args>
    void LOG_N(Args&&... args) {
        if (minLevel_ <= L_NOTICE) {
            std::lock_guard<std::recursive_mutex> g(mutex_);
            log(std::forward<Args>(args)...);
        }
    }
    template <typename ...Args>
    void LOG_W(Args&&... args) {
        if (minLevel_ <= L_WARNING) {
            std::lock_guard<std::recursive_mutex> g(mutex_);
            log(std::forward<Args>(args)...);
        }
    }
    template <typename ...Args>
    void LOG_C(Args&&... args) {
        if (minLevel_ <= L_CRITICAL) {
            std::lock_guard<std::recursive_mutex> g(mutex_);
            log(std::forward<Args>(args)...);
        }
    }

private:
    template <typename Arg, typename ...Args>
    void log(Arg&& arg, Args&&... args) {
        log_ << std::forward<Arg>(arg);
        log(std::forward<Args>(args)...);
    }
    void log() {
    }
    template <typename ... NoOpArgs>
    SyncLogger(std::ostream& log, NoOpArgs&&...)
    : log_(log)
#ifndef NDEBUG
    , minLevel_(L_DEBUG)
#else
    , minLevel_(L_NOTICE)
#endif
    {}
    std::ostream& log_;
    Level minLevel_;
    std::recursive_mutex mutex_;
};
}}
