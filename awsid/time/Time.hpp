#include "awsid/Copyright.hpp"
#pragma once

#include <ostream>
#include <stdio.h>
#include <stdint.h>
#include <time.h>

namespace awsid { namespace time {
/**
 * @brief wall clock time point in nanoseconds since the epoch, used to stamp log lines
 */
struct SysTime
{
    static SysTime now() {
        struct timespec spec;
        clock_gettime(CLOCK_REALTIME, &spec);
        return SysTime(spec.tv_sec * 1000000000ll + spec.tv_nsec);
    }

private:
    explicit SysTime(int64_t nsec) : nsecSinceEpoch_(nsec)
    {}

    int64_t nsecSinceEpoch_;
    friend std::ostream& operator << (std::ostream& os, SysTime const& t);
};

/// local time as YYYYMMDDhhmmss.nnnnnnnnn
inline
std::ostream& operator << (std::ostream& os, SysTime const& t) {
    char buf[32];
    char buf2[16];
    tm ts;
    time_t sec = (time_t)(t.nsecSinceEpoch_ / 1000000000ll);
    localtime_r(&sec, &ts);
    strftime(buf, sizeof(buf), "%Y%m%d%H%M%S.", &ts);
    snprintf(buf2, sizeof(buf2), "%09lld", (long long)(t.nsecSinceEpoch_ % 1000000000ll));
    os << buf << buf2;
    return os;
}
}}
