#pragma once
#include <sys/resource.h>
#include <sys/time.h>

// wall clock in seconds
inline double realtime() {
    struct timeval tp;
    gettimeofday(&tp, nullptr);
    return tp.tv_sec + tp.tv_usec * 1e-6;
}

// user + system CPU seconds of this process
inline double cputime() {
    struct rusage r;
    getrusage(RUSAGE_SELF, &r);
    return r.ru_utime.tv_sec + r.ru_stime.tv_sec + 1e-6 * (r.ru_utime.tv_usec + r.ru_stime.tv_usec);
}

// peak resident set size in bytes (ru_maxrss is KB on Linux)
inline long peakrss() {
    struct rusage r;
    getrusage(RUSAGE_SELF, &r);
    return r.ru_maxrss * 1024L;
}
