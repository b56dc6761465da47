#ifndef GUARD_GYEVDNBXWMQFTSLC
#define GUARD_GYEVDNBXWMQFTSLC

#include <cstdio>

#include "systick.h"

// printf with the uptime in front, e.g. "1234 us: hello"
template<typename... Args>
int log_printf(char const * format, Args... args) {
    printf("%llu us: ", static_cast<unsigned long long>(time_get_micros()));
    return printf(format, args...);
}

#endif
