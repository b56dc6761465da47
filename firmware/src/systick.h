#ifndef GUARD_TSICRJECPMABLADL
#define GUARD_TSICRJECPMABLADL

#include <atomic>
#include <cmath>
#include <cstdint>

#include "config.h"
#include "misc.h"
#include "rollover.h"
#include "timebase.h"

class SysTickCounter {
public:
    static uint32_t const RELOAD = 0xffffff;

    uint32_t remaining() const;
    uint32_t reload() const {
        return RELOAD;
    }
    void start();
};

#if defined SYSTICK_TIMEBASE_EXTENDED
typedef uint64_t TickCount;
#else
typedef uint32_t TickCount;
#endif

// cortex-m can't load 64 bits atomically and armv6-m has no ldrex/strex,
// so those fall back to masking interrupts around each access
#if defined SYSTICK_TIMEBASE_EXTENDED
    #if ATOMIC_LLONG_LOCK_FREE == 2
        typedef AtomicCell<TickCount> RolloverCell;
    #else
        typedef GuardedCell<TickCount, CriticalSection> RolloverCell;
    #endif
#else
    #if ATOMIC_INT_LOCK_FREE == 2
        typedef AtomicCell<TickCount> RolloverCell;
    #else
        typedef GuardedCell<TickCount, CriticalSection> RolloverCell;
    #endif
#endif

typedef RolloverTracker<TickCount, RolloverCell> SysTickRollovers;
typedef Timebase<SysTickCounter, SysTickRollovers, SYSTICK_TIMEBASE_FREQUENCY> SysTickTimebase;

// call once, after the clock tree is set up
SysTickTimebase & time_init();

SysTickTimebase const & time_get_timebase();

inline TickCount time_get_ticks() {
    return time_get_timebase().now();
}

inline constexpr uint32_t time_get_ticks_per_second() {
    return SysTickTimebase::ticks_per_second();
}

inline uint64_t time_get_micros() {
    return time_get_timebase().now_as<std::chrono::duration<uint64_t, std::micro>>().count();
}

inline void busy_delay(double dt) {
    time_get_timebase().delay_ticks(static_cast<uint64_t>(std::ceil(dt * time_get_ticks_per_second())));
}

#endif
