#include <cstdio>
#include <cstdint>

#include "log.h"
#include "systick.h"

#include "board.h"

#if defined SYSTICK_TIMEBASE_EXTENDED

// 64 bits: never goes backwards, and gets past what 32 bits could hold
static bool watch() {
    log_printf("extended mode, looking for time > 2**32\n");
    TickCount previous = time_get_ticks();
    while(true) {
        TickCount const time = time_get_ticks();
        if(time < previous) {
            log_printf("went backwards: %016llx -> %016llx\n",
                static_cast<unsigned long long>(previous), static_cast<unsigned long long>(time));
            return false;
        }
        if(time > UINT32_MAX) {
            log_printf("time seen past 2**32\n");
            return true;
        }
        previous = time;
    }
}

#else

static uint64_t const COUNTER_SPAN = uint64_t(1) << 24;

// 32 bits: the only drop allowed is the 2**32 wrap, not the 2**24 the counter itself does
static bool watch() {
    log_printf("standard mode, looking for the wrap at 2**32\n");
    TickCount previous = time_get_ticks();
    uint32_t count = 0;
    while(true) {
        TickCount const time = time_get_ticks();
        if(time < previous) {
            if(previous > 2 * COUNTER_SPAN) {
                log_printf("wrapped in the expected place: %08lx -> %08lx\n",
                    static_cast<unsigned long>(previous), static_cast<unsigned long>(time));
                return true;
            }
            log_printf("unexpected wrap: %08lx -> %08lx\n",
                static_cast<unsigned long>(previous), static_cast<unsigned long>(time));
            return false;
        }
        previous = time;

        if(++count == 1000000) {
            count = 0;
            log_printf("time: %08lx\n", static_cast<unsigned long>(time));
        }
    }
}

#endif

int main(void) {
    board_init();
    board_finish(watch());
}
