#include <cstdio>

#include "log.h"
#include "systick.h"

#include "board.h"

// a delay may run long (interrupts, the final partial read) but never short
static bool check(char const * name, TickCount start, TickCount requested) {
    TickCount const took = time_get_timebase().elapsed_since(start);
    log_printf("%s: %lu ticks requested, %lu ticks elapsed\n", name,
        static_cast<unsigned long>(requested), static_cast<unsigned long>(took));
    return took >= requested;
}

int main(void) {
    board_init();
    SysTickTimebase const & tb = time_get_timebase();

    bool ok = true;

    TickCount start = tb.now();
    tb.delay_us(250);
    ok = check("250us delay", start, time_get_ticks_per_second() / 4000) && ok;

    start = tb.now();
    tb.delay_ms(250);
    ok = check("250ms delay", start, time_get_ticks_per_second() / 4) && ok;

    start = tb.now();
    tb.delay(SysTickTimebase::Duration(SysTickCounter::RELOAD + 1));
    ok = check("one period delay", start, SysTickCounter::RELOAD + 1) && ok;

    start = tb.now();
    busy_delay(0.01);
    ok = check("10ms busy_delay", start, time_get_ticks_per_second() / 100) && ok;

    board_finish(ok);
}
