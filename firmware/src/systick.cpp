#include <libopencm3/stm32/rcc.h>
#include <libopencm3/cm3/systick.h>
#include <libopencm3/cm3/cortex.h>

#include "misc.h"

#include "systick.h"

static SysTickCounter counter;
static SysTickRollovers rollovers;
static SysTickTimebase * timebase = nullptr;

uint32_t SysTickCounter::remaining() const {
    return systick_get_value();
}

void SysTickCounter::start() {
    { CriticalSection cs;
        systick_counter_disable();
        #if defined SYSTICK_TIMEBASE_CLKSOURCE_AHB_DIV8
            systick_set_clocksource(STK_CSR_CLKSOURCE_AHB_DIV8);
        #else
            systick_set_clocksource(STK_CSR_CLKSOURCE_AHB);
        #endif
        systick_clear();
        systick_set_reload(RELOAD);
        systick_interrupt_enable();
        systick_counter_enable();
        // the cleared value reads as the end of a period until the first
        // count loads RELOAD
        while(systick_get_value() == 0);
    }
}

static uint32_t systick_clock() {
    #if defined SYSTICK_TIMEBASE_CLKSOURCE_AHB_DIV8
        return rcc_ahb_frequency / 8;
    #else
        return rcc_ahb_frequency;
    #endif
}

SysTickTimebase & time_init() {
    assert(!timebase);
    static SysTickTimebase instance(counter, rollovers, systick_clock());
    timebase = &instance;
    return instance;
}

SysTickTimebase const & time_get_timebase() {
    assert(timebase);
    return *timebase;
}

extern "C" {

void sys_tick_handler(void) {
    rollovers.on_wrap();
}

}
