#ifndef GUARD_LXKDZPQHMSOTYWIB
#define GUARD_LXKDZPQHMSOTYWIB

// build-time settings, normally passed as -D flags by the build

// SYSTICK_TIMEBASE_EXTENDED: 64 bit tick count instead of 32 bit

#ifndef SYSTICK_TIMEBASE_FREQUENCY
#define SYSTICK_TIMEBASE_FREQUENCY 72000000 // AHB after rcc_clock_setup_in_hse_8mhz_out_72mhz()
#endif

// SYSTICK_TIMEBASE_CLKSOURCE_AHB_DIV8: count AHB/8 instead of AHB.
// SYSTICK_TIMEBASE_FREQUENCY has to be set to match.

#ifndef SYSTICK_TIMEBASE_CONSOLE_USART
#define SYSTICK_TIMEBASE_CONSOLE_USART 1
#endif

#endif
