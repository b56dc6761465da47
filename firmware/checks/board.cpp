#include <cstdio>

#include <libopencm3/stm32/rcc.h>
#include <libopencm3/cm3/cortex.h>

#include "serial.h"
#include "systick.h"

#include "board.h"

static void clock_setup(void) {
    rcc_clock_setup_in_hse_8mhz_out_72mhz();
}

void board_init() {
    clock_setup();
    serial_setup();
    time_init();
}

void board_finish(bool success) {
    printf(success ? "PASS\n" : "FAIL\n");
    while(true) { }
}

extern "C" {

void _exit(int status) {
    // called on assertion failure, after assert's message went out on stderr.
    // might be inside the systick handler, so don't depend on interrupts
    cm_disable_interrupts();
    fprintf(stderr, "exit %d\n", status);
    while(true) { }
}

void * __dso_handle = nullptr;

}
