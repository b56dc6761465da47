#ifndef GUARD_PZUFMKWCJTEHDRNA
#define GUARD_PZUFMKWCJTEHDRNA

// clocks, console, timebase; in that order
void board_init();

// prints the verdict and parks the core
void board_finish(bool success);

#endif
