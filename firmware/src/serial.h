#ifndef GUARD_RCNJQYBEXAVHKPUO
#define GUARD_RCNJQYBEXAVHKPUO

// console on the usart picked by SYSTICK_TIMEBASE_CONSOLE_USART; stdout and
// stderr both go out blocking
void serial_setup(void);

#endif
