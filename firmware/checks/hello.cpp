#include "log.h"

#include "board.h"

int main(void) {
    board_init();

    for(int i = 0; i < 100; i++) {
        log_printf("Hello, world! %d\n", i);
    }

    board_finish(true);
}
