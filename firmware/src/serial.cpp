#include <unistd.h>
#include <errno.h>

#include <libopencm3/stm32/usart.h>
#include <libopencm3/stm32/rcc.h>
#include <libopencm3/stm32/gpio.h>

#include "config.h"
#include "misc.h"

#include "serial.h"

#if SYSTICK_TIMEBASE_CONSOLE_USART == 1
    #define USART_NUM 1
    #define TX_GPIO_PORT GPIOA
    #define TX_GPIO_PIN GPIO9
    #define RX_GPIO_PORT GPIOA
    #define RX_GPIO_PIN GPIO10
    #define GPIO_RCC RCC_GPIOA
#elif SYSTICK_TIMEBASE_CONSOLE_USART == 2
    #define USART_NUM 2
    #define TX_GPIO_PORT GPIOA
    #define TX_GPIO_PIN GPIO2
    #define RX_GPIO_PORT GPIOA
    #define RX_GPIO_PIN GPIO3
    #define GPIO_RCC RCC_GPIOA
#elif SYSTICK_TIMEBASE_CONSOLE_USART == 3
    #define USART_NUM 3
    #define TX_GPIO_PORT GPIOB
    #define TX_GPIO_PIN GPIO10
    #define RX_GPIO_PORT GPIOB
    #define RX_GPIO_PIN GPIO11
    #define GPIO_RCC RCC_GPIOB
#else
    #error
#endif

void serial_setup(void) {
    rcc_periph_clock_enable(GPIO_RCC);
    rcc_periph_reset_pulse(CAT2(RST_USART,USART_NUM)); rcc_periph_clock_enable(CAT2(RCC_USART,USART_NUM));

    /* Setup GPIO pins */
    gpio_set_mode(TX_GPIO_PORT, GPIO_MODE_OUTPUT_50_MHZ, GPIO_CNF_OUTPUT_ALTFN_PUSHPULL, TX_GPIO_PIN);
    gpio_set_mode(RX_GPIO_PORT, GPIO_MODE_INPUT        , GPIO_CNF_INPUT_FLOAT          , RX_GPIO_PIN);

    /* Setup UART parameters. */
    usart_set_baudrate(CAT2(USART,USART_NUM), 115200);
    usart_set_databits(CAT2(USART,USART_NUM), 8);
    usart_set_stopbits(CAT2(USART,USART_NUM), USART_STOPBITS_1);
    usart_set_mode(CAT2(USART,USART_NUM), USART_MODE_TX);
    usart_set_parity(CAT2(USART,USART_NUM), USART_PARITY_NONE);
    usart_set_flow_control(CAT2(USART,USART_NUM), USART_FLOWCONTROL_NONE);

    usart_enable(CAT2(USART,USART_NUM));
}

extern "C" {

// no interrupts involved, so stderr (and assert) still works from inside a
// handler or with interrupts masked
int _write(int file, char *ptr, int len) {
    if(file == STDOUT_FILENO || file == STDERR_FILENO) {
        for(int i = 0; i < len; i++) {
            if(ptr[i] == '\n') {
                usart_send_blocking(CAT2(USART,USART_NUM), '\r');
            }
            usart_send_blocking(CAT2(USART,USART_NUM), ptr[i]);
        }
        return len;
    } else {
        errno = EIO;
        return -1;
    }
}

}
