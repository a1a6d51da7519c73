#include "pico/stdlib.h"
#include "pico/binary_info.h"
#include <cstdio>

#include "backpack_board.h"
#include "BackpackPins.hpp"
#include "LcdBackpack.hpp"
#include "PicoI2cBus.hpp"
#include "Hd44780.hpp"

bi_decl(bi_2pins_with_func(BOARD_I2C_SDA_PIN, BOARD_I2C_SCL_PIN, GPIO_FUNC_I2C));

static void logFailure(const char* what, const BackpackResult& r)
{
    printf("%s failed: %s (bus=%d)\r\n", what, backpackErrorName(r.error), r.busCode);
}

static bool buildPins(BackpackPins& pins)
{
    BackpackPinConfig cfg;
    cfg.rs(BOARD_PIN_RS)
        .en(BOARD_PIN_EN)
        .backlight(BOARD_PIN_BL)
        .d4(BOARD_PIN_D4)
        .d5(BOARD_PIN_D5)
        .d6(BOARD_PIN_D6)
        .d7(BOARD_PIN_D7);
    if (BOARD_PIN_RW < 0)
        cfg.rw(std::nullopt);
    else
        cfg.rw(static_cast<uint8_t>(BOARD_PIN_RW));

    BackpackResult r = cfg.build(pins);
    if (!r)
    {
        logFailure("pin config", r);
        return false;
    }

    char line[64];
    pins.format(line, sizeof(line));
    printf("Backpack pins: %s\r\n", line);
    if (pins.overlaps())
        printf("WARNING: two LCD lines share one expander bit\r\n");
    return true;
}

int main()
{
    stdio_init_all();

    while (!stdio_usb_connected())
    {
        sleep_ms(500);
    }

    printf("Serial connected. Ready.\r\n");

    BackpackPins pins;
    if (!buildPins(pins))
    {
        // Keep the message visible on the console; nothing else to drive.
        while (true)
            sleep_ms(1000);
    }

    LcdBackpack<PicoI2cBus> backpack(PicoI2cBus(i2c0), BOARD_LCD_ADDR, pins);
    uint baud = backpack.bus().init(BOARD_I2C_SDA_PIN, BOARD_I2C_SCL_PIN, BOARD_I2C_BAUD);
    printf("I2C0 at %u Hz, LCD at 0x%02X\r\n", baud, (unsigned)BOARD_LCD_ADDR);

    Hd44780 lcd(backpack, backpack, {sleep_ms, sleep_us}, BOARD_LCD_COLS, BOARD_LCD_ROWS);

    BackpackResult r = lcd.init();
    while (!r)
    {
        // Usually a missing/unpowered backpack (NACK). Retry slowly.
        logFailure("lcd init", r);
        sleep_ms(1000);
        r = lcd.init();
    }

    if (!(r = lcd.backlight(true)))
        logFailure("backlight", r);

    r = lcd.setCursor(0, 0);
    if (r)
        r = lcd.print("LCD backpack demo");
    if (r)
        r = lcd.setCursor(1, 0);
    if (r)
        r = lcd.print(backpack.canRead() ? "busy flag: on" : "busy flag: off");
    if (!r)
        logFailure("greeting", r);

    uint32_t count = 0;
    bool bl = true;
    while (true)
    {
        char line[21]; // 20 cols + null
        std::snprintf(line, sizeof(line), "count: %lu", (unsigned long)count);

        r = lcd.setCursor(3, 0);
        if (r)
            r = lcd.print(line);
        if (!r)
            logFailure("update", r);

        // Blink the backlight every 10 s
        if (count % 10 == 9)
        {
            bl = !bl;
            if (!(r = backpack.setBacklight(bl)))
                logFailure("backlight", r);
            printf("Backlight %s, port=0x%02X\r\n", bl ? "on" : "off", (unsigned)backpack.port());
        }

        ++count;
        sleep_ms(1000);
    }
}
