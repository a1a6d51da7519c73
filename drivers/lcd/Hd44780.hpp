#pragma once
#include <cstdint>
#include <string_view>
#include "LcdHardware.hpp"

// Blocking delays, e.g. {sleep_ms, sleep_us} from pico/stdlib.h.
struct LcdDelay {
    void (*ms)(uint32_t ms);
    void (*us)(uint64_t us);
};

/**
 * Minimal 4-bit HD44780 driver on top of LcdHardware (e.g. LcdBackpack).
 * Uses the busy flag when the hardware can read, fixed delays otherwise.
 * Every call returns the first bus failure it hits.
 */
class Hd44780 {
public:
    // rows is clamped to 1..4, cols to at least 1.
    Hd44780(LcdHardware& hw, LcdBacklight& bl, LcdDelay delay,
            uint8_t cols = 16, uint8_t rows = 2);

    // Power-on init sequence. Call once, >40 ms after Vcc is up.
    BackpackResult init();

    // Basic API
    BackpackResult clear();
    BackpackResult home();
    BackpackResult setCursor(uint8_t line, uint8_t col);
    BackpackResult writeChar(char c);
    BackpackResult print(const char* s);
    BackpackResult print(std::string_view s);

    // Display controls
    BackpackResult displayOn(bool on);
    BackpackResult cursor(bool on);
    BackpackResult blink(bool on);
    BackpackResult backlight(bool on);

    static constexpr uint8_t MAX_ROWS = 4;
    static constexpr int     BUSY_POLL_LIMIT = 100;

private:
    BackpackResult sendCmd(uint8_t cmd);
    BackpackResult sendData(uint8_t data);
    BackpackResult send(uint8_t v, bool rs);
    BackpackResult writeNibble(uint8_t nibble);
    BackpackResult pulseEnable();
    BackpackResult waitReady();
    BackpackResult readBusy(bool& busy);
    BackpackResult setDisplayFlag(uint8_t flag, bool on);

private:
    LcdHardware& _hw;
    LcdBacklight& _bl;
    LcdDelay _delay;
    uint8_t _cols, _rows;

    // Commands / flags
    static constexpr uint8_t LCD_CLEARDISPLAY   = 0x01;
    static constexpr uint8_t LCD_RETURNHOME     = 0x02;
    static constexpr uint8_t LCD_ENTRYMODESET   = 0x04;
    static constexpr uint8_t LCD_DISPLAYCONTROL = 0x08;
    static constexpr uint8_t LCD_FUNCTIONSET    = 0x20;
    static constexpr uint8_t LCD_SETDDRAMADDR   = 0x80;

    // Entry mode
    static constexpr uint8_t LCD_ENTRYLEFT = 0x02;

    // Display control
    static constexpr uint8_t LCD_DISPLAYON = 0x04;
    static constexpr uint8_t LCD_CURSORON  = 0x02;
    static constexpr uint8_t LCD_BLINKON   = 0x01;

    // Function set
    static constexpr uint8_t LCD_2LINE = 0x08;

    static constexpr uint8_t BUSY_FLAG = 0x08;   // D7 of the high nibble

    uint8_t _displayCtl = LCD_DISPLAYON; // display on, cursor/blink off
    uint8_t _entryMode  = LCD_ENTRYLEFT; // increment, no shift
};
