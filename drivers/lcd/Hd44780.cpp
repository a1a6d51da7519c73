#include "Hd44780.hpp"
#include <cstdio>
#include <initializer_list>

Hd44780::Hd44780(LcdHardware& hw, LcdBacklight& bl, LcdDelay delay, uint8_t cols, uint8_t rows)
: _hw(hw), _bl(bl), _delay(delay),
  _cols(cols == 0 ? 1 : cols),
  _rows(rows == 0 ? 1 : (rows > MAX_ROWS ? MAX_ROWS : rows)) {}

BackpackResult Hd44780::init() {
    BackpackResult r;

    // Power-up wait
    _delay.ms(50);

    _hw.rs(false);
    _hw.enable(false);
    if (_hw.canRead()) {
        r = _hw.rw(false);
        if (!r) return r;
    }
    _hw.data(0);
    r = _hw.apply();
    if (!r) return r;

    // 8-bit "function set" three times, then switch to 4-bit.
    // The busy flag is not valid yet, so timing here is fixed.
    r = writeNibble(0x03);
    if (!r) return r;
    _delay.ms(5);
    for (uint8_t nibble : {0x03, 0x03, 0x02}) {
        r = writeNibble(nibble);
        if (!r) return r;
        _delay.us(150);
    }

    // Function set: 4-bit, 2-line (5x8 font)
    r = sendCmd(LCD_FUNCTIONSET | (_rows > 1 ? LCD_2LINE : 0));
    if (!r) return r;

    // Display off
    _displayCtl = 0;
    r = sendCmd(LCD_DISPLAYCONTROL | _displayCtl);
    if (!r) return r;

    r = clear();
    if (!r) return r;

    _entryMode = LCD_ENTRYLEFT;
    r = sendCmd(LCD_ENTRYMODESET | _entryMode);
    if (!r) return r;

    _displayCtl = LCD_DISPLAYON;
    return sendCmd(LCD_DISPLAYCONTROL | _displayCtl);
}

BackpackResult Hd44780::clear() {
    BackpackResult r = sendCmd(LCD_CLEARDISPLAY);
    if (r && !_hw.canRead()) _delay.ms(2);
    return r;
}

BackpackResult Hd44780::home() {
    BackpackResult r = sendCmd(LCD_RETURNHOME);
    if (r && !_hw.canRead()) _delay.ms(2);
    return r;
}

BackpackResult Hd44780::setCursor(uint8_t line, uint8_t col) {
    // 20x4 row addressing
    static const uint8_t row_offsets[MAX_ROWS] = {0x00, 0x40, 0x14, 0x54};
    if (line >= _rows) line = _rows - 1;
    if (col >= _cols) col = _cols - 1;
    return sendCmd(LCD_SETDDRAMADDR | (row_offsets[line] + col));
}

BackpackResult Hd44780::writeChar(char c) { return sendData((uint8_t)c); }

BackpackResult Hd44780::print(const char* s) {
    if (!s) return BackpackResult::success();
    return print(std::string_view(s));
}

BackpackResult Hd44780::print(std::string_view s) {
    for (char c : s) {
        BackpackResult r = writeChar(c);
        if (!r) return r;
    }
    return BackpackResult::success();
}

BackpackResult Hd44780::displayOn(bool on) { return setDisplayFlag(LCD_DISPLAYON, on); }
BackpackResult Hd44780::cursor(bool on)    { return setDisplayFlag(LCD_CURSORON, on); }
BackpackResult Hd44780::blink(bool on)     { return setDisplayFlag(LCD_BLINKON, on); }

BackpackResult Hd44780::backlight(bool on) { return _bl.setBacklight(on); }

BackpackResult Hd44780::setDisplayFlag(uint8_t flag, bool on) {
    if (on) _displayCtl |=  flag;
    else    _displayCtl &= ~flag;
    return sendCmd(LCD_DISPLAYCONTROL | _displayCtl);
}

// --- transfers ---

BackpackResult Hd44780::sendCmd(uint8_t v)  { return send(v, false); }
BackpackResult Hd44780::sendData(uint8_t v) { return send(v, true); }

BackpackResult Hd44780::send(uint8_t v, bool rs) {
    BackpackResult r = waitReady();
    if (!r) return r;

    _hw.rs(rs);
    if (_hw.canRead()) {
        r = _hw.rw(false);
        if (!r) return r;
    }

    // high then low nibble
    r = writeNibble(v >> 4);
    if (!r) return r;
    r = writeNibble(v & 0x0F);
    if (!r) return r;

    if (!_hw.canRead()) _delay.us(50);
    return r;
}

BackpackResult Hd44780::writeNibble(uint8_t nibble) {
    _hw.data(nibble);
    BackpackResult r = _hw.apply();
    if (!r) return r;
    return pulseEnable();
}

BackpackResult Hd44780::pulseEnable() {
    _hw.enable(true);
    BackpackResult r = _hw.apply();
    if (!r) return r;
    _delay.us(1);
    _hw.enable(false);
    return _hw.apply();
}

BackpackResult Hd44780::waitReady() {
    if (!_hw.canRead()) return BackpackResult::success();
    for (int i = 0; i < BUSY_POLL_LIMIT; ++i) {
        bool busy = true;
        BackpackResult r = readBusy(busy);
        if (!r) return r;
        if (!busy) return r;
        _delay.us(10);
    }
    // Stuck busy flag: usually RW not really wired. Fall back to a long delay.
    printf("hd44780: busy flag stuck, continuing\r\n");
    _delay.ms(2);
    return BackpackResult::success();
}

BackpackResult Hd44780::readBusy(bool& busy) {
    uint8_t high = 0, low = 0;
    _hw.rs(false);
    BackpackResult r = _hw.rw(true);
    if (!r) return r;
    r = _hw.apply();
    if (!r) return r;

    // Both nibbles are clocked out; the low one is the address counter.
    uint8_t* nibbles[] = {&high, &low};
    for (uint8_t* n : nibbles) {
        _hw.enable(true);
        r = _hw.apply();
        if (!r) return r;
        r = _hw.readData(*n);
        if (!r) return r;
        _hw.enable(false);
        r = _hw.apply();
        if (!r) return r;
    }

    r = _hw.rw(false);
    if (!r) return r;
    r = _hw.apply();
    if (!r) return r;

    busy = (high & BUSY_FLAG) != 0;
    return r;
}
