#pragma once
#include <cstdint>
#include <utility>
#include "BackpackPins.hpp"
#include "LcdHardware.hpp"

/**
 * HD44780 control lines over a PCF8574/PCF8574A I2C backpack.
 *
 * Bus is any type providing
 *   int writeByte(uint8_t addr, uint8_t v);
 *   int readByte(uint8_t addr, uint8_t& v);
 * returning 1 (bytes moved) on success; anything else, normally a negative
 * Pico SDK error code, is reported as BusIo with that value.
 *
 * All line setters only touch the in-memory port image. apply() writes it in
 * one I2C transaction; the image is kept, not cleared.
 */
template <typename Bus>
class LcdBackpack : public LcdHardware, public LcdBacklight {
public:
    // addr: 7-bit, 0x20..0x27 (PCF8574) or 0x38..0x3F (PCF8574A)
    LcdBackpack(Bus bus, uint8_t addr, const BackpackPins& pins = BackpackPins())
    : _bus(std::move(bus)), _addr(addr), _pins(pins) {}

    void rs(bool bit) override     { _port = BackpackPins::withBit(_port, _pins.rsPin(), bit); }
    void enable(bool bit) override { _port = BackpackPins::withBit(_port, _pins.enPin(), bit); }
    void data(uint8_t nibble) override { _port = _pins.encodeNibble(_port, nibble); }

    // The expander has 8 lines and all of them are taken, so 8-bit mode is impossible.
    FunctionMode mode() const override { return FunctionMode::Bit4; }

    bool canRead() const override { return _pins.canRead(); }

    BackpackResult rw(bool bit) override {
        if (!_pins.canRead()) return BackpackResult::fail(BackpackError::ReadUnsupported);
        if (bit) {
            // PCF8574 is quasi-bidirectional: a line written high can be
            // pulled low by the LCD, so data lines must be high before reading.
            data(0x0F);
        }
        _port = BackpackPins::withBit(_port, _pins.rwPin(), bit);
        return BackpackResult::success();
    }

    BackpackResult readData(uint8_t& nibble) override {
        if (!_pins.canRead()) return BackpackResult::fail(BackpackError::ReadUnsupported);
        uint8_t raw = 0;
        int r = _bus.readByte(_addr, raw);
        if (r != 1) return BackpackResult::fail(BackpackError::BusIo, r);
        nibble = _pins.decodeNibble(raw);
        return BackpackResult::success();
    }

    BackpackResult apply() override {
        int r = _bus.writeByte(_addr, _port);
        if (r != 1) return BackpackResult::fail(BackpackError::BusIo, r);
        return BackpackResult::success();
    }

    BackpackResult setBacklight(bool on) override {
        _port = BackpackPins::withBit(_port, _pins.backlightPin(), on);
        return apply();
    }

    uint8_t port() const { return _port; }
    uint8_t address() const { return _addr; }
    const BackpackPins& pins() const { return _pins; }
    Bus& bus() { return _bus; }
    const Bus& bus() const { return _bus; }

private:
    Bus _bus;
    const uint8_t _addr;
    const BackpackPins _pins;
    uint8_t _port = 0; // desired level of P0..P7
};
