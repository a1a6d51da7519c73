#pragma once
#include <cstdint>
#include "BackpackError.hpp"

enum class FunctionMode : uint8_t { Bit4, Bit8 };

/**
 * Control-line view of an HD44780 the controller driver talks to.
 * Line setters only stage levels; apply() pushes them to the hardware.
 */
class LcdHardware {
public:
    virtual ~LcdHardware() = default;

    virtual void rs(bool bit) = 0;
    virtual void enable(bool bit) = 0;
    // 4-bit mode: bits 0..3 go to D4..D7
    virtual void data(uint8_t nibble) = 0;

    virtual FunctionMode mode() const = 0;

    virtual bool canRead() const = 0;
    virtual BackpackResult rw(bool bit) = 0;
    virtual BackpackResult readData(uint8_t& nibble) = 0;

    virtual BackpackResult apply() = 0;
};

class LcdBacklight {
public:
    virtual ~LcdBacklight() = default;
    // Takes effect immediately, not on the next apply().
    virtual BackpackResult setBacklight(bool on) = 0;
};
