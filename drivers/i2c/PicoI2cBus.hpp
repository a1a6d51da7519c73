#pragma once
#include <cstdint>
#include "pico/stdlib.h"
#include "hardware/i2c.h"

/**
 * Single-byte I2C transport on an RP2040 I2C block, as used by LcdBackpack.
 * Returns 1 on success or a PICO_ERROR_* code.
 */
class PicoI2cBus {
public:
    explicit PicoI2cBus(i2c_inst_t* i2c) : _i2c(i2c) {}

    // Set up the block and pins. Default Pico I2C0 pins are SDA=4, SCL=5.
    // Returns the baud rate actually set.
    uint init(uint sda_gpio, uint scl_gpio, uint32_t baud = 100000);

    int writeByte(uint8_t addr, uint8_t v);
    int readByte(uint8_t addr, uint8_t& v);

    i2c_inst_t* instance() const { return _i2c; }

private:
    i2c_inst_t* _i2c;
};
