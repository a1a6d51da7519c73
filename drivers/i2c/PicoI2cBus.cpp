#include "PicoI2cBus.hpp"

uint PicoI2cBus::init(uint sda_gpio, uint scl_gpio, uint32_t baud) {
    uint actual = i2c_init(_i2c, baud);
    gpio_set_function(sda_gpio, GPIO_FUNC_I2C);
    gpio_set_function(scl_gpio, GPIO_FUNC_I2C);
    gpio_pull_up(sda_gpio);
    gpio_pull_up(scl_gpio);
    return actual;
}

int PicoI2cBus::writeByte(uint8_t addr, uint8_t v) {
    int n = i2c_write_blocking(_i2c, addr, &v, 1, false);
    if (n == 0) return PICO_ERROR_GENERIC; // short transfer
    return n;
}

int PicoI2cBus::readByte(uint8_t addr, uint8_t& v) {
    uint8_t buf = 0;
    int n = i2c_read_blocking(_i2c, addr, &buf, 1, false);
    if (n == 0) return PICO_ERROR_GENERIC;
    if (n == 1) v = buf;
    return n;
}
