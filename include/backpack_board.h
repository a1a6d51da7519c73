#ifndef _BACKPACK_BOARD_H
#define _BACKPACK_BOARD_H

#include <cstdint>

// --- I2C bus ---
constexpr unsigned BOARD_I2C_SDA_PIN = 4;        // PICO_DEFAULT_I2C_SDA_PIN
constexpr unsigned BOARD_I2C_SCL_PIN = 5;        // PICO_DEFAULT_I2C_SCL_PIN
constexpr uint32_t BOARD_I2C_BAUD    = 100000;

// --- Backpack ---
// 0x27 = PCF8574T with A2..A0 open, 0x3F for the PCF8574AT variant
constexpr uint8_t BOARD_LCD_ADDR = 0x27;
constexpr uint8_t BOARD_LCD_COLS = 20;
constexpr uint8_t BOARD_LCD_ROWS = 4;

// Port bit for each LCD line. Set BOARD_PIN_RW to -1 when RW is tied to GND.
constexpr int     BOARD_PIN_RW = 1;
constexpr uint8_t BOARD_PIN_RS = 0;
constexpr uint8_t BOARD_PIN_EN = 2;
constexpr uint8_t BOARD_PIN_BL = 3;
constexpr uint8_t BOARD_PIN_D4 = 4;
constexpr uint8_t BOARD_PIN_D5 = 5;
constexpr uint8_t BOARD_PIN_D6 = 6;
constexpr uint8_t BOARD_PIN_D7 = 7;

#endif // _BACKPACK_BOARD_H
