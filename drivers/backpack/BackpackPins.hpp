#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include "BackpackError.hpp"

class BackpackPinConfig;

/**
 * Immutable mapping of the eight LCD roles onto PCF8574 port bits P0..P7.
 * Only BackpackPinConfig::build() produces a non-default table.
 *
 * Default = the common "YwRobot" style backpack:
 *   P0=RS, P1=RW, P2=EN, P3=Backlight, P4..P7=D4..D7
 */
class BackpackPins {
public:
    static constexpr uint8_t MAX_PIN = 7;
    static constexpr uint8_t RW_NONE = 0xFF;

    BackpackPins() = default;

    uint8_t rsPin() const        { return _rs; }
    uint8_t rwPin() const        { return _rw; }
    uint8_t enPin() const        { return _en; }
    uint8_t d4Pin() const        { return _d4; }
    uint8_t d5Pin() const        { return _d5; }
    uint8_t d6Pin() const        { return _d6; }
    uint8_t d7Pin() const        { return _d7; }
    uint8_t backlightPin() const { return _bl; }

    bool canRead() const { return _rw != RW_NONE; }

    // True when two roles share one port bit. Such a table is accepted as-is;
    // writing one of the aliased roles overwrites the other.
    bool overlaps() const;

    // Set or clear one port bit.
    static inline uint8_t withBit(uint8_t port, uint8_t pin, bool level) {
        return level ? uint8_t(port | (1u << pin)) : uint8_t(port & ~(1u << pin));
    }

    // Place nibble bits 0..3 on D4..D7 of `port`, other bits untouched.
    uint8_t encodeNibble(uint8_t port, uint8_t nibble) const;
    // Inverse of encodeNibble: pull D4..D7 out of a byte read from the port.
    uint8_t decodeNibble(uint8_t port) const;

    // "rs=0 rw=1 en=2 bl=3 d4..d7=4,5,6,7" (rw=- when unassigned).
    // Returns snprintf's result.
    int format(char* buf, size_t len) const;

private:
    friend class BackpackPinConfig;

    uint8_t _rs = 0;
    uint8_t _rw = 1;
    uint8_t _en = 2;
    uint8_t _bl = 3;
    uint8_t _d4 = 4;
    uint8_t _d5 = 5;
    uint8_t _d6 = 6;
    uint8_t _d7 = 7;
};

/**
 * Chained builder for BackpackPins. Starts from the default layout.
 *
 *   BackpackPins pins;
 *   auto r = BackpackPinConfig().rw(std::nullopt).backlight(7).d7(3).build(pins);
 *
 * A setter given a pin above 7 keeps the previous value and records
 * BackpackError::InvalidPin; the first error sticks and build() returns it.
 */
class BackpackPinConfig {
public:
    BackpackPinConfig() = default;

    BackpackPinConfig& rs(uint8_t pin);
    // std::nullopt disables reading from the LCD.
    BackpackPinConfig& rw(std::optional<uint8_t> pin);
    BackpackPinConfig& en(uint8_t pin);
    BackpackPinConfig& d4(uint8_t pin);
    BackpackPinConfig& d5(uint8_t pin);
    BackpackPinConfig& d6(uint8_t pin);
    BackpackPinConfig& d7(uint8_t pin);
    BackpackPinConfig& backlight(uint8_t pin);

    BackpackError error() const { return _error; }
    bool ok() const { return _error == BackpackError::None; }

    // Copies the table into `out` only when every setter succeeded.
    BackpackResult build(BackpackPins& out) const;

private:
    void assign(uint8_t& field, uint8_t pin);

    BackpackPins _pins;
    BackpackError _error = BackpackError::None;
};
