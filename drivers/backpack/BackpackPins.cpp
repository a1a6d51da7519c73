#include "BackpackPins.hpp"
#include <cstdio>

bool BackpackPins::overlaps() const {
    uint8_t seen = 0;
    const uint8_t roles[] = {_rs, _rw, _en, _bl, _d4, _d5, _d6, _d7};
    for (uint8_t pin : roles) {
        if (pin == RW_NONE) continue;
        const uint8_t mask = uint8_t(1u << pin);
        if (seen & mask) return true;
        seen |= mask;
    }
    return false;
}

uint8_t BackpackPins::encodeNibble(uint8_t port, uint8_t nibble) const {
    port = withBit(port, _d4, nibble & 0x01);
    port = withBit(port, _d5, nibble & 0x02);
    port = withBit(port, _d6, nibble & 0x04);
    port = withBit(port, _d7, nibble & 0x08);
    return port;
}

uint8_t BackpackPins::decodeNibble(uint8_t port) const {
    uint8_t nibble = 0;
    if (port & (1u << _d4)) nibble |= 0x01;
    if (port & (1u << _d5)) nibble |= 0x02;
    if (port & (1u << _d6)) nibble |= 0x04;
    if (port & (1u << _d7)) nibble |= 0x08;
    return nibble;
}

int BackpackPins::format(char* buf, size_t len) const {
    char rw[4];
    if (canRead()) std::snprintf(rw, sizeof(rw), "%u", (unsigned)_rw);
    else           std::snprintf(rw, sizeof(rw), "-");
    return std::snprintf(buf, len, "rs=%u rw=%s en=%u bl=%u d4..d7=%u,%u,%u,%u",
                         (unsigned)_rs, rw, (unsigned)_en, (unsigned)_bl,
                         (unsigned)_d4, (unsigned)_d5, (unsigned)_d6, (unsigned)_d7);
}

// --- builder ---

void BackpackPinConfig::assign(uint8_t& field, uint8_t pin) {
    if (pin > BackpackPins::MAX_PIN) {
        if (_error == BackpackError::None) _error = BackpackError::InvalidPin;
        return;
    }
    field = pin;
}

BackpackPinConfig& BackpackPinConfig::rs(uint8_t pin)        { assign(_pins._rs, pin); return *this; }
BackpackPinConfig& BackpackPinConfig::en(uint8_t pin)        { assign(_pins._en, pin); return *this; }
BackpackPinConfig& BackpackPinConfig::d4(uint8_t pin)        { assign(_pins._d4, pin); return *this; }
BackpackPinConfig& BackpackPinConfig::d5(uint8_t pin)        { assign(_pins._d5, pin); return *this; }
BackpackPinConfig& BackpackPinConfig::d6(uint8_t pin)        { assign(_pins._d6, pin); return *this; }
BackpackPinConfig& BackpackPinConfig::d7(uint8_t pin)        { assign(_pins._d7, pin); return *this; }
BackpackPinConfig& BackpackPinConfig::backlight(uint8_t pin) { assign(_pins._bl, pin); return *this; }

BackpackPinConfig& BackpackPinConfig::rw(std::optional<uint8_t> pin) {
    if (!pin) {
        _pins._rw = BackpackPins::RW_NONE;
        return *this;
    }
    assign(_pins._rw, *pin);
    return *this;
}

BackpackResult BackpackPinConfig::build(BackpackPins& out) const {
    if (_error != BackpackError::None) return BackpackResult::fail(_error);
    out = _pins;
    return BackpackResult::success();
}
