#pragma once
#include <cstdint>

enum class BackpackError : uint8_t {
    None = 0,
    InvalidPin,       // pin role assigned outside 0..7
    ReadUnsupported,  // RW line not wired to the expander
    BusIo,            // I2C transfer failed, see BackpackResult::busCode
};

// Outcome of an adapter call. busCode holds the raw transport return value
// (negative SDK error code) when error == BusIo, 0 otherwise.
struct BackpackResult {
    BackpackError error = BackpackError::None;
    int busCode = 0;

    bool ok() const { return error == BackpackError::None; }
    explicit operator bool() const { return ok(); }

    static BackpackResult success() { return {}; }
    static BackpackResult fail(BackpackError e, int code = 0) { return {e, code}; }
};

inline const char* backpackErrorName(BackpackError e) {
    switch (e) {
        case BackpackError::None:            return "ok";
        case BackpackError::InvalidPin:      return "invalid pin";
        case BackpackError::ReadUnsupported: return "read unsupported";
        case BackpackError::BusIo:           return "bus i/o";
        default:                             return "unknown";
    }
}
