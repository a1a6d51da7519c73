#include <gtest/gtest.h>
#include <cstring>
#include "BackpackPins.hpp"

TEST(BackpackPins, DefaultLayoutMatchesCommonBoard) {
    BackpackPins pins;
    EXPECT_EQ(pins.rsPin(), 0);
    EXPECT_EQ(pins.rwPin(), 1);
    EXPECT_EQ(pins.enPin(), 2);
    EXPECT_EQ(pins.backlightPin(), 3);
    EXPECT_EQ(pins.d4Pin(), 4);
    EXPECT_EQ(pins.d5Pin(), 5);
    EXPECT_EQ(pins.d6Pin(), 6);
    EXPECT_EQ(pins.d7Pin(), 7);
    EXPECT_TRUE(pins.canRead());
    EXPECT_FALSE(pins.overlaps());
}

TEST(BackpackPinConfig, OverridesEachRole) {
    BackpackPins pins;
    BackpackResult r = BackpackPinConfig()
                           .rs(7).rw(6).en(5).backlight(4)
                           .d4(3).d5(2).d6(1).d7(0)
                           .build(pins);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(pins.rsPin(), 7);
    EXPECT_EQ(pins.rwPin(), 6);
    EXPECT_EQ(pins.enPin(), 5);
    EXPECT_EQ(pins.backlightPin(), 4);
    EXPECT_EQ(pins.d4Pin(), 3);
    EXPECT_EQ(pins.d5Pin(), 2);
    EXPECT_EQ(pins.d6Pin(), 1);
    EXPECT_EQ(pins.d7Pin(), 0);
}

TEST(BackpackPinConfig, RwNoneDisablesReading) {
    BackpackPins pins;
    ASSERT_TRUE(BackpackPinConfig().rw(std::nullopt).build(pins).ok());
    EXPECT_FALSE(pins.canRead());
    EXPECT_EQ(pins.rwPin(), BackpackPins::RW_NONE);
}

TEST(BackpackPinConfig, RwCanBeReassignedAfterNone) {
    BackpackPins pins;
    ASSERT_TRUE(BackpackPinConfig().rw(std::nullopt).rw(5).build(pins).ok());
    EXPECT_TRUE(pins.canRead());
    EXPECT_EQ(pins.rwPin(), 5);
}

TEST(BackpackPinConfig, OutOfRangePinIsReportedAtSetter) {
    using Setter = BackpackPinConfig& (BackpackPinConfig::*)(uint8_t);
    const Setter setters[] = {
        &BackpackPinConfig::rs, &BackpackPinConfig::en, &BackpackPinConfig::backlight,
        &BackpackPinConfig::d4, &BackpackPinConfig::d5, &BackpackPinConfig::d6,
        &BackpackPinConfig::d7,
    };
    for (Setter set : setters) {
        for (uint8_t bad : {uint8_t(8), uint8_t(9), uint8_t(0x7F), uint8_t(0xFF)}) {
            BackpackPinConfig cfg;
            (cfg.*set)(bad);
            EXPECT_EQ(cfg.error(), BackpackError::InvalidPin) << "pin " << int(bad);
            EXPECT_FALSE(cfg.ok());
        }
    }

    BackpackPinConfig cfg;
    cfg.rw(8);
    EXPECT_EQ(cfg.error(), BackpackError::InvalidPin);
}

TEST(BackpackPinConfig, BuildFailsAndLeavesTableUntouched) {
    BackpackPins pins;
    BackpackResult r = BackpackPinConfig().rs(6).d7(8).en(1).build(pins);
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.error, BackpackError::InvalidPin);
    EXPECT_EQ(pins.rsPin(), 0);
    EXPECT_EQ(pins.enPin(), 2);
    EXPECT_EQ(pins.d7Pin(), 7);
}

TEST(BackpackPinConfig, ErrorIsSticky) {
    BackpackPinConfig cfg;
    cfg.d4(12);
    cfg.d4(4);
    EXPECT_EQ(cfg.error(), BackpackError::InvalidPin);
}

TEST(BackpackPinConfig, PinSevenIsAccepted) {
    BackpackPins pins;
    ASSERT_TRUE(BackpackPinConfig().rs(7).d7(0).build(pins).ok());
    EXPECT_EQ(pins.rsPin(), 7);
}

TEST(BackpackPins, OverlapIsAcceptedButReported) {
    BackpackPins pins;
    ASSERT_TRUE(BackpackPinConfig().backlight(7).build(pins).ok());
    EXPECT_TRUE(pins.overlaps());

    ASSERT_TRUE(BackpackPinConfig().rw(std::nullopt).backlight(1).build(pins).ok());
    EXPECT_FALSE(pins.overlaps());
}

TEST(BackpackPins, NibbleEncodeKeepsOtherBits) {
    BackpackPins pins;
    EXPECT_EQ(pins.encodeNibble(0x0F, 0x0A), 0xAF);
    EXPECT_EQ(pins.encodeNibble(0xFF, 0x00), 0x0F);
    EXPECT_EQ(pins.encodeNibble(0x00, 0xF5), 0x50); // upper input bits ignored
}

TEST(BackpackPins, NibbleDecodeUsesCustomLayout) {
    BackpackPins pins;
    ASSERT_TRUE(BackpackPinConfig().d4(3).d5(2).d6(1).d7(0).build(pins).ok());
    // bits 0..3 carry D7..D4
    EXPECT_EQ(pins.decodeNibble(0b00000001), 0b1000);
    EXPECT_EQ(pins.decodeNibble(0b00001000), 0b0001);
    EXPECT_EQ(pins.decodeNibble(0b11110110), 0b0110);
}

TEST(BackpackPins, FormatDescribesTable) {
    char buf[64];
    BackpackPins pins;
    pins.format(buf, sizeof(buf));
    EXPECT_STREQ(buf, "rs=0 rw=1 en=2 bl=3 d4..d7=4,5,6,7");

    ASSERT_TRUE(BackpackPinConfig().rw(std::nullopt).build(pins).ok());
    pins.format(buf, sizeof(buf));
    EXPECT_STREQ(buf, "rs=0 rw=- en=2 bl=3 d4..d7=4,5,6,7");
}

TEST(BackpackError, NamesArePrintable) {
    EXPECT_STREQ(backpackErrorName(BackpackError::None), "ok");
    EXPECT_STREQ(backpackErrorName(BackpackError::InvalidPin), "invalid pin");
    EXPECT_STREQ(backpackErrorName(BackpackError::ReadUnsupported), "read unsupported");
    EXPECT_STREQ(backpackErrorName(BackpackError::BusIo), "bus i/o");
}
