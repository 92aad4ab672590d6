#include <Textmode/drivers/vga.hpp>

#include <cstdint>

#include "gtest/gtest.h"

namespace {

TEST(ColorCodeTest, PacksBackgroundHighAndForegroundLowForAllPairs) {
  for (uint8_t f = 0; f < 16; ++f) {
    for (uint8_t b = 0; b < 16; ++b) {
      const auto fg = static_cast<vga::Color>(f);
      const auto bg = static_cast<vga::Color>(b);
      const vga::ColorCode code{fg, bg};

      EXPECT_EQ(static_cast<uint8_t>((b << 4) | f), code.raw);
      EXPECT_EQ(f, code.raw & 0xF);
      EXPECT_EQ(b, code.raw >> 4);
      EXPECT_EQ(fg, code.foreground());
      EXPECT_EQ(bg, code.background());
    }
  }
}

TEST(ColorCodeTest, NamedColorsHaveHardwareCodes) {
  EXPECT_EQ(0, static_cast<int>(vga::Color::Black));
  EXPECT_EQ(7, static_cast<int>(vga::Color::LightGray));
  EXPECT_EQ(11, static_cast<int>(vga::Color::LightCyan));
  EXPECT_EQ(14, static_cast<int>(vga::Color::Yellow));
  EXPECT_EQ(15, static_cast<int>(vga::Color::White));
}

TEST(ColorCodeTest, DefaultIsYellowOnBlack) {
  EXPECT_EQ(0x0E, vga::default_color.raw);
}

TEST(CellTest, PackedWordHasGlyphInLowByte) {
  const vga::Cell cell{'A', vga::ColorCode{vga::Color::White, vga::Color::Blue}};

  EXPECT_EQ(0x1F41, cell.pack());
  EXPECT_EQ(cell, vga::Cell::unpack(0x1F41));
}

TEST(CellTest, GridStoresGlyphByteThenAttributeByte) {
  uint16_t storage[2 * 3] = {};
  vga::Grid grid{reinterpret_cast<uintptr_t>(storage), 2, 3};

  grid.write(1, 2, vga::Cell{'Z', vga::ColorCode{vga::Color::LightGreen, vga::Color::Red}});

  const auto* bytes = reinterpret_cast<const uint8_t*>(storage);
  // Row-major, two bytes per cell, no padding
  const size_t offset = (1 * 3 + 2) * 2;
  EXPECT_EQ('Z', bytes[offset]);
  EXPECT_EQ(0x4A, bytes[offset + 1]);
  EXPECT_EQ('Z', grid.read(1, 2).glyph);
  EXPECT_EQ(0, grid.read(0, 0).glyph);
}

}  // namespace
