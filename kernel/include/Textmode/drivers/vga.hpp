#pragma once

#include <Textmode/common.hpp>

#include <Textmode/misc/console.hpp>

namespace vga {
    constexpr uintptr_t fb_pa = 0xB8000;
    constexpr size_t screen_width = 80;
    constexpr size_t screen_height = 25;

    // Written in place of anything outside of printable ASCII, 0xFE is a small square in CP437
    constexpr uint8_t unprintable_glyph = 0xFE;

    enum class Color : uint8_t {
        Black = 0,
        Blue = 1,
        Green = 2,
        Cyan = 3,
        Red = 4,
        Magenta = 5,
        Brown = 6,
        LightGray = 7,
        DarkGray = 8,
        LightBlue = 9,
        LightGreen = 10,
        LightCyan = 11,
        LightRed = 12,
        Pink = 13,
        Yellow = 14,
        White = 15
    };

    struct ColorCode {
        constexpr ColorCode(): raw{0} {}
        constexpr ColorCode(Color foreground, Color background): raw{(uint8_t)(((uint8_t)background << 4) | (uint8_t)foreground)} {}

        constexpr Color foreground() const { return (Color)(raw & 0xF); }
        constexpr Color background() const { return (Color)((raw >> 4) & 0xF); }

        constexpr bool operator==(const ColorCode&) const = default;

        uint8_t raw;
    };
    static_assert(sizeof(ColorCode) == 1);

    constexpr ColorCode default_color{Color::Yellow, Color::Black};

    struct Cell {
        uint8_t glyph;
        ColorCode color;

        // Hardware word, glyph in the low byte
        constexpr uint16_t pack() const {
            return glyph | (color.raw << 8);
        }

        static constexpr Cell unpack(uint16_t v) {
            Cell cell{};
            cell.glyph = v & 0xFF;
            cell.color.raw = (v >> 8) & 0xFF;
            return cell;
        }

        constexpr bool operator==(const Cell&) const = default;
    };
    static_assert(sizeof(Cell) == 2);

    // Handle to a row-major array of cells owned by the hardware.
    // Every access is exactly one volatile 16-bit load or store, coordinates are not checked.
    struct Grid {
        Grid(uintptr_t base, size_t height, size_t width): cells{(volatile uint16_t*)base}, height{height}, width{width} {}

        Grid(Grid&& other): cells{other.cells}, height{other.height}, width{other.width} {
            other.cells = nullptr;
        }

        Grid(const Grid&) = delete;
        Grid& operator=(const Grid&) = delete;
        Grid& operator=(Grid&&) = delete;

        Cell read(size_t row, size_t col) const {
            return Cell::unpack(cells[row * width + col]);
        }

        void write(size_t row, size_t col, Cell cell) {
            cells[row * width + col] = cell.pack();
        }

        size_t get_height() const { return height; }
        size_t get_width() const { return width; }

        private:
        volatile uint16_t* cells;
        size_t height, width;
    };

    // Always writes to the last row, scrolls everything up on newline or when the row is full
    struct Writer final : public console::Logger {
        Writer(Grid&& grid, ColorCode color = default_color): column{0}, color{color}, grid{std::move(grid)} {}

        void putc(const char c);

        void write_byte(uint8_t byte);
        void write_string(const char* str);
        void write_string(const char* str, size_t len);

        void clear();

        void set_color(ColorCode c) { color = c; }
        ColorCode get_color() const { return color; }
        size_t get_column() const { return column; }

        private:
        void new_line();
        void clear_row(size_t row);

        size_t column;
        ColorCode color;
        Grid grid;
    };

    // Global writer at fb_pa, constructed on first use, caller must hold console::global_lock
    Writer& get_writer();
} // namespace vga
