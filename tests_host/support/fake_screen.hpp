#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

#include <Textmode/drivers/vga.hpp>

// Thrown by the host panic() hook so fatal paths can be asserted on
struct FakePanic : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Points phys_mem_map at a host array so the global writer lands there
// instead of vga::fb_pa. Must run before anything touches vga::get_writer().
void fake_screen_install();

// Blanks the screen and restores the default color, takes the console lock
void fake_screen_reset();

vga::Cell fake_screen_cell(size_t row, size_t col);

// Glyphs of one row of the global screen
std::string fake_screen_row(size_t row);

// Glyphs of one row of a row-major host cell array
std::string cells_row(const uint16_t* cells, size_t width, size_t row);
