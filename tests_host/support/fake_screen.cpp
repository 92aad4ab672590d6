#include "support/fake_screen.hpp"

#include <Textmode/lib/mutex.hpp>
#include <Textmode/misc/console.hpp>

namespace {

uint16_t fake_screen[vga::screen_height * vga::screen_width];

}  // namespace

void fake_screen_install() {
  phys_mem_map = reinterpret_cast<uintptr_t>(fake_screen) - vga::fb_pa;
}

void fake_screen_reset() {
  lib::lock_guard guard{console::global_lock};

  auto& writer = vga::get_writer();
  writer.set_color(vga::default_color);
  writer.clear();
}

vga::Cell fake_screen_cell(size_t row, size_t col) {
  return vga::Cell::unpack(fake_screen[row * vga::screen_width + col]);
}

std::string fake_screen_row(size_t row) {
  return cells_row(fake_screen, vga::screen_width, row);
}

std::string cells_row(const uint16_t* cells, size_t width, size_t row) {
  std::string out;
  for (size_t col = 0; col < width; ++col) {
    out.push_back(static_cast<char>(vga::Cell::unpack(cells[row * width + col]).glyph));
  }
  return out;
}
