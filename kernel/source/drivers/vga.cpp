#include <Textmode/drivers/vga.hpp>

#include <Textmode/lib/utility.hpp>

static lib::lazy_initializer<vga::Writer> global_writer;

vga::Writer& vga::get_writer() {
    if(!global_writer)
        global_writer.init(Grid{fb_pa + phys_mem_map, screen_height, screen_width});

    return *global_writer;
}

void vga::Writer::putc(const char c) {
    auto byte = (uint8_t)c;
    if(byte == '\n' || (byte >= 0x20 && byte <= 0x7E))
        write_byte(byte);
    else
        write_byte(unprintable_glyph);
}

void vga::Writer::write_byte(uint8_t byte) {
    if(byte == '\n') {
        new_line();
        return;
    }

    if(column >= grid.get_width())
        new_line();

    grid.write(grid.get_height() - 1, column, Cell{byte, color});
    column++;
}

void vga::Writer::write_string(const char* str) {
    while(*str)
        putc(*str++);
}

void vga::Writer::write_string(const char* str, size_t len) {
    for(size_t i = 0; i < len; i++)
        putc(str[i]);
}

void vga::Writer::clear() {
    for(size_t row = 0; row < grid.get_height(); row++)
        clear_row(row);

    column = 0;
}

void vga::Writer::new_line() {
    // Ascending, row r has to be read before row r + 1 is copied over it
    for(size_t row = 1; row < grid.get_height(); row++)
        for(size_t col = 0; col < grid.get_width(); col++)
            grid.write(row - 1, col, grid.read(row, col));

    clear_row(grid.get_height() - 1);
    column = 0;
}

void vga::Writer::clear_row(size_t row) {
    const Cell blank{' ', color};

    for(size_t col = 0; col < grid.get_width(); col++)
        grid.write(row, col, blank);
}
