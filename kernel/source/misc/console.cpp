#include <Textmode/misc/console.hpp>

#include <Textmode/drivers/vga.hpp>

console::Lock console::global_lock;

console::Logger& console::get_logger() {
    return vga::get_writer();
}
