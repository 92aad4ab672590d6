#include <Textmode/common.hpp>

#include <Textmode/misc/console.hpp>

void panic([[maybe_unused]] const char* file, [[maybe_unused]] const char* func, [[maybe_unused]] size_t line, [[maybe_unused]] const char* msg){
    // No printing here, the console lock might be held by whoever panicked
    asm volatile("cli");

    while(1)
        asm volatile("hlt");
}

extern "C" [[noreturn]] void _start() {
    println("Hello World{}", '!');

    while(1)
        asm volatile("hlt");
}
