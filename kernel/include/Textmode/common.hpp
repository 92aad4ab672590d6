#pragma once

#include <stdint.h>
#include <stddef.h>

#include <Textmode/misc/misc.hpp>

#define PANIC(msg) panic(__FILE__, __PRETTY_FUNCTION__, __LINE__, msg)

#define ASSERT(expr) do { \
        if(!(expr)) \
            PANIC("Assertion " #expr " Failed"); \
    } while(0)

// Offset at which physical memory is visible, 0 when identity mapped
extern uintptr_t phys_mem_map;
