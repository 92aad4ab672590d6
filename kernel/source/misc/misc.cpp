#include <Textmode/common.hpp>

uintptr_t phys_mem_map = 0;
