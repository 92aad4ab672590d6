#pragma once

#include <stdint.h>
#include <stddef.h>

// Provided by the environment, must not return and must not print
[[noreturn]]
void panic(const char* file, const char* func, size_t line, const char* msg);
