#include <Textmode/common.hpp>

#include <string>

#include "support/fake_screen.hpp"

void panic(const char* file, const char* func, size_t line, const char* msg) {
  (void)func;
  throw FakePanic(std::string(file) + ":" + std::to_string(line) + ": " + msg);
}
